#pragma once

#include <cstddef>
#include <string>
#include <rapidjson/document.h>
#include "BootstrapTypes.h"
#include "CscvOverfitting.h"
#include "StatUtils.h"
#include "ValidatorConfiguration.h"

namespace oosvalidator
{
    // One walk-forward fold of the breakout system
    struct FoldRecord
    {
        std::size_t trainStart;
        std::size_t testStart;
        std::size_t testLength;
        std::size_t lookback;
        double      threshold;
        double      criterion;
        std::size_t numReturns;
    };

    // Training-bias experiment averaged over replications
    struct BiasSummary
    {
        std::size_t replications = 0;
        double      meanInSample = 0.0;
        double      meanOutOfSample = 0.0;
        double      meanBias = 0.0;
        double      biasStdError = 0.0;
    };

    /**
     * @brief JSON summary of a driver run, written with rapidjson.
     *
     * Sections are added as the modes finish; a mode that did not run is
     * absent from the document.
     */
    class ValidationReport
    {
    public:
        explicit ValidationReport(const ValidatorConfiguration& config);

        void addBootstrapResult(const std::string& label,
                                double scale,
                                const ReturnSummary& summary,
                                const BootstrapReport& bootstrap);

        void addWalkForwardFold(const FoldRecord& fold);

        void setCscvResult(std::size_t numSystems,
                           std::size_t numCases,
                           std::size_t numBlocks,
                           Criterion criterion,
                           const CscvResult& result);

        void setBiasResult(const BiasSummary& summary);

        std::string toJson() const;

        /**
         * @throws std::runtime_error if the file cannot be written
         */
        void writeToFile(const std::string& path) const;

    private:
        rapidjson::Value& section(const char* name, rapidjson::Type type);

    private:
        rapidjson::Document mDocument;
    };
}
