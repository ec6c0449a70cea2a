#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <boost/program_options/options_description.hpp>
#include "PerformanceCriteria.h"
#include "ValidationException.h"

namespace oosvalidator
{
    enum class RunMode
    {
        Bootstrap,
        WalkForward,
        Cscv,
        Bias,
        All
    };

    std::string runModeName(RunMode mode);
    RunMode runModeFromString(const std::string& name);

    /**
     * @brief Settings for one run of the validator driver.
     *
     * Everything runs on a synthetic log-price series generated from seed, so
     * a configuration fully determines the output.
     */
    class ValidatorConfiguration
    {
    public:
        ValidatorConfiguration();

        RunMode getMode() const { return mMode; }
        std::uint64_t getSeed() const { return mSeed; }
        std::size_t getNumBootstraps() const { return mNumBootstraps; }
        std::size_t getNumThreads() const { return mNumThreads; }
        std::size_t getNumPrices() const { return mNumPrices; }
        double getTrend() const { return mTrend; }
        std::size_t getMaxLookback() const { return mMaxLookback; }
        std::size_t getTrainLength() const { return mTrainLength; }
        std::size_t getTestLength() const { return mTestLength; }
        std::size_t getNumBlocks() const { return mNumBlocks; }
        Criterion getCriterion() const { return mCriterion; }
        std::size_t getNumReplications() const { return mNumReplications; }
        std::size_t getNumRandomTrials() const { return mNumRandomTrials; }
        const std::string& getLogFile() const { return mLogFile; }
        const std::string& getJsonFile() const { return mJsonFile; }

        bool runs(RunMode mode) const
        {
            return mMode == RunMode::All || mMode == mode;
        }

        void setMode(RunMode mode) { mMode = mode; }
        void setSeed(std::uint64_t seed) { mSeed = seed; }
        void setNumBootstraps(std::size_t n) { mNumBootstraps = n; }
        void setNumThreads(std::size_t n) { mNumThreads = n; }
        void setNumPrices(std::size_t n) { mNumPrices = n; }
        void setTrend(double trend) { mTrend = trend; }
        void setMaxLookback(std::size_t n) { mMaxLookback = n; }
        void setTrainLength(std::size_t n) { mTrainLength = n; }
        void setTestLength(std::size_t n) { mTestLength = n; }
        void setNumBlocks(std::size_t n) { mNumBlocks = n; }
        void setCriterion(Criterion c) { mCriterion = c; }
        void setNumReplications(std::size_t n) { mNumReplications = n; }
        void setNumRandomTrials(std::size_t n) { mNumRandomTrials = n; }
        void setLogFile(const std::string& path) { mLogFile = path; }
        void setJsonFile(const std::string& path) { mJsonFile = path; }

        /**
         * @brief Check the settings the selected modes depend on.
         * @throws ConfigurationException describing the first bad setting
         */
        void validate() const;

    private:
        RunMode       mMode;
        std::uint64_t mSeed;
        std::size_t   mNumBootstraps;
        std::size_t   mNumThreads;       // 0 runs everything on the calling thread
        std::size_t   mNumPrices;
        double        mTrend;
        std::size_t   mMaxLookback;
        std::size_t   mTrainLength;
        std::size_t   mTestLength;
        std::size_t   mNumBlocks;
        Criterion     mCriterion;
        std::size_t   mNumReplications;
        std::size_t   mNumRandomTrials;
        std::string   mLogFile;
        std::string   mJsonFile;
    };

    /**
     * @brief Builds a ValidatorConfiguration from the command line and an
     * optional INI-style file named by --config.
     *
     * Command-line values take precedence over the file.
     */
    class ValidatorConfigurationReader
    {
    public:
        ValidatorConfigurationReader();

        /**
         * @return the validated configuration, or an empty optional when
         * --help was given (the usage text is written to helpOut)
         * @throws ConfigurationException on unknown or invalid options
         */
        std::optional<ValidatorConfiguration> parse(int argc, const char* const argv[],
                                                    std::ostream& helpOut) const;

        const boost::program_options::options_description& options() const
        {
            return mOptions;
        }

    private:
        boost::program_options::options_description mOptions;
    };
}
