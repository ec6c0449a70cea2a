#include "ValidationReport.h"
#include <fstream>
#include <stdexcept>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>

using namespace rapidjson;

namespace oosvalidator
{
    namespace
    {
        Value boundsValue(const ConfidenceBounds& b, Document::AllocatorType& allocator)
        {
            Value obj(kObjectType);
            obj.AddMember("lower2p5", b.lower2p5, allocator);
            obj.AddMember("upper2p5", b.upper2p5, allocator);
            obj.AddMember("lower5", b.lower5, allocator);
            obj.AddMember("upper5", b.upper5, allocator);
            obj.AddMember("lower10", b.lower10, allocator);
            obj.AddMember("upper10", b.upper10, allocator);
            return obj;
        }
    }

    ValidationReport::ValidationReport(const ValidatorConfiguration& config)
        : mDocument()
    {
        mDocument.SetObject();
        Document::AllocatorType& allocator = mDocument.GetAllocator();

        Value run(kObjectType);
        run.AddMember("mode", Value(runModeName(config.getMode()).c_str(), allocator), allocator);
        run.AddMember("seed", static_cast<uint64_t>(config.getSeed()), allocator);
        run.AddMember("nprices", static_cast<uint64_t>(config.getNumPrices()), allocator);
        run.AddMember("trend", config.getTrend(), allocator);
        run.AddMember("maxLookback", static_cast<uint64_t>(config.getMaxLookback()), allocator);
        run.AddMember("nboot", static_cast<uint64_t>(config.getNumBootstraps()), allocator);
        run.AddMember("threads", static_cast<uint64_t>(config.getNumThreads()), allocator);
        mDocument.AddMember("run", run, allocator);
    }

    Value& ValidationReport::section(const char* name, Type type)
    {
        if (!mDocument.HasMember(name))
            mDocument.AddMember(StringRef(name), Value(type), mDocument.GetAllocator());

        return mDocument[name];
    }

    void ValidationReport::addBootstrapResult(const std::string& label,
                                              double scale,
                                              const ReturnSummary& summary,
                                              const BootstrapReport& bootstrap)
    {
        Document::AllocatorType& allocator = mDocument.GetAllocator();

        Value entry(kObjectType);
        entry.AddMember("returns", Value(label.c_str(), allocator), allocator);
        entry.AddMember("scale", scale, allocator);
        entry.AddMember("count", static_cast<uint64_t>(summary.count), allocator);
        entry.AddMember("mean", summary.mean, allocator);
        entry.AddMember("stdDev", summary.stdDev, allocator);
        entry.AddMember("t", summary.tStatistic, allocator);
        entry.AddMember("p", summary.pValue, allocator);
        entry.AddMember("tLower90", summary.tLowerBound90, allocator);
        entry.AddMember("nboot", static_cast<uint64_t>(bootstrap.nboot), allocator);
        entry.AddMember("z0", bootstrap.z0, allocator);
        entry.AddMember("acceleration", bootstrap.acceleration, allocator);
        entry.AddMember("percentile", boundsValue(bootstrap.percentile, allocator), allocator);
        entry.AddMember("pivot", boundsValue(bootstrap.pivot, allocator), allocator);
        entry.AddMember("bca", boundsValue(bootstrap.bca, allocator), allocator);

        section("bootstrap", kArrayType).PushBack(entry, allocator);
    }

    void ValidationReport::addWalkForwardFold(const FoldRecord& fold)
    {
        Document::AllocatorType& allocator = mDocument.GetAllocator();

        Value entry(kObjectType);
        entry.AddMember("trainStart", static_cast<uint64_t>(fold.trainStart), allocator);
        entry.AddMember("testStart", static_cast<uint64_t>(fold.testStart), allocator);
        entry.AddMember("testLength", static_cast<uint64_t>(fold.testLength), allocator);
        entry.AddMember("lookback", static_cast<uint64_t>(fold.lookback), allocator);
        entry.AddMember("threshold", fold.threshold, allocator);
        entry.AddMember("criterion", fold.criterion, allocator);
        entry.AddMember("returns", static_cast<uint64_t>(fold.numReturns), allocator);

        section("walkforward", kArrayType).PushBack(entry, allocator);
    }

    void ValidationReport::setCscvResult(std::size_t numSystems,
                                         std::size_t numCases,
                                         std::size_t numBlocks,
                                         Criterion criterion,
                                         const CscvResult& result)
    {
        Document::AllocatorType& allocator = mDocument.GetAllocator();

        Value& cscv = section("cscv", kObjectType);
        cscv.RemoveAllMembers();
        cscv.AddMember("systems", static_cast<uint64_t>(numSystems), allocator);
        cscv.AddMember("cases", static_cast<uint64_t>(numCases), allocator);
        cscv.AddMember("blocks", static_cast<uint64_t>(numBlocks), allocator);
        cscv.AddMember("criterion", Value(criterionName(criterion).c_str(), allocator), allocator);
        cscv.AddMember("combinations", static_cast<uint64_t>(result.combinations), allocator);
        cscv.AddMember("votes", static_cast<uint64_t>(result.votes), allocator);
        cscv.AddMember("probability", result.probability, allocator);
    }

    void ValidationReport::setBiasResult(const BiasSummary& summary)
    {
        Document::AllocatorType& allocator = mDocument.GetAllocator();

        Value& bias = section("bias", kObjectType);
        bias.RemoveAllMembers();
        bias.AddMember("replications", static_cast<uint64_t>(summary.replications), allocator);
        bias.AddMember("inSample", summary.meanInSample, allocator);
        bias.AddMember("outOfSample", summary.meanOutOfSample, allocator);
        bias.AddMember("bias", summary.meanBias, allocator);
        bias.AddMember("biasStdError", summary.biasStdError, allocator);
    }

    std::string ValidationReport::toJson() const
    {
        StringBuffer buffer;
        PrettyWriter<StringBuffer> writer(buffer);
        if (!mDocument.Accept(writer))
            throw std::runtime_error("ValidationReport: report holds a non-finite number");

        return buffer.GetString();
    }

    void ValidationReport::writeToFile(const std::string& path) const
    {
        std::ofstream file(path);
        if (!file.is_open())
            throw std::runtime_error("Cannot open JSON report file for writing: " + path);

        file << toJson() << std::endl;
        if (!file)
            throw std::runtime_error("Error writing JSON report file: " + path);
    }
}
