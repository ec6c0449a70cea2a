#include "ValidatorConfiguration.h"
#include <fstream>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace po = boost::program_options;

namespace oosvalidator
{
    std::string runModeName(RunMode mode)
    {
        switch (mode)
        {
        case RunMode::Bootstrap:
            return "bootstrap";
        case RunMode::WalkForward:
            return "walkforward";
        case RunMode::Cscv:
            return "cscv";
        case RunMode::Bias:
            return "bias";
        case RunMode::All:
            return "all";
        }
        return "unknown";
    }

    RunMode runModeFromString(const std::string& name)
    {
        const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));

        if (key == "bootstrap")
            return RunMode::Bootstrap;
        if (key == "walkforward" || key == "walk-forward")
            return RunMode::WalkForward;
        if (key == "cscv")
            return RunMode::Cscv;
        if (key == "bias")
            return RunMode::Bias;
        if (key == "all")
            return RunMode::All;

        throw ConfigurationException("Unknown mode '" + name +
                                     "' (expected bootstrap, walkforward, cscv, bias or all)");
    }

    ValidatorConfiguration::ValidatorConfiguration()
        : mMode(RunMode::All),
          mSeed(123456789),
          mNumBootstraps(2000),
          mNumThreads(0),
          mNumPrices(2000),
          mTrend(0.02),
          mMaxLookback(20),
          mTrainLength(250),
          mTestLength(50),
          mNumBlocks(10),
          mCriterion(Criterion::MeanReturn),
          mNumReplications(10),
          mNumRandomTrials(100),
          mLogFile("oosvalidator.log"),
          mJsonFile()
    {
    }

    void ValidatorConfiguration::validate() const
    {
        if (mNumPrices < 2)
            throw ConfigurationException("nprices must be at least 2");
        if (mMaxLookback < 2)
            throw ConfigurationException("max-lookback must be at least 2");

        if (runs(RunMode::Bootstrap) && mNumBootstraps < 10)
            throw ConfigurationException("nboot must be at least 10, got " + std::to_string(mNumBootstraps));

        if (runs(RunMode::Bootstrap) || runs(RunMode::WalkForward))
        {
            if (mTrainLength < mMaxLookback + 10)
                throw ConfigurationException("n-train must be at least 10 greater than max-lookback");
            if (mTestLength == 0)
                throw ConfigurationException("n-test must be at least 1");
            if (mTrainLength + mTestLength > mNumPrices)
                throw ConfigurationException("n-train + n-test must not exceed nprices");
        }

        if (runs(RunMode::Cscv))
        {
            if (mNumBlocks < 2)
                throw ConfigurationException("n-blocks must be at least 2");
            if (mNumPrices <= mMaxLookback || mNumPrices - mMaxLookback < mNumBlocks)
                throw ConfigurationException("nprices - max-lookback must be at least n-blocks");
        }

        if (runs(RunMode::Bias))
        {
            if (mNumReplications == 0)
                throw ConfigurationException("nreps must be at least 1");
            if (mNumRandomTrials == 0)
                throw ConfigurationException("n-random-trials must be at least 1");
            if (mNumPrices < mMaxLookback + 2)
                throw ConfigurationException("nprices must exceed max-lookback by at least 2");
        }
    }

    namespace
    {
        std::size_t nonNegative(const po::variables_map& vm, const char* name)
        {
            const long long v = vm[name].as<long long>();
            if (v < 0)
                throw ConfigurationException(std::string(name) + " must not be negative");
            return static_cast<std::size_t>(v);
        }
    }

    ValidatorConfigurationReader::ValidatorConfigurationReader()
        : mOptions("oosvalidator options")
    {
        const ValidatorConfiguration defaults;

        mOptions.add_options()
            ("help,h", "Show this help message")
            ("config,c", po::value<std::string>(), "INI-style file with any of the options below")
            ("mode,m", po::value<std::string>()->default_value(runModeName(defaults.getMode())),
             "bootstrap, walkforward, cscv, bias or all")
            ("seed", po::value<std::uint64_t>()->default_value(defaults.getSeed()), "Random seed")
            ("nboot", po::value<long long>()->default_value(static_cast<long long>(defaults.getNumBootstraps())),
             "Bootstrap replications (at least 10)")
            ("threads", po::value<long long>()->default_value(0),
             "Worker threads for bootstrap and CSCV; 0 runs on the calling thread")
            ("nprices", po::value<long long>()->default_value(static_cast<long long>(defaults.getNumPrices())),
             "Length of the synthetic log-price series")
            ("trend", po::value<double>()->default_value(defaults.getTrend()),
             "Per-bar drift of the synthetic series; 0 for no exploitable trend")
            ("max-lookback", po::value<long long>()->default_value(static_cast<long long>(defaults.getMaxLookback())),
             "Largest moving-average lookback searched")
            ("n-train", po::value<long long>()->default_value(static_cast<long long>(defaults.getTrainLength())),
             "Walk-forward training bars")
            ("n-test", po::value<long long>()->default_value(static_cast<long long>(defaults.getTestLength())),
             "Walk-forward test bars")
            ("n-blocks", po::value<long long>()->default_value(static_cast<long long>(defaults.getNumBlocks())),
             "CSCV blocks (odd values are reduced by one)")
            ("criterion", po::value<std::string>()->default_value(criterionName(defaults.getCriterion())),
             "CSCV criterion: mean, pf or sharpe")
            ("nreps", po::value<long long>()->default_value(static_cast<long long>(defaults.getNumReplications())),
             "Replications of the training-bias experiment")
            ("n-random-trials", po::value<long long>()->default_value(static_cast<long long>(defaults.getNumRandomTrials())),
             "Random candidates per training-bias replication")
            ("log-file", po::value<std::string>()->default_value(defaults.getLogFile()),
             "File that receives a copy of the console output")
            ("json", po::value<std::string>(), "Write a JSON summary to this file");
    }

    std::optional<ValidatorConfiguration>
    ValidatorConfigurationReader::parse(int argc, const char* const argv[], std::ostream& helpOut) const
    {
        po::variables_map vm;

        try
        {
            po::store(po::parse_command_line(argc, argv, mOptions), vm);

            if (vm.count("help"))
            {
                helpOut << "Out-of-sample validation of trading-system performance estimates\n\n"
                        << "Usage: oosvalidator [options]\n\n"
                        << mOptions << std::endl;
                return std::nullopt;
            }

            if (vm.count("config"))
            {
                const std::string path = vm["config"].as<std::string>();
                std::ifstream file(path);
                if (!file)
                    throw ConfigurationException("Cannot open configuration file " + path);

                po::store(po::parse_config_file(file, mOptions), vm);
            }

            po::notify(vm);
        }
        catch (const po::error& e)
        {
            throw ConfigurationException(std::string("Command line: ") + e.what());
        }

        ValidatorConfiguration config;
        config.setMode(runModeFromString(vm["mode"].as<std::string>()));
        config.setSeed(vm["seed"].as<std::uint64_t>());
        config.setNumBootstraps(nonNegative(vm, "nboot"));
        config.setNumThreads(nonNegative(vm, "threads"));
        config.setNumPrices(nonNegative(vm, "nprices"));
        config.setTrend(vm["trend"].as<double>());
        config.setMaxLookback(nonNegative(vm, "max-lookback"));
        config.setTrainLength(nonNegative(vm, "n-train"));
        config.setTestLength(nonNegative(vm, "n-test"));
        config.setNumBlocks(nonNegative(vm, "n-blocks"));
        config.setCriterion(criterionFromString(vm["criterion"].as<std::string>()));
        config.setNumReplications(nonNegative(vm, "nreps"));
        config.setNumRandomTrials(nonNegative(vm, "n-random-trials"));
        config.setLogFile(vm["log-file"].as<std::string>());
        if (vm.count("json"))
            config.setJsonFile(vm["json"].as<std::string>());

        config.validate();
        return config;
    }
}
