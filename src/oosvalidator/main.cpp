#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ValidatorConfiguration.h"
#include "ValidationReport.h"
#include "OutputUtils.h"

#include "BootstrapConfidence.h"
#include "CscvOverfitting.h"
#include "StochasticBias.h"
#include "StatUtils.h"
#include "RngUtils.h"
#include "ParallelExecutors.h"

#include "WalkForwardHarness.h"
#include "MovingAverageBreakout.h"
#include "MovingAverageCrossover.h"
#include "SyntheticSeries.h"

using namespace oosvalidator;
using namespace oosvalidator::systems;
using oosvalidator::rng_utils::UniformRng;
using oosvalidator::utils::TeeStream;
using oosvalidator::utils::formatBounds;
using oosvalidator::utils::formatScaled;

namespace
{
    // Display scales of the bound-the-mean report
    constexpr double kBarReturnScale = 25200.0;
    constexpr double kTradeReturnScale = 1000.0;
    constexpr std::size_t kCrunchGroupSize = 10;

    struct ReturnStream
    {
        std::string         label;
        double              scale;
        std::vector<double> returns;
        ReturnSummary       summary;
        BootstrapReport     bootstrap;
    };

    /**
     * @brief Independent seeds for each part of a run.
     *
     * They are drawn in a fixed order from the configured seed, so the price
     * series and the bootstrap stream are the same whichever modes run.
     */
    struct RunSeeds
    {
        explicit RunSeeds(std::uint64_t seed)
        {
            UniformRng<> master(seed);
            prices = master.nextSeed();
            bootstrap = master.nextSeed();
            bias = master.nextSeed();
        }

        std::uint64_t prices;
        std::uint64_t bootstrap;
        std::uint64_t bias;
    };

    void printReturnSummary(std::ostream& out, const ReturnStream& stream)
    {
        const ReturnSummary& s = stream.summary;
        out << "OOS mean return per " << stream.label << " (times " << stream.scale << ") = "
            << std::fixed << std::setprecision(5) << stream.scale * s.mean << "\n"
            << "  StdDev = " << stream.scale * s.stdDev
            << "  t = " << std::setprecision(2) << s.tStatistic
            << "  p = " << std::setprecision(4) << s.pValue
            << "  lower = " << std::setprecision(5) << stream.scale * s.tLowerBound90
            << "  nret=" << s.count << std::endl;
    }

    WalkForwardReturnSet<BreakoutParams>
    walkForwardBreakout(const ValidatorConfiguration& config,
                        const std::vector<double>& prices,
                        std::ostream& out)
    {
        const MovingAverageBreakout system(config.getMaxLookback());
        const MovingAverageBreakout::Harness harness(config.getTrainLength(), config.getTestLength());

        out << "\nWalk-forward: " << harness.planFolds(prices.size()).size() << " folds, n_train="
            << config.getTrainLength() << "  n_test=" << config.getTestLength()
            << "  max_lookback=" << config.getMaxLookback() << std::endl;

        return harness.runAllReturnTypes(prices, system.trainer(), system.evaluator());
    }

    void reportFolds(const WalkForwardReturnSet<BreakoutParams>& set,
                     std::ostream& out,
                     ValidationReport& report)
    {
        out << "\n   IS start  Lookback  Thresh      Crit   OOS start  Bars  Open  Trades" << std::endl;

        for (std::size_t i = 0; i < set.allBars.numFolds(); ++i)
        {
            const auto& fold = set.allBars.folds[i];
            const std::size_t nOpen = set.openPosition.folds[i].returns.size();
            const std::size_t nTrades = set.completedTrades.folds[i].returns.size();

            out << std::setw(11) << fold.trainStart
                << std::setw(10) << fold.params.lookback
                << std::setw(8) << std::fixed << std::setprecision(3) << fold.params.threshold
                << std::setw(10) << std::setprecision(5) << fold.criterion
                << std::setw(12) << fold.testStart
                << std::setw(6) << fold.testLength
                << std::setw(6) << nOpen
                << std::setw(8) << nTrades << std::endl;

            report.addWalkForwardFold(FoldRecord{fold.trainStart, fold.testStart, fold.testLength,
                                                 fold.params.lookback, fold.params.threshold,
                                                 fold.criterion, fold.returns.size()});
        }

        const ReturnSummary pooled = summarizeReturns(set.allBars.pooledReturns);
        out << "Pooled OOS bar returns: n=" << pooled.count
            << "  mean (times " << kBarReturnScale << ")=" << formatScaled(pooled.mean, kBarReturnScale)
            << "  t=" << std::setprecision(2) << pooled.tStatistic << std::endl;
    }

    template <class Executor>
    void boundTheMean(const ValidatorConfiguration& config,
                      const WalkForwardReturnSet<BreakoutParams>& set,
                      std::shared_ptr<Executor> executor,
                      const RunSeeds& seeds,
                      std::ostream& out,
                      ValidationReport& report)
    {
        std::vector<ReturnStream> streams;
        streams.push_back(ReturnStream{"Open posn", kBarReturnScale, set.openPosition.pooledReturns, {}, {}});
        streams.push_back(ReturnStream{"Complete", kTradeReturnScale, set.completedTrades.pooledReturns, {}, {}});
        streams.push_back(ReturnStream{"Grouped", kBarReturnScale,
                                       crunchReturns(set.allBars.pooledReturns, kCrunchGroupSize), {}, {}});

        out << "\nnprices=" << config.getNumPrices() << "  max_lookback=" << config.getMaxLookback()
            << "  n_train=" << config.getTrainLength() << "  n_test=" << config.getTestLength() << "\n" << std::endl;

        bool enoughReturns = true;
        for (auto& stream : streams)
        {
            stream.summary = summarizeReturns(stream.returns);
            printReturnSummary(out, stream);
            if (stream.returns.size() < 2)
                enoughReturns = false;
        }

        if (!enoughReturns)
        {
            out << "\nBootstraps skipped due to too few returns" << std::endl;
            return;
        }

        const BootstrapConfidence<Executor> engine(config.getNumBootstraps(), executor);
        const StatisticFn mean = makeCriterion(Criterion::MeanReturn);
        UniformRng<> rng(seeds.bootstrap);

        for (std::size_t i = 0; i < streams.size(); ++i)
        {
            out << "Doing bootstrap " << i + 1 << " of " << streams.size() << "..." << std::endl;
            streams[i].bootstrap = engine.computeAll(streams[i].returns, mean, rng);
            report.addBootstrapResult(streams[i].label, streams[i].scale, streams[i].summary, streams[i].bootstrap);
        }

        out << "\n90 percent lower confidence bounds\n"
            << "                 Open posn    Complete     Grouped" << std::endl;

        out << "Student's t  ";
        for (const auto& s : streams)
            out << formatScaled(s.summary.tLowerBound90, s.scale) << "  ";
        out << "\nPercentile   ";
        for (const auto& s : streams)
            out << formatScaled(s.bootstrap.percentile.lower10, s.scale) << "  ";
        out << "\nPivot        ";
        for (const auto& s : streams)
            out << formatScaled(s.bootstrap.pivot.lower10, s.scale) << "  ";
        out << "\nBCa          ";
        for (const auto& s : streams)
            out << formatScaled(s.bootstrap.bca.lower10, s.scale) << "  ";
        out << std::endl;

        out << "\nTwo-sided bounds (2.5% | 5% | 10% tails)" << std::endl;
        for (const auto& s : streams)
        {
            out << s.label << "  z0=" << std::setprecision(4) << s.bootstrap.z0
                << "  a=" << s.bootstrap.acceleration << std::endl;
            for (BootstrapMethod method : {BootstrapMethod::Percentile, BootstrapMethod::Pivot, BootstrapMethod::BCa})
                out << "  " << std::left << std::setw(11) << bootstrapMethodName(method) << std::right
                    << formatBounds(s.bootstrap.bounds(method), s.scale) << std::endl;
        }
    }

    template <class Executor>
    void crossoverOverfitting(const ValidatorConfiguration& config,
                              const std::vector<double>& prices,
                              std::shared_ptr<Executor> executor,
                              std::ostream& out,
                              ValidationReport& report)
    {
        const std::size_t maxLookback = config.getMaxLookback();
        const std::vector<double> matrix = crossoverReturnsMatrix(prices, maxLookback);
        const std::size_t nSystems = crossoverSystemCount(maxLookback);
        const std::size_t nCases = prices.size() - maxLookback;

        const CscvEstimator<Executor> cscv(config.getNumBlocks(), executor);
        const CscvResult result = cscv.compute(matrix, nSystems, nCases, makeCriterion(config.getCriterion()));

        out << "\nCSCV: " << nSystems << " crossover systems, " << nCases << " cases, "
            << cscv.numBlocks() << " blocks, criterion " << criterionName(config.getCriterion()) << std::endl;
        out << "  " << result.combinations << " combinations, " << result.votes
            << " with the IS winner at or below the OOS median" << std::endl;
        out << "  Probability of overfitting = " << std::fixed << std::setprecision(4)
            << result.probability << std::endl;

        report.setCscvResult(nSystems, nCases, cscv.numBlocks(), config.getCriterion(), result);
    }

    /**
     * @brief Training bias of a random search over crossover lookbacks.
     *
     * Each replication draws a fresh series, tries n-random-trials random
     * (short, long) pairs with the bias tracker collecting, then refines the
     * best pair over its neighbours with collection switched off.
     */
    void trainingBias(const ValidatorConfiguration& config,
                      const RunSeeds& seeds,
                      std::ostream& out,
                      ValidationReport& report)
    {
        const std::size_t maxLookback = config.getMaxLookback();
        const std::size_t nReturns = config.getNumPrices() - maxLookback;
        UniformRng<> rng(seeds.bias);

        out << "\nTraining bias: " << config.getNumReplications() << " replications of "
            << config.getNumRandomTrials() << " random trials, " << nReturns << " returns each" << std::endl;

        double sumIs = 0.0;
        double sumOos = 0.0;
        double sumBias = 0.0;
        double sumBiasSq = 0.0;

        for (std::size_t rep = 0; rep < config.getNumReplications(); ++rep)
        {
            const std::vector<double> prices =
                generateTrendingLogPrices(config.getNumPrices(), config.getTrend(), rng);

            StochasticBias tracker(nReturns);

            auto evaluate = [&](const CrossoverParams& p) {
                crossoverCandidateReturns(prices, p.shortLookback, p.longLookback, tracker.returns());
                tracker.process();
                double total = 0.0;
                for (double r : tracker.returns())
                    total += r;
                return total;
            };

            tracker.setCollecting(true);
            CrossoverParams best{1, 2};
            double bestTotal = -1.0e60;
            for (std::size_t trial = 0; trial < config.getNumRandomTrials(); ++trial)
            {
                const std::size_t longLb = 2 + rng.index(maxLookback - 1);
                const std::size_t shortLb = 1 + rng.index(longLb - 1);
                const CrossoverParams candidate{shortLb, longLb};

                const double total = evaluate(candidate);
                if (total > bestTotal)
                {
                    bestTotal = total;
                    best = candidate;
                }
            }

            tracker.setCollecting(false);
            const CrossoverParams start = best;
            for (int ds = -1; ds <= 1; ++ds)
                for (int dl = -1; dl <= 1; ++dl)
                {
                    const long shortLb = static_cast<long>(start.shortLookback) + ds;
                    const long longLb = static_cast<long>(start.longLookback) + dl;
                    if (shortLb < 1 || longLb <= shortLb || longLb > static_cast<long>(maxLookback))
                        continue;

                    const CrossoverParams candidate{static_cast<std::size_t>(shortLb),
                                                    static_cast<std::size_t>(longLb)};
                    const double total = evaluate(candidate);
                    if (total > bestTotal)
                    {
                        bestTotal = total;
                        best = candidate;
                    }
                }

            const BiasEstimate est = tracker.compute();
            out << std::setw(5) << rep + 1 << "  best " << best.shortLookback << "/" << best.longLookback
                << std::fixed << std::setprecision(4)
                << "  IS total=" << std::setw(9) << bestTotal
                << "  IS=" << std::setw(9) << est.isReturn
                << "  OOS=" << std::setw(9) << est.oosReturn
                << "  bias=" << std::setw(9) << est.bias << std::endl;

            sumIs += est.isReturn;
            sumOos += est.oosReturn;
            sumBias += est.bias;
            sumBiasSq += est.bias * est.bias;
        }

        const double n = static_cast<double>(config.getNumReplications());
        BiasSummary summary;
        summary.replications = config.getNumReplications();
        summary.meanInSample = sumIs / n;
        summary.meanOutOfSample = sumOos / n;
        summary.meanBias = sumBias / n;
        if (config.getNumReplications() > 1)
        {
            const double var = (sumBiasSq - n * summary.meanBias * summary.meanBias) / (n - 1.0);
            summary.biasStdError = std::sqrt(std::max(var, 0.0) / n);
        }

        out << "Mean IS=" << std::setprecision(4) << summary.meanInSample
            << "  OOS=" << summary.meanOutOfSample
            << "  bias=" << summary.meanBias
            << "  (std error " << summary.biasStdError << ")" << std::endl;

        report.setBiasResult(summary);
    }

    template <class Executor>
    void runValidation(const ValidatorConfiguration& config,
                       std::shared_ptr<Executor> executor,
                       std::ostream& out)
    {
        const RunSeeds seeds(config.getSeed());
        ValidationReport report(config);

        out << "oosvalidator mode=" << runModeName(config.getMode()) << "  seed=" << config.getSeed()
            << "  nprices=" << config.getNumPrices() << "  trend=" << config.getTrend()
            << "  threads=" << config.getNumThreads() << std::endl;

        UniformRng<> priceRng(seeds.prices);
        const std::vector<double> prices =
            generateTrendingLogPrices(config.getNumPrices(), config.getTrend(), priceRng);

        if (config.runs(RunMode::WalkForward) || config.runs(RunMode::Bootstrap))
        {
            const auto set = walkForwardBreakout(config, prices, out);

            if (config.runs(RunMode::WalkForward))
                reportFolds(set, out, report);
            if (config.runs(RunMode::Bootstrap))
                boundTheMean(config, set, executor, seeds, out, report);
        }

        if (config.runs(RunMode::Cscv))
            crossoverOverfitting(config, prices, executor, out, report);

        if (config.runs(RunMode::Bias))
            trainingBias(config, seeds, out, report);

        if (!config.getJsonFile().empty())
        {
            report.writeToFile(config.getJsonFile());
            out << "\nJSON summary written to " << config.getJsonFile() << std::endl;
        }

        out << "Validation run finished." << std::endl;
    }
}

int main(int argc, char** argv)
{
    std::optional<ValidatorConfiguration> config;
    try
    {
        config = ValidatorConfigurationReader().parse(argc, argv, std::cout);
    }
    catch (const std::exception& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    if (!config)
        return 0;

    std::ofstream logFile(config->getLogFile());
    if (!logFile.is_open())
    {
        std::cerr << "Error: cannot open log file " << config->getLogFile() << std::endl;
        return 1;
    }

    TeeStream out(std::cout, logFile);

    try
    {
        if (config->getNumThreads() == 0)
            runValidation(*config, std::make_shared<concurrency::SingleThreadExecutor>(), out);
        else
            runValidation(*config, std::make_shared<concurrency::ThreadPoolExecutor<>>(config->getNumThreads()), out);
    }
    catch (const std::exception& e)
    {
        out << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
