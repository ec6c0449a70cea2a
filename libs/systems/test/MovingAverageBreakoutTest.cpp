#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <stdexcept>

#include "MovingAverageBreakout.h"
#include "SyntheticSeries.h"
#include "RngUtils.h"

using namespace oosvalidator;
using namespace oosvalidator::systems;
using oosvalidator::rng_utils::UniformRng;
using Catch::Approx;

namespace
{
  // Rally from bar 3 to bar 5, then a decline
  const std::vector<double> kPrices = {1.0, 1.0, 1.0, 2.0, 3.0, 4.0, 3.0, 2.0, 1.0, 1.0};
}

TEST_CASE("MovingAverageBreakout: candidate order", "[systems][breakout]")
{
  MovingAverageBreakout system(4);
  const auto params = system.candidates();

  REQUIRE(params.size() == 30);
  REQUIRE(params[0].lookback == 2);
  REQUIRE(params[0].threshold == Approx(0.01));
  REQUIRE(params[1].lookback == 2);
  REQUIRE(params[1].threshold == Approx(0.02));
  REQUIRE(params[10].lookback == 3);
  REQUIRE(params[10].threshold == Approx(0.01));
  REQUIRE(params.back().lookback == 4);
  REQUIRE(params.back().threshold == Approx(0.10));

  REQUIRE(MovingAverageBreakout(3, 2).candidates().size() == 4);
}

TEST_CASE("MovingAverageBreakout: configuration errors", "[systems][breakout]")
{
  REQUIRE_THROWS_AS(MovingAverageBreakout(1), ConfigurationException);
  REQUIRE_THROWS_AS(MovingAverageBreakout(5, 0), ConfigurationException);

  MovingAverageBreakout system(5);
  const SeriesWindow tooShort(kPrices, 0, 5);
  REQUIRE_THROWS_AS(system.train(tooShort), ConfigurationException);
  REQUIRE_THROWS_AS(system.score(SeriesWindow(kPrices, 0, 8), BreakoutParams{6, 0.01}), ConfigurationException);

  // Test window starting at bar 1 has no room for a lookback of 3
  REQUIRE_THROWS_AS(system.evaluate(SeriesWindow(kPrices, 1, 3), BreakoutParams{3, 0.01}, 0, ReturnType::AllBars),
		    ConfigurationException);
}

TEST_CASE("MovingAverageBreakout: training score and tie-break", "[systems][breakout]")
{
  MovingAverageBreakout system(2);
  const SeriesWindow window(kPrices, 0, 8);

  // Long on bars 3, 4, 5 earning 1, 1, -1; flat again on bar 6
  const auto s = system.score(window, BreakoutParams{2, 0.10});
  REQUIRE(s.criterion == Approx(1.0 / 3.0));
  REQUIRE(s.finalState == 0);

  // Every threshold scores the same, so the first one is kept
  const auto trained = system.train(window);
  REQUIRE(trained.params.lookback == 2);
  REQUIRE(trained.params.threshold == Approx(0.01));
  REQUIRE(trained.criterion == Approx(1.0 / 3.0));
  REQUIRE(trained.finalState == 0);

  // Training that ends while long reports the open position
  const auto open = system.train(SeriesWindow(kPrices, 0, 6));
  REQUIRE(open.criterion == Approx(1.0));
  REQUIRE(open.finalState == 1);
}

TEST_CASE("MovingAverageBreakout: trained parameters maximise the score", "[systems][breakout]")
{
  UniformRng<> rng(31);
  const auto prices = generateTrendingLogPrices(300, 0.05, rng);

  MovingAverageBreakout system(8);
  const SeriesWindow window(prices, 40, 150);
  const auto trained = system.train(window);

  double best = -1.0e60;
  for (const auto& p : system.candidates())
    {
      const double c = system.score(window, p).criterion;
      REQUIRE(c <= trained.criterion);
      if (c > best)
	best = c;
    }

  REQUIRE(trained.criterion == best);
  REQUIRE(system.score(window, trained.params).finalState == trained.finalState);
}

TEST_CASE("MovingAverageBreakout: the three return types", "[systems][breakout]")
{
  MovingAverageBreakout system(2);
  const BreakoutParams params{2, 0.10};

  SECTION("Trade opened and closed inside the window")
  {
    const SeriesWindow test(kPrices, 3, 5);

    const auto all = system.evaluate(test, params, 0, ReturnType::AllBars);
    REQUIRE(all.returns == std::vector<double>{0.0, 1.0, 1.0, -1.0, 0.0});
    REQUIRE(all.finalState == 0);

    const auto open = system.evaluate(test, params, 0, ReturnType::OpenPosition);
    REQUIRE(open.returns == std::vector<double>{1.0, 1.0, -1.0});

    const auto completed = system.evaluate(test, params, 0, ReturnType::CompletedTrades);
    REQUIRE(completed.returns == std::vector<double>{1.0});
  }

  SECTION("Open trade is closed on the last bar")
  {
    const SeriesWindow test(kPrices, 3, 3);

    const auto completed = system.evaluate(test, params, 0, ReturnType::CompletedTrades);
    REQUIRE(completed.returns == std::vector<double>{2.0});
    REQUIRE(completed.finalState == 1);
  }

  SECTION("Position carried in from training")
  {
    const SeriesWindow test(kPrices, 3, 5);

    const auto all = system.evaluate(test, params, 1, ReturnType::AllBars);
    REQUIRE(all.returns == std::vector<double>{1.0, 1.0, 1.0, -1.0, 0.0});

    // The carried trade is measured from the bar before the window
    const auto completed = system.evaluate(test, params, 1, ReturnType::CompletedTrades);
    REQUIRE(completed.returns == std::vector<double>{2.0});
  }
}

TEST_CASE("MovingAverageBreakout: walk forward with every return type", "[systems][breakout][walkforward]")
{
  UniformRng<> rng(8);
  const auto prices = generateTrendingLogPrices(600, 0.03, rng);

  MovingAverageBreakout system(10);
  MovingAverageBreakout::Harness harness(100, 50);
  const auto set = harness.runAllReturnTypes(prices, system.trainer(), system.evaluator());

  REQUIRE(set.allBars.numFolds() == 10);
  REQUIRE(set.allBars.pooledReturns.size() == 500);
  REQUIRE(set.openPosition.pooledReturns.size() <= 500);

  // Bar returns while in the market are exactly the non-zero all-bar returns
  double allSum = 0.0;
  for (double r : set.allBars.pooledReturns)
    allSum += r;
  double openSum = 0.0;
  for (double r : set.openPosition.pooledReturns)
    openSum += r;
  REQUIRE(openSum == Approx(allSum).margin(1e-9));

  for (std::size_t f = 0; f < set.allBars.numFolds(); ++f)
    {
      const auto& fold = set.allBars.folds[f];
      REQUIRE(fold.params.lookback >= 2);
      REQUIRE(fold.params.lookback <= 10);
      REQUIRE(fold.params == set.completedTrades.folds[f].params);
    }
}
