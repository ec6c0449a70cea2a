#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <cmath>
#include <cstddef>

#include "StatUtils.h"
#include "PerformanceCriteria.h"

using namespace oosvalidator;
using Catch::Approx;

TEST_CASE("PerformanceCriteria: mean return", "[criteria]")
{
  REQUIRE(meanReturn({1.0, 2.0, 3.0, 4.0, 5.0}) == Approx(3.0));
  REQUIRE(meanReturn({}) == 0.0);
  REQUIRE(meanReturn({-2.0}) == -2.0);

  SECTION("A constant sample returns its value exactly")
  {
    for (double c : {0.1, 0.3, 0.7, 1.1, 2.2, -0.01})
      for (std::size_t n : {2u, 3u, 5u, 7u, 10u, 250u})
	REQUIRE(meanReturn(std::vector<double>(n, c)) == c);
  }
}

TEST_CASE("PerformanceCriteria: profit factor", "[criteria]")
{
  SECTION("Balanced wins and losses")
  {
    REQUIRE(profitFactor({1.0, -1.0, 2.0, -2.0}) == Approx(1.0).epsilon(1e-9));
    REQUIRE(profitFactor({1.0, -1.0, 2.0, -2.0}, true) == Approx(0.0).margin(1e-9));
  }

  SECTION("Twice as much won as lost")
  {
    REQUIRE(profitFactor({2.0, -1.0}) == Approx(2.0).epsilon(1e-9));
    REQUIRE(profitFactor({2.0, -1.0}, true) == Approx(std::log(2.0)).epsilon(1e-9));
  }

  SECTION("No losses stays finite")
  {
    const double pf = profitFactor({1.0, 1.0});
    REQUIRE(std::isfinite(pf));
    REQUIRE(pf > 1.0e9);
  }

  SECTION("Empty sample is neutral")
  {
    REQUIRE(profitFactor({}) == Approx(1.0));
  }
}

TEST_CASE("PerformanceCriteria: Sharpe ratio uses the population deviation", "[criteria]")
{
  // mean 2, population sd sqrt(2/3)
  REQUIRE(sharpeRatio({1.0, 2.0, 3.0}) == Approx(2.0 / std::sqrt(2.0 / 3.0)));

  REQUIRE(sharpeRatio({0.5, 0.5}) == 1.0e30);
  REQUIRE(sharpeRatio({-0.5, -0.5}) == -1.0e30);
  REQUIRE(sharpeRatio({0.0, 0.0}) == 0.0);
  REQUIRE(sharpeRatio({}) == 0.0);
}

TEST_CASE("PerformanceCriteria: criterion selection", "[criteria]")
{
  const std::vector<double> r = {2.0, -1.0, 0.5};

  REQUIRE(makeCriterion(Criterion::MeanReturn)(r) == meanReturn(r));
  REQUIRE(makeCriterion(Criterion::ProfitFactor)(r) == profitFactor(r));
  REQUIRE(makeCriterion(Criterion::SharpeRatio)(r) == sharpeRatio(r));

  REQUIRE(criterionFromString("mean") == Criterion::MeanReturn);
  REQUIRE(criterionFromString("PF") == Criterion::ProfitFactor);
  REQUIRE(criterionFromString("Sharpe") == Criterion::SharpeRatio);
  REQUIRE_THROWS_AS(criterionFromString("sortino"), ConfigurationException);

  REQUIRE(criterionFromString(criterionName(Criterion::SharpeRatio)) == Criterion::SharpeRatio);
}

TEST_CASE("StatUtils: Student's t summary of a return stream", "[statutils]")
{
  SECTION("Three returns, two degrees of freedom")
  {
    const ReturnSummary s = summarizeReturns({1.0, 2.0, 3.0});
    REQUIRE(s.count == 3);
    REQUIRE(s.mean == Approx(2.0));
    REQUIRE(s.stdDev == Approx(1.0));
    REQUIRE(s.tStatistic == Approx(3.4641016151377544));
    REQUIRE(s.pValue == Approx(0.03708995011372429).epsilon(1e-8));
    REQUIRE(s.tLowerBound90 == Approx(0.9113378920963651).epsilon(1e-8));
  }

  SECTION("A single return has no t statistic")
  {
    const ReturnSummary s = summarizeReturns({0.7});
    REQUIRE(s.count == 1);
    REQUIRE(s.mean == Approx(0.7));
    REQUIRE(s.tStatistic == 0.0);
    REQUIRE(s.pValue == 1.0);
  }

  SECTION("Empty stream")
  {
    const ReturnSummary s = summarizeReturns({});
    REQUIRE(s.count == 0);
    REQUIRE(s.mean == 0.0);
  }
}

TEST_CASE("StatUtils: grouped returns", "[statutils]")
{
  const std::vector<double> r = {1.0, 2.0, 3.0, 4.0, 5.0, 6.0, 7.0};

  SECTION("Groups of three with a short tail")
  {
    const std::vector<double> g = crunchReturns(r, 3);
    REQUIRE(g.size() == 3);
    REQUIRE(g[0] == Approx(2.0));
    REQUIRE(g[1] == Approx(5.0));
    REQUIRE(g[2] == Approx(7.0));
  }

  SECTION("Group of one is the identity")
  {
    REQUIRE(crunchReturns(r, 1) == r);
  }

  SECTION("Zero group size is rejected")
  {
    REQUIRE_THROWS_AS(crunchReturns(r, 0), ConfigurationException);
  }

  SECTION("Empty input gives empty output")
  {
    REQUIRE(crunchReturns({}, 10).empty());
  }
}
