#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <algorithm>

#include "MovingAverageCrossover.h"
#include "SyntheticSeries.h"
#include "CscvOverfitting.h"
#include "RngUtils.h"

using namespace oosvalidator;
using namespace oosvalidator::systems;
using oosvalidator::rng_utils::UniformRng;
using Catch::Approx;

TEST_CASE("MovingAverageCrossover: system enumeration", "[systems][crossover]")
{
  REQUIRE(crossoverSystemCount(2) == 1);
  REQUIRE(crossoverSystemCount(5) == 10);
  REQUIRE(crossoverSystems(1).empty());

  const auto systems = crossoverSystems(4);
  REQUIRE(systems.size() == 6);

  const std::size_t expectedShort[] = {1, 1, 2, 1, 2, 3};
  const std::size_t expectedLong[] = {2, 3, 3, 4, 4, 4};
  for (std::size_t i = 0; i < systems.size(); ++i)
    {
      REQUIRE(systems[i].shortLookback == expectedShort[i]);
      REQUIRE(systems[i].longLookback == expectedLong[i]);
    }
}

TEST_CASE("MovingAverageCrossover: matrix shape and direction", "[systems][crossover]")
{
  std::vector<double> rising(20);
  for (std::size_t i = 0; i < rising.size(); ++i)
    rising[i] = 0.5 * static_cast<double>(i);

  SECTION("Rising prices: every system is long")
  {
    const auto m = crossoverReturnsMatrix(rising, 5);
    REQUIRE(m.size() == 10 * 15);
    for (double r : m)
      REQUIRE(r == Approx(0.5));
  }

  SECTION("Falling prices: every system is short and still earns")
  {
    std::vector<double> falling(rising.rbegin(), rising.rend());
    const auto m = crossoverReturnsMatrix(falling, 5);
    for (double r : m)
      REQUIRE(r == Approx(0.5));
  }

  SECTION("Flat prices: averages are equal and every system is out")
  {
    const std::vector<double> flat(12, 3.0);
    const auto m = crossoverReturnsMatrix(flat, 3);
    REQUIRE(m.size() == 3 * 9);
    for (double r : m)
      REQUIRE(r == 0.0);
  }
}

TEST_CASE("MovingAverageCrossover: a reversal switches the position", "[systems][crossover]")
{
  const std::vector<double> prices = {0.0, 1.0, 2.0, 3.0, 2.0, 1.0, 0.0};
  std::vector<double> out(5);
  crossoverCandidateReturns(prices, 1, 2, out);

  // Decisions on bars 1..5; the short average crosses below on bar 4
  REQUIRE(out == std::vector<double>{1.0, 1.0, -1.0, 1.0, 1.0});
}

TEST_CASE("MovingAverageCrossover: single candidate matches its matrix row", "[systems][crossover]")
{
  UniformRng<> rng(4242);
  const auto prices = generateTrendingLogPrices(400, 0.02, rng);
  const std::size_t maxLookback = 12;
  const std::size_t nCases = prices.size() - maxLookback;

  const auto matrix = crossoverReturnsMatrix(prices, maxLookback);
  const auto systems = crossoverSystems(maxLookback);
  REQUIRE(matrix.size() == systems.size() * nCases);

  for (std::size_t s : {std::size_t(0), std::size_t(17), systems.size() - 1})
    {
      std::vector<double> row(nCases);
      crossoverCandidateReturns(prices, systems[s].shortLookback, systems[s].longLookback, row);
      REQUIRE(std::equal(row.begin(), row.end(), matrix.begin() + s * nCases));
    }

  // The matrix plugs straight into CSCV
  const double p = cscvProbability(matrix, systems.size(), nCases, 10, makeCriterion(Criterion::MeanReturn));
  REQUIRE(p >= 0.0);
  REQUIRE(p <= 1.0);
}

TEST_CASE("MovingAverageCrossover: configuration errors", "[systems][crossover]")
{
  const std::vector<double> prices(10, 1.0);
  std::vector<double> out(5);

  REQUIRE_THROWS_AS(crossoverReturnsMatrix(prices, 1), ConfigurationException);
  REQUIRE_THROWS_AS(crossoverReturnsMatrix(prices, 10), ConfigurationException);
  REQUIRE_THROWS_AS(crossoverCandidateReturns(prices, 0, 3, out), ConfigurationException);
  REQUIRE_THROWS_AS(crossoverCandidateReturns(prices, 3, 3, out), ConfigurationException);
  REQUIRE_THROWS_AS(crossoverCandidateReturns(prices, 2, 6, out), ConfigurationException);
  REQUIRE_NOTHROW(crossoverCandidateReturns(prices, 2, 5, out));

  std::vector<double> none;
  REQUIRE_NOTHROW(crossoverCandidateReturns(prices, 1, 2, none));
}
