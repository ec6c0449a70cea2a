#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <set>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "CscvOverfitting.h"
#include "RngUtils.h"

using namespace oosvalidator;
using oosvalidator::rng_utils::UniformRng;
using Catch::Approx;

namespace
{
  std::size_t binomial(std::size_t n, std::size_t k)
  {
    std::size_t r = 1;
    for (std::size_t i = 1; i <= k; ++i)
      r = r * (n - k + i) / i;
    return r;
  }

  const CriterionFn meanCrit = makeCriterion(Criterion::MeanReturn);
}

TEST_CASE("CSCV: block partition covers every case", "[cscv][blocks]")
{
  SECTION("Ten cases in four blocks")
  {
    const auto blocks = partitionCases(10, 4);
    REQUIRE(blocks.size() == 4);
    REQUIRE(blocks[0].index == 0);
    REQUIRE(blocks[0].length == 3);
    REQUIRE(blocks[1].index == 3);
    REQUIRE(blocks[1].length == 3);
    REQUIRE(blocks[2].index == 6);
    REQUIRE(blocks[2].length == 2);
    REQUIRE(blocks[3].index == 8);
    REQUIRE(blocks[3].length == 2);
  }

  SECTION("Lengths sum to the case count and differ by at most one")
  {
    for (std::size_t nBlocks : {2u, 4u, 6u, 8u, 10u, 16u})
      for (std::size_t nCases = nBlocks; nCases <= 97; ++nCases)
	{
	  const auto blocks = partitionCases(nCases, nBlocks);
	  REQUIRE(blocks.size() == nBlocks);

	  std::size_t expectedStart = 0;
	  std::size_t minLen = nCases;
	  std::size_t maxLen = 0;
	  for (const auto& b : blocks)
	    {
	      REQUIRE(b.index == expectedStart);
	      expectedStart += b.length;
	      minLen = std::min(minLen, b.length);
	      maxLen = std::max(maxLen, b.length);
	    }

	  REQUIRE(expectedStart == nCases);
	  REQUIRE(maxLen - minLen <= 1);
	  REQUIRE(minLen >= 1);
	}
  }

  SECTION("Too few cases or no blocks is a configuration error")
  {
    REQUIRE_THROWS_AS(partitionCases(3, 4), ConfigurationException);
    REQUIRE_THROWS_AS(partitionCases(5, 0), ConfigurationException);
  }
}

TEST_CASE("CSCV: enumeration visits every balanced split once", "[cscv][combinations]")
{
  for (std::size_t nBlocks : {2u, 4u, 6u, 8u, 10u, 12u})
    {
      CombinationEnumerator e(nBlocks);

      // First split: first half train
      for (std::size_t i = 0; i < nBlocks; ++i)
	REQUIRE(e.flags()[i] == (i < nBlocks / 2));

      std::set<std::vector<bool>> seen;
      std::size_t count = 0;
      do
	{
	  const auto& f = e.flags();
	  REQUIRE(static_cast<std::size_t>(std::count(f.begin(), f.end(), true)) == nBlocks / 2);
	  seen.insert(f);
	  ++count;
	}
      while (e.next());

      REQUIRE(count == binomial(nBlocks, nBlocks / 2));
      REQUIRE(seen.size() == count);
    }

  SECTION("Odd or zero block counts are rejected")
  {
    REQUIRE_THROWS_AS(CombinationEnumerator(5), ConfigurationException);
    REQUIRE_THROWS_AS(CombinationEnumerator(0), ConfigurationException);
  }
}

TEST_CASE("CSCV: estimator configuration", "[cscv][config]")
{
  REQUIRE(CscvEstimator<>(7).numBlocks() == 6);
  REQUIRE(CscvEstimator<>(8).numBlocks() == 8);
  REQUIRE_THROWS_AS(CscvEstimator<>(1), ConfigurationException);
  REQUIRE_THROWS_AS(CscvEstimator<>(0), ConfigurationException);

  CscvEstimator<> cscv(4);
  const std::vector<double> returns(30, 0.1);

  REQUIRE_THROWS_AS(cscv.compute(returns, 4, 10, meanCrit), ConfigurationException);   // 30 != 40
  REQUIRE_THROWS_AS(cscv.compute(returns, 0, 30, meanCrit), ConfigurationException);
  REQUIRE_THROWS_AS(cscv.compute(returns, 10, 3, meanCrit), ConfigurationException);   // 3 cases, 4 blocks
  REQUIRE_THROWS_AS(cscv.compute(returns, 3, 10, CriterionFn()), std::invalid_argument);
}

TEST_CASE("CSCV: a uniformly dominant system is never overfit", "[cscv][probability]")
{
  const std::size_t nSystems = 5;
  const std::size_t nCases = 40;
  std::vector<double> returns(nSystems * nCases);
  for (std::size_t s = 0; s < nSystems; ++s)
    for (std::size_t c = 0; c < nCases; ++c)
      returns[s * nCases + c] = 0.01 * static_cast<double>(s) + ((c % 2) ? 0.02 : -0.02);

  CscvEstimator<> cscv(6);
  const CscvResult result = cscv.compute(returns, nSystems, nCases, meanCrit);

  REQUIRE(result.combinations == 20);
  REQUIRE(result.votes == 0);
  REQUIRE(result.probability == 0.0);
  for (std::size_t best : result.inSampleBest)
    REQUIRE(best == nSystems - 1);
  for (double w : result.relativeRanks)
    REQUIRE(w == Approx(5.0 / 6.0));
}

TEST_CASE("CSCV: a perfectly anti-persistent pair is always overfit", "[cscv][probability]")
{
  // System 0 wins the first block, system 1 wins the second
  const std::vector<double> returns = {1.0, 0.0,
				       0.0, 1.0};

  const CscvResult result = CscvEstimator<>(2).compute(returns, 2, 2, meanCrit);

  REQUIRE(result.combinations == 2);
  REQUIRE(result.votes == 2);
  REQUIRE(result.probability == 1.0);
  REQUIRE(result.inSampleBest == std::vector<std::size_t>{0, 1});
  for (std::size_t i = 0; i < 2; ++i)
    {
      REQUIRE(result.relativeRanks[i] == Approx(1.0 / 3.0));
      REQUIRE(result.logits[i] == Approx(std::log(0.5)));
    }

  REQUIRE(cscvProbability(returns, 2, 2, 2, meanCrit) == 1.0);
}

TEST_CASE("CSCV: ties go to the first system", "[cscv][ties]")
{
  // Identical rows: system 0 is the in-sample winner and ties every OOS score
  const std::vector<double> returns(3 * 12, 0.25);
  const CscvResult result = CscvEstimator<>(4).compute(returns, 3, 12, meanCrit);

  REQUIRE(result.combinations == 6);
  for (std::size_t best : result.inSampleBest)
    REQUIRE(best == 0);
  for (double w : result.relativeRanks)
    REQUIRE(w == Approx(0.75));
  REQUIRE(result.probability == 0.0);
}

TEST_CASE("CSCV: exchangeable systems are not pinned to either extreme", "[cscv][probability]")
{
  // Every entry drawn from the same distribution: no system is really better,
  // so the winner's OOS rank is uniform and the probability centres on 1/2.
  const std::size_t nSystems = 10;
  const std::size_t nCases = 120;
  const int nMatrices = 20;

  double total = 0.0;
  for (int m = 0; m < nMatrices; ++m)
    {
      UniformRng<> rng(1000 + m);
      std::vector<double> returns(nSystems * nCases);
      for (auto& r : returns)
	r = rng.uniform01() - 0.5;

      const double p = cscvProbability(returns, nSystems, nCases, 8, meanCrit);
      REQUIRE(p >= 0.0);
      REQUIRE(p <= 1.0);
      total += p;
    }

  const double average = total / nMatrices;
  REQUIRE(average > 0.2);
  REQUIRE(average < 0.8);
}

TEST_CASE("CSCV: parallel evaluation matches serial evaluation", "[cscv][concurrency]")
{
  const std::size_t nSystems = 12;
  const std::size_t nCases = 200;
  UniformRng<> rng(77);
  std::vector<double> returns(nSystems * nCases);
  for (auto& r : returns)
    r = rng.uniform01() - 0.48;

  const CriterionFn pf = makeCriterion(Criterion::ProfitFactor);

  const CscvResult serial = CscvEstimator<concurrency::SingleThreadExecutor>(10).compute(returns, nSystems, nCases, pf);
  const CscvResult pooled = CscvEstimator<concurrency::ThreadPoolExecutor<4>>(10).compute(returns, nSystems, nCases, pf);

  REQUIRE(serial.combinations == 252);
  REQUIRE(pooled.combinations == 252);
  REQUIRE(serial.relativeRanks == pooled.relativeRanks);
  REQUIRE(serial.inSampleBest == pooled.inSampleBest);
  REQUIRE(serial.probability == pooled.probability);
}

TEST_CASE("CSCV: batched enumeration does not change the result", "[cscv][batch]")
{
  const std::size_t nSystems = 4;
  const std::size_t nCases = 32;

  UniformRng<> rng(4242);
  std::vector<double> returns(nSystems * nCases);
  for (auto& r : returns)
    r = rng.uniform01() - 0.5;

  // C(16, 8) = 12870 splits, more than one default batch
  CscvEstimator<> whole(16);
  REQUIRE(whole.batchSize() == CscvEstimator<>::DefaultBatchSize);
  const CscvResult reference = whole.compute(returns, nSystems, nCases, meanCrit);
  REQUIRE(reference.combinations == binomial(16, 8));
  REQUIRE(reference.relativeRanks.size() == reference.combinations);

  for (std::size_t batch : {1u, 7u, 1000u, 20000u})
    {
      CscvEstimator<concurrency::ThreadPoolExecutor<4>> batched(16);
      batched.setBatchSize(batch);
      const CscvResult result = batched.compute(returns, nSystems, nCases, meanCrit);

      REQUIRE(result.combinations == reference.combinations);
      REQUIRE(result.votes == reference.votes);
      REQUIRE(result.probability == reference.probability);
      REQUIRE(result.relativeRanks == reference.relativeRanks);
      REQUIRE(result.inSampleBest == reference.inSampleBest);
    }

  SECTION("Probability only keeps no per-split detail")
  {
    REQUIRE(whole.computeProbability(returns, nSystems, nCases, meanCrit) == reference.probability);
  }

  SECTION("Batch size must be positive")
  {
    REQUIRE_THROWS_AS(whole.setBatchSize(0), std::invalid_argument);
  }
}
