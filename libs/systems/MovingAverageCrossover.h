#ifndef __MOVING_AVERAGE_CROSSOVER_H
#define __MOVING_AVERAGE_CROSSOVER_H 1

#include <vector>
#include <string>
#include <cstddef>
#include <algorithm>

#include "ValidationException.h"

namespace oosvalidator
{
  namespace systems
  {
    struct CrossoverParams
    {
      std::size_t shortLookback;
      std::size_t longLookback;
    };

    inline std::size_t crossoverSystemCount(std::size_t maxLookback)
    {
      return maxLookback * (maxLookback - 1) / 2;
    }

    /**
     * @brief Every (short, long) lookback pair with 1 <= short < long <= maxLookback,
     * long lookback in the outer loop. This is the row order of
     * crossoverReturnsMatrix().
     */
    inline std::vector<CrossoverParams> crossoverSystems(std::size_t maxLookback)
    {
      std::vector<CrossoverParams> systems;
      if (maxLookback < 2)
	return systems;

      systems.reserve(crossoverSystemCount(maxLookback));
      for (std::size_t longLb = 2; longLb <= maxLookback; ++longLb)
	for (std::size_t shortLb = 1; shortLb < longLb; ++shortLb)
	  systems.push_back(CrossoverParams{shortLb, longLb});

      return systems;
    }

    /**
     * @brief One-bar returns of a symmetric moving-average crossover system.
     *
     * The system is long while the short moving average is above the long
     * one, short while it is below and flat when they are equal. out is filled
     * with the returns of the last out.size() decision bars of prices, the
     * final decision being made on the second-to-last bar.
     *
     * @throws ConfigurationException if the lookbacks are not 1 <= short < long
     * or the first decision bar has fewer than longLb bars of history
     */
    inline void crossoverCandidateReturns(const std::vector<double>& prices,
					  std::size_t shortLb,
					  std::size_t longLb,
					  std::vector<double>& out)
    {
      if (shortLb < 1 || shortLb >= longLb)
	throw ConfigurationException("crossoverCandidateReturns: need 1 <= short lookback < long lookback, got " +
				     std::to_string(shortLb) + " and " + std::to_string(longLb));

      const std::size_t nReturns = out.size();
      if (nReturns == 0)
	return;

      if (prices.size() < nReturns + longLb)
	throw ConfigurationException("crossoverCandidateReturns: " + std::to_string(prices.size()) +
				     " prices cannot provide " + std::to_string(nReturns) +
				     " returns with long lookback " + std::to_string(longLb));

      const std::size_t first = prices.size() - 1 - nReturns;
      double shortSum = 0.0;
      double longSum = 0.0;

      for (std::size_t i = first; i + 1 < prices.size(); ++i)
	{
	  if (i == first)
	    {
	      for (std::size_t k = 0; k < shortLb; ++k)
		shortSum += prices[i - k];
	      longSum = shortSum;
	      for (std::size_t k = shortLb; k < longLb; ++k)
		longSum += prices[i - k];
	    }
	  else
	    {
	      shortSum += prices[i] - prices[i - shortLb];
	      longSum += prices[i] - prices[i - longLb];
	    }

	  const double shortMa = shortSum / static_cast<double>(shortLb);
	  const double longMa = longSum / static_cast<double>(longLb);

	  double ret = 0.0;
	  if (shortMa > longMa)
	    ret = prices[i + 1] - prices[i];
	  else if (shortMa < longMa)
	    ret = prices[i] - prices[i + 1];

	  out[i - first] = ret;
	}
    }

    /**
     * @brief Returns matrix of every crossover system, row-major.
     *
     * crossoverSystemCount(maxLookback) rows in crossoverSystems() order,
     * each holding prices.size() - maxLookback one-bar returns; decisions
     * start on bar maxLookback - 1. Entry (s, c) is at s * nCases + c,
     * the layout CscvEstimator expects.
     */
    inline std::vector<double> crossoverReturnsMatrix(const std::vector<double>& prices,
						      std::size_t maxLookback)
    {
      if (maxLookback < 2)
	throw ConfigurationException("crossoverReturnsMatrix: maximum lookback must be at least 2");
      if (prices.size() <= maxLookback)
	throw ConfigurationException("crossoverReturnsMatrix: need more than " + std::to_string(maxLookback) +
				     " prices, got " + std::to_string(prices.size()));

      const std::size_t nCases = prices.size() - maxLookback;
      const std::vector<CrossoverParams> systems = crossoverSystems(maxLookback);

      std::vector<double> matrix(systems.size() * nCases);
      std::vector<double> row(nCases);
      for (std::size_t s = 0; s < systems.size(); ++s)
	{
	  crossoverCandidateReturns(prices, systems[s].shortLookback, systems[s].longLookback, row);
	  std::copy(row.begin(), row.end(), matrix.begin() + s * nCases);
	}

      return matrix;
    }
  }
}

#endif
