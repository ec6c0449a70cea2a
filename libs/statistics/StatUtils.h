#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/math/distributions/students_t.hpp>
#include "ValidationException.h"

namespace oosvalidator
{
  /**
   * @brief Classical (normal theory) summary of an out-of-sample return
   * stream, printed next to the bootstrap bounds for comparison.
   */
  struct ReturnSummary
  {
    std::size_t count = 0;
    double      mean = 0.0;
    double      stdDev = 0.0;   // sample standard deviation (n - 1)
    double      tStatistic = 0.0;
    double      pValue = 1.0;   // one-sided, H0: mean <= 0
    double      tLowerBound90 = 0.0;
  };

  /**
   * @brief Mean, standard deviation, Student's t statistic, one-sided p-value
   * and the 90% one-sided lower confidence bound for the mean.
   *
   * With fewer than two returns the t fields keep their neutral values
   * (t = 0, p = 1, lower bound = 0).
   */
  inline ReturnSummary summarizeReturns(const std::vector<double>& returns)
  {
    using namespace boost::accumulators;

    ReturnSummary summary;
    summary.count = returns.size();
    if (returns.empty())
      return summary;

    accumulator_set<double, stats<tag::mean, tag::variance(lazy), tag::count>> acc;
    for (double r : returns)
      acc(r);

    summary.mean = mean(acc);
    if (summary.count < 2)
      return summary;

    const double n = static_cast<double>(summary.count);
    // boost's variance is the population variance
    const double sampleVar = variance(acc) * n / (n - 1.0);
    summary.stdDev = std::sqrt(std::max(sampleVar, 0.0));

    boost::math::students_t dist(n - 1.0);
    summary.tStatistic = std::sqrt(n) * summary.mean / (summary.stdDev + 1.0e-20);
    summary.pValue = boost::math::cdf(boost::math::complement(dist, summary.tStatistic));
    summary.tLowerBound90 = summary.mean -
      summary.stdDev / std::sqrt(n) * boost::math::quantile(dist, 0.9);

    return summary;
  }

  /**
   * @brief Replace a return stream by the means of consecutive groups of
   * groupSize returns; the final group may be shorter.
   *
   * Used to reduce serial dependence in bar-by-bar returns, most of which
   * are zero for a system that is often flat, before bootstrapping them.
   */
  inline std::vector<double> crunchReturns(const std::vector<double>& returns, std::size_t groupSize)
  {
    if (groupSize == 0)
      throw ConfigurationException("crunchReturns: group size must be positive");

    std::vector<double> crunched;
    crunched.reserve((returns.size() + groupSize - 1) / groupSize);

    for (std::size_t start = 0; start < returns.size(); start += groupSize)
      {
	const std::size_t end = std::min(returns.size(), start + groupSize);
	double sum = 0.0;
	for (std::size_t i = start; i < end; ++i)
	  sum += returns[i];
	crunched.push_back(sum / static_cast<double>(end - start));
      }

    return crunched;
  }
}
