#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <boost/algorithm/string/case_conv.hpp>
#include "ValidationException.h"

namespace oosvalidator
{
  using StatisticFn = std::function<double(const std::vector<double>&)>;
  using CriterionFn = StatisticFn;

  /**
   * @brief The closed set of performance criteria a search or CSCV run can
   * rank candidates by. Resolve once with makeCriterion() and pass the
   * resulting function object into the hot loop.
   */
  enum class Criterion
    {
      MeanReturn,
      ProfitFactor,
      SharpeRatio
    };

  /**
   * @brief Arithmetic mean; 0 for an empty sample.
   *
   * Accumulated as deviations from the first value, so a constant sample
   * returns that value exactly (sum / n of 0.1 three times does not).
   */
  inline double meanReturn(const std::vector<double>& returns)
  {
    if (returns.empty())
      return 0.0;

    const double origin = returns.front();
    double sum = 0.0;
    for (std::size_t i = 1; i < returns.size(); ++i)
      sum += returns[i] - origin;

    return origin + sum / static_cast<double>(returns.size());
  }

  /**
   * @brief Gross wins over gross losses.
   *
   * Both sums start at 1e-10 so an all-winning or all-flat sample still
   * yields a finite value. With useLog the natural log of the ratio is
   * returned, which makes the criterion symmetric around zero.
   */
  inline double profitFactor(const std::vector<double>& returns, bool useLog = false)
  {
    double winSum = 1.0e-10;
    double loseSum = 1.0e-10;

    for (double r : returns)
      {
	if (r > 0.0)
	  winSum += r;
	else
	  loseSum -= r;
      }

    const double pf = winSum / loseSum;
    return useLog ? std::log(pf) : pf;
  }

  /**
   * @brief Mean over population standard deviation (divisor n).
   *
   * A sample with zero dispersion maps to +/-1e30 according to the sign of
   * its mean, or 0 when the mean is also 0.
   */
  inline double sharpeRatio(const std::vector<double>& returns)
  {
    if (returns.empty())
      return 0.0;

    const double mean = meanReturn(returns);
    double ss = 0.0;
    for (double r : returns)
      ss += (r - mean) * (r - mean);

    const double sd = std::sqrt(ss / static_cast<double>(returns.size()));
    if (sd == 0.0)
      {
	if (mean > 0.0)
	  return 1.0e30;
	if (mean < 0.0)
	  return -1.0e30;
	return 0.0;
      }

    return mean / sd;
  }

  inline CriterionFn makeCriterion(Criterion which)
  {
    switch (which)
      {
      case Criterion::MeanReturn:
	return [](const std::vector<double>& r) { return meanReturn(r); };
      case Criterion::ProfitFactor:
	return [](const std::vector<double>& r) { return profitFactor(r, false); };
      case Criterion::SharpeRatio:
	return [](const std::vector<double>& r) { return sharpeRatio(r); };
      }

    throw ConfigurationException("makeCriterion: unknown criterion");
  }

  inline std::string criterionName(Criterion which)
  {
    switch (which)
      {
      case Criterion::MeanReturn:
	return "mean";
      case Criterion::ProfitFactor:
	return "pf";
      case Criterion::SharpeRatio:
	return "sharpe";
      }

    return "unknown";
  }

  /**
   * @brief Parse a criterion name from the command line or config file.
   *
   * Accepts "mean", "pf" / "profit-factor" and "sharpe" in any case.
   * @throws ConfigurationException for anything else
   */
  inline Criterion criterionFromString(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(name);

    if (key == "mean" || key == "mean-return")
      return Criterion::MeanReturn;
    if (key == "pf" || key == "profit-factor")
      return Criterion::ProfitFactor;
    if (key == "sharpe" || key == "sharpe-ratio")
      return Criterion::SharpeRatio;

    throw ConfigurationException("Unknown criterion '" + name + "' (expected mean, pf or sharpe)");
  }
}
