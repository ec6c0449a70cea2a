// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, December 2024
//
// Normal Distribution Utility Functions
// Standard normal CDF (via erf) and inverse CDF (Acklam's rational approximation)

#pragma once

#include <cmath>
#include <limits>
#include <stdexcept>

namespace oosvalidator
{
  namespace detail
  {
    /**
     * @brief Quantile (inverse CDF) of the standard normal distribution.
     *
     * Peter Acklam's algorithm: one rational approximation for the central
     * region [0.02425, 0.97575] and another for the tails. Relative error is
     * below 1.15e-9 over the whole open interval.
     *
     * @param p Probability in (0, 1).
     * @return z such that Phi(z) = p.
     * @throws std::domain_error if p <= 0 or p >= 1
     */
    inline double compute_normal_quantile(double p)
    {
      if (p <= 0.0 || p >= 1.0)
	throw std::domain_error("compute_normal_quantile: probability p must be in (0, 1)");

      if (p == 0.5)
	return 0.0;

      static constexpr double a1 = -3.969683028665376e+01;
      static constexpr double a2 =  2.209460984245205e+02;
      static constexpr double a3 = -2.759285104469687e+02;
      static constexpr double a4 =  1.383577518672690e+02;
      static constexpr double a5 = -3.066479806614716e+01;
      static constexpr double a6 =  2.506628277459239e+00;

      static constexpr double b1 = -5.447609879822406e+01;
      static constexpr double b2 =  1.615858368580409e+02;
      static constexpr double b3 = -1.556989798598866e+02;
      static constexpr double b4 =  6.680131188771972e+01;
      static constexpr double b5 = -1.328068155288572e+01;

      static constexpr double c1 = -7.784894002430226e-03;
      static constexpr double c2 = -3.223964580411365e-01;
      static constexpr double c3 = -2.400758277161838e+00;
      static constexpr double c4 = -2.549732539343734e+00;
      static constexpr double c5 =  4.374664141464968e+00;
      static constexpr double c6 =  2.938163982698783e+00;

      static constexpr double d1 =  7.784695709041462e-03;
      static constexpr double d2 =  3.224671290700398e-01;
      static constexpr double d3 =  2.445134137142996e+00;
      static constexpr double d4 =  3.754408661907416e+00;

      static constexpr double p_low  = 0.02425;
      static constexpr double p_high = 1.0 - p_low;

      if (p < p_low)
	{
	  const double q = std::sqrt(-2.0 * std::log(p));
	  return (((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
	    ((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
	}

      if (p <= p_high)
	{
	  const double q = p - 0.5;
	  const double r = q * q;
	  return (((((a1 * r + a2) * r + a3) * r + a4) * r + a5) * r + a6) * q /
	    (((((b1 * r + b2) * r + b3) * r + b4) * r + b5) * r + 1.0);
	}

      const double q = std::sqrt(-2.0 * std::log(1.0 - p));
      return -(((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
	((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
    }

    // Phi(z) = 0.5 * (1 + erf(z / sqrt(2)))
    inline double compute_normal_cdf(double z) noexcept
    {
      constexpr double INV_SQRT2 = 0.7071067811865475244;
      return 0.5 * (1.0 + std::erf(z * INV_SQRT2));
    }
  } // namespace detail

  /**
   * @struct NormalDistribution
   * @brief Standard normal N(0,1) helpers used by the BCa interval and the
   *        t-based return summaries.
   */
  struct NormalDistribution
  {
    static inline double standardNormalCdf(double x) noexcept
    {
      return detail::compute_normal_cdf(x);
    }

    /**
     * @brief Inverse of the standard normal CDF.
     *
     * Returns -infinity for p <= 0 and +infinity for p >= 1 instead of
     * throwing, so callers that clamp their probabilities never see an
     * exception from this path.
     */
    static inline double inverseNormalCdf(double p) noexcept
    {
      if (p <= 0.0 || std::isnan(p))
	return -std::numeric_limits<double>::infinity();
      if (p >= 1.0)
	return std::numeric_limits<double>::infinity();

      // In range, so compute_normal_quantile cannot throw.
      return detail::compute_normal_quantile(p);
    }

    /**
     * @brief Two-sided critical value: z such that P(-z < Z < z) = confidence_level.
     *
     * @return +infinity if confidence_level is not in (0, 1).
     */
    static inline double criticalValue(double confidence_level) noexcept
    {
      if (confidence_level <= 0.0 || confidence_level >= 1.0)
	return std::numeric_limits<double>::infinity();

      const double alpha = 1.0 - confidence_level;
      return inverseNormalCdf(1.0 - alpha / 2.0);
    }
  };
} // namespace oosvalidator
