// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//
// Percentile, BCa (bias-corrected and accelerated) and pivot bootstrap
// confidence bounds for an arbitrary scalar statistic of an i.i.d. sample.

#ifndef __BOOTSTRAP_CONFIDENCE_H
#define __BOOTSTRAP_CONFIDENCE_H

#include <vector>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <array>

#include "RngUtils.h"
#include "BootstrapTypes.h"
#include "OrderStatistics.h"
#include "NormalDistribution.h"
#include "PerformanceCriteria.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"

namespace oosvalidator
{
  /**
   * @brief Bootstrap confidence bounds at tail masses 2.5%, 5% and 10%.
   *
   * Each call draws nboot resamples of size n with replacement from the
   * sample, evaluates the statistic on every resample and sorts the results.
   * Bounds are then read off the sorted distribution:
   *
   *  - Percentile: k = max(0, floor(q*(nboot+1)) - 1), lower = sorted[k],
   *    upper = sorted[nboot-1-k].
   *  - BCa: the same index rule applied to the tail masses Phi(z0 + (z0+z)/(1-a(z0+z)))
   *    where z0 is the bias correction and a the jackknife acceleration.
   *  - Pivot: lower = 2*theta - upper_pct, upper = 2*theta - lower_pct.
   *
   * Reproducibility: one 64-bit seed per replicate is pulled serially from the
   * caller's generator before the replicates are fanned out, and every
   * replicate resamples from its own engine seeded with that value. The
   * resulting bounds are therefore bit-identical for a given seed no matter
   * which Executor runs the replicates.
   *
   * Samples with fewer than two observations have no meaningful interval:
   * every bound equals the statistic of the sample.
   *
   * @tparam Executor concurrency executor used to fan out replicates.
   * @tparam Engine   per-replicate engine type.
   */
  template <class Executor = concurrency::SingleThreadExecutor,
	    class Engine = std::mt19937_64>
  class BootstrapConfidence
  {
  public:
    explicit BootstrapConfidence(std::size_t nboot)
      : BootstrapConfidence(nboot, std::make_shared<Executor>())
    {}

    BootstrapConfidence(std::size_t nboot, std::shared_ptr<Executor> executor)
      : m_nboot(nboot),
	m_exec(std::move(executor)),
	m_chunkHint(0)
    {
      if (m_nboot == 0)
	throw std::invalid_argument("BootstrapConfidence: nboot must be at least 1");
      if (m_nboot > std::numeric_limits<uint32_t>::max())
	throw std::invalid_argument("BootstrapConfidence: nboot is too large");
      if (!m_exec)
	throw std::invalid_argument("BootstrapConfidence: executor must not be null");
    }

    std::size_t nboot() const
    {
      return m_nboot;
    }

    void setChunkSizeHint(uint32_t chunk)
    {
      m_chunkHint = chunk;
    }

    template <class Rng>
    ConfidenceBounds percentile(const std::vector<double>& sample,
				const StatisticFn& statistic,
				Rng& rng) const
    {
      validate(sample, statistic);
      if (sample.size() < 2)
	return ConfidenceBounds::collapsed(statistic(sample));

      const std::vector<double> sorted = bootstrapDistribution(sample, statistic, rng);
      return percentileBounds(sorted);
    }

    template <class Rng>
    ConfidenceBounds bca(const std::vector<double>& sample,
			 const StatisticFn& statistic,
			 Rng& rng) const
    {
      validate(sample, statistic);
      const double theta = statistic(sample);
      if (sample.size() < 2)
	return ConfidenceBounds::collapsed(theta);

      const std::vector<double> sorted = bootstrapDistribution(sample, statistic, rng);
      double z0 = 0.0;
      double accel = 0.0;
      return bcaBounds(sorted, sample, statistic, theta, z0, accel);
    }

    template <class Rng>
    ConfidenceBounds pivot(const std::vector<double>& sample,
			   const StatisticFn& statistic,
			   Rng& rng) const
    {
      validate(sample, statistic);
      const double theta = statistic(sample);
      if (sample.size() < 2)
	return ConfidenceBounds::collapsed(theta);

      const std::vector<double> sorted = bootstrapDistribution(sample, statistic, rng);
      return pivotBounds(percentileBounds(sorted), theta);
    }

    template <class Rng>
    ConfidenceBounds compute(const std::vector<double>& sample,
			     const StatisticFn& statistic,
			     BootstrapMethod method,
			     Rng& rng) const
    {
      switch (method)
	{
	case BootstrapMethod::Percentile:
	  return percentile(sample, statistic, rng);
	case BootstrapMethod::BCa:
	  return bca(sample, statistic, rng);
	case BootstrapMethod::Pivot:
	  return pivot(sample, statistic, rng);
	}

      throw std::invalid_argument("BootstrapConfidence::compute: unknown method");
    }

    /**
     * @brief Percentile, BCa and pivot bounds from a single bootstrap
     * distribution, plus the point estimate and the BCa constants.
     */
    template <class Rng>
    BootstrapReport computeAll(const std::vector<double>& sample,
			       const StatisticFn& statistic,
			       Rng& rng) const
    {
      validate(sample, statistic);

      BootstrapReport report;
      report.statistic = statistic(sample);
      report.sampleSize = sample.size();
      report.nboot = m_nboot;

      if (sample.size() < 2)
	{
	  report.percentile = ConfidenceBounds::collapsed(report.statistic);
	  report.bca = report.percentile;
	  report.pivot = report.percentile;
	  return report;
	}

      const std::vector<double> sorted = bootstrapDistribution(sample, statistic, rng);
      report.percentile = percentileBounds(sorted);
      report.pivot = pivotBounds(report.percentile, report.statistic);
      report.bca = bcaBounds(sorted, sample, statistic, report.statistic,
			     report.z0, report.acceleration);
      return report;
    }

    /**
     * @brief Jackknife estimate of the BCa acceleration constant.
     *
     * Each leave-one-out value is formed by copying the last case into slot
     * i and evaluating the statistic on the first n-1 cases. For i < n-1 the
     * original last case is then outside the evaluated range, and for i = n-1
     * the slot is unchanged, so every evaluation sees exactly the sample
     * without case i. Statistics that depend on case order (none of the
     * criteria shipped here do) see the last case moved into position i.
     *
     * a = sum(d^3) / (6 * (sum(d^2))^1.5 + 1e-60), d = mean(theta_i) - theta_i
     */
    static double jackknifeAcceleration(const std::vector<double>& sample,
					const StatisticFn& statistic)
    {
      const std::size_t n = sample.size();
      if (n < 2)
	return 0.0;

      std::vector<double> x(sample);
      std::vector<double> thetaI(n);
      const double xlast = x[n - 1];
      double thetaDot = 0.0;

      for (std::size_t i = 0; i < n; ++i)
	{
	  const double xtemp = x[i];
	  x[i] = xlast;
	  const std::vector<double> loo(x.begin(), x.begin() + (n - 1));
	  thetaI[i] = statistic(loo);
	  thetaDot += thetaI[i];
	  x[i] = xtemp;
	}

      thetaDot /= static_cast<double>(n);

      double numer = 0.0;
      double denom = 0.0;
      for (double t : thetaI)
	{
	  const double d = thetaDot - t;
	  const double d2 = d * d;
	  denom += d2;
	  numer += d2 * d;
	}

      denom = std::sqrt(denom);
      denom = denom * denom * denom;
      return numer / (6.0 * denom + 1.0e-60);
    }

  private:
    static void validate(const std::vector<double>& sample, const StatisticFn& statistic)
    {
      if (!statistic)
	throw std::invalid_argument("BootstrapConfidence: statistic function is empty");
      if (sample.empty())
	throw std::invalid_argument("BootstrapConfidence: sample is empty");
    }

    /**
     * @brief nboot statistic values from resamples of the sample, sorted
     * ascending. Seeds are drawn from rng before any replicate runs.
     */
    template <class Rng>
    std::vector<double> bootstrapDistribution(const std::vector<double>& sample,
					      const StatisticFn& statistic,
					      Rng& rng) const
    {
      const std::size_t n = sample.size();

      std::vector<uint64_t> seeds(m_nboot);
      for (auto& s : seeds)
	s = rng_utils::get_random_value(rng);

      std::vector<double> values(m_nboot);

      concurrency::parallel_for_chunked(static_cast<uint32_t>(m_nboot), *m_exec,
	[&](uint32_t b) {
	  Engine eng = rng_utils::make_seeded_engine<Engine>(seeds[b]);
	  std::vector<double> resample(n);
	  for (std::size_t i = 0; i < n; ++i)
	    resample[i] = sample[rng_utils::get_random_index(eng, n)];
	  values[b] = statistic(resample);
	},
	m_chunkHint);

      order_statistics::sortAscending(values);
      return values;
    }

    static ConfidenceBounds percentileBounds(const std::vector<double>& sorted)
    {
      ConfidenceBounds bounds;
      for (TailMass tail : allTails())
	{
	  const double q = tailMassValue(tail);
	  bounds.set(tail,
		     order_statistics::lowerQuantile(sorted, q),
		     order_statistics::upperQuantile(sorted, q));
	}
      return bounds;
    }

    static ConfidenceBounds pivotBounds(const ConfidenceBounds& pct, double theta)
    {
      ConfidenceBounds bounds;
      for (TailMass tail : allTails())
	bounds.set(tail,
		   2.0 * theta - pct.upper(tail),
		   2.0 * theta - pct.lower(tail));
      return bounds;
    }

    ConfidenceBounds bcaBounds(const std::vector<double>& sorted,
			       const std::vector<double>& sample,
			       const StatisticFn& statistic,
			       double theta,
			       double& z0Out,
			       double& accelOut) const
    {
      z0Out = 0.0;
      accelOut = 0.0;

      // A degenerate distribution reads the same value at every index.
      if (order_statistics::allEqual(sorted))
	return ConfidenceBounds::collapsed(sorted.front());

      const std::size_t nboot = sorted.size();
      std::size_t z0Count = order_statistics::countBelow(sorted, theta);
      if (z0Count >= nboot)
	z0Count = nboot - 1;
      if (z0Count == 0)
	z0Count = 1;

      double z0 = NormalDistribution::inverseNormalCdf(static_cast<double>(z0Count) /
						       static_cast<double>(nboot));
      if (!std::isfinite(z0))
	z0 = 0.0;

      const double accel = jackknifeAcceleration(sample, statistic);

      ConfidenceBounds bounds;
      for (TailMass tail : allTails())
	{
	  const double alpha = tailMassValue(tail);
	  const double zlo = NormalDistribution::inverseNormalCdf(alpha);
	  const double zhi = NormalDistribution::inverseNormalCdf(1.0 - alpha);

	  const double alo = NormalDistribution::standardNormalCdf(z0 + (z0 + zlo) / (1.0 - accel * (z0 + zlo)));
	  const double ahi = NormalDistribution::standardNormalCdf(z0 + (z0 + zhi) / (1.0 - accel * (z0 + zhi)));

	  const std::size_t kLo = order_statistics::lowerTailIndex(alo, nboot);
	  const std::size_t kHi = order_statistics::lowerTailIndex(1.0 - ahi, nboot);
	  bounds.set(tail, sorted[kLo], sorted[nboot - 1 - kHi]);
	}

      z0Out = z0;
      accelOut = accel;
      return bounds;
    }

    static const std::array<TailMass, 3>& allTails()
    {
      static const std::array<TailMass, 3> tails = { TailMass::Tail2p5, TailMass::Tail5, TailMass::Tail10 };
      return tails;
    }

  private:
    std::size_t               m_nboot;
    std::shared_ptr<Executor> m_exec;
    uint32_t                  m_chunkHint;
  };

  /**
   * @brief One-shot bootstrap bounds on the calling thread.
   *
   * The caller is expected to reject nboot < 10 before calling; only
   * nboot == 0 is refused here.
   */
  template <class Rng>
  inline ConfidenceBounds bootstrapConfidence(const std::vector<double>& sample,
					      const StatisticFn& statistic,
					      std::size_t nboot,
					      BootstrapMethod method,
					      Rng& rng)
  {
    BootstrapConfidence<> engine(nboot);
    return engine.compute(sample, statistic, method, rng);
  }
}

#endif
