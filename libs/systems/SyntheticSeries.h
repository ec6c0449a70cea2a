#ifndef __SYNTHETIC_SERIES_H
#define __SYNTHETIC_SERIES_H 1

#include <vector>
#include <cstddef>
#include "RngUtils.h"

namespace oosvalidator
{
  namespace systems
  {
    /**
     * @brief Random walk in log price with a slowly reversing drift.
     *
     * x[0] = 0 and x[i] = x[i-1] + trend + u1 + u2 - u3 - u4 with the u's
     * uniform on [0,1). The sign of trend flips on every bar whose index is a
     * multiple of 50, so a trend-following system has something to find when
     * trend != 0 and nothing when trend == 0.
     *
     * @param n     number of prices
     * @param trend per-bar drift magnitude
     * @param rng   any engine or adaptor accepted by rng_utils
     */
    template <class Rng>
    std::vector<double> generateTrendingLogPrices(std::size_t n, double trend, Rng& rng)
    {
      std::vector<double> x(n, 0.0);
      for (std::size_t i = 1; i < n; ++i)
	{
	  if (i % 50 == 0)
	    trend = -trend;

	  // keep the four draws in sequence so the stream order is fixed
	  const double u1 = rng_utils::get_random_uniform_01(rng);
	  const double u2 = rng_utils::get_random_uniform_01(rng);
	  const double u3 = rng_utils::get_random_uniform_01(rng);
	  const double u4 = rng_utils::get_random_uniform_01(rng);
	  x[i] = x[i - 1] + trend + u1 + u2 - u3 - u4;
	}

      return x;
    }
  }
}

#endif
