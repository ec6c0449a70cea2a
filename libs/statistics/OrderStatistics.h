#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace oosvalidator
{
  /**
   * @brief Sort-and-index helpers shared by every bootstrap method and the
   * CSCV ranking.
   *
   * The quantile convention is the one used throughout the project for tail
   * mass q over a sorted distribution of size n:
   *
   *     k     = max(0, floor(q * (n + 1)) - 1)
   *     lower = sorted[k]
   *     upper = sorted[n - 1 - k]
   *
   * Indices are clamped into [0, n - 1] so a q close to 1 (possible after the
   * BCa adjustment) never reads past the end.
   */
  namespace order_statistics
  {
    inline void sortAscending(std::vector<double>& values)
    {
      std::sort(values.begin(), values.end());
    }

    // Lower-tail index for tail mass q over n sorted values.
    inline std::size_t lowerTailIndex(double q, std::size_t n)
    {
      if (n == 0)
	throw std::invalid_argument("lowerTailIndex: empty distribution");

      const double scaled = std::floor(q * (static_cast<double>(n) + 1.0)) - 1.0;
      if (!(scaled > 0.0))      // also catches NaN
	return 0;
      if (scaled >= static_cast<double>(n - 1))
	return n - 1;

      return static_cast<std::size_t>(scaled);
    }

    // sorted[k] with k = lowerTailIndex(q, n)
    inline double lowerQuantile(const std::vector<double>& sorted, double q)
    {
      return sorted[lowerTailIndex(q, sorted.size())];
    }

    // sorted[n - 1 - k] with k = lowerTailIndex(q, n)
    inline double upperQuantile(const std::vector<double>& sorted, double q)
    {
      const std::size_t n = sorted.size();
      return sorted[n - 1 - lowerTailIndex(q, n)];
    }

    // Number of values strictly below x; data need not be sorted.
    inline std::size_t countBelow(const std::vector<double>& data, double x)
    {
      return static_cast<std::size_t>(std::count_if(data.begin(), data.end(),
						    [x](double v) { return v < x; }));
    }

    inline bool allEqual(const std::vector<double>& data)
    {
      return std::adjacent_find(data.begin(), data.end(),
				[](double a, double b) { return a != b; }) == data.end();
    }
  }
}
