#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <boost/algorithm/string/case_conv.hpp>
#include "ValidationException.h"

namespace oosvalidator
{
  /**
   * @brief The interval constructions offered by BootstrapConfidence.
   *
   * Percentile: order statistics of the bootstrap distribution.
   * BCa: percentile levels shifted by the bias correction z0 and the
   *      jackknife acceleration a.
   * Pivot: percentile bounds reflected around the point estimate.
   */
  enum class BootstrapMethod
    {
      Percentile,
      BCa,
      Pivot
    };

  /**
   * @brief Nominal tail mass of a one-sided bound. A two-sided interval built
   * from lower(Tail5) and upper(Tail5) has 90% nominal coverage.
   */
  enum class TailMass
    {
      Tail2p5,
      Tail5,
      Tail10
    };

  inline double tailMassValue(TailMass tail)
  {
    switch (tail)
      {
      case TailMass::Tail2p5:
	return 0.025;
      case TailMass::Tail5:
	return 0.05;
      case TailMass::Tail10:
	return 0.10;
      }

    throw std::invalid_argument("tailMassValue: unknown tail mass");
  }

  /**
   * @brief Lower and upper bounds at the three nominal tail masses.
   *
   * lower <= statistic <= upper holds asymptotically; a single finite run may
   * violate it.
   */
  struct ConfidenceBounds
  {
    double lower2p5 = 0.0;
    double upper2p5 = 0.0;
    double lower5 = 0.0;
    double upper5 = 0.0;
    double lower10 = 0.0;
    double upper10 = 0.0;

    double lower(TailMass tail) const
    {
      switch (tail)
	{
	case TailMass::Tail2p5:
	  return lower2p5;
	case TailMass::Tail5:
	  return lower5;
	case TailMass::Tail10:
	  return lower10;
	}
      throw std::invalid_argument("ConfidenceBounds::lower: unknown tail mass");
    }

    double upper(TailMass tail) const
    {
      switch (tail)
	{
	case TailMass::Tail2p5:
	  return upper2p5;
	case TailMass::Tail5:
	  return upper5;
	case TailMass::Tail10:
	  return upper10;
	}
      throw std::invalid_argument("ConfidenceBounds::upper: unknown tail mass");
    }

    void set(TailMass tail, double lo, double hi)
    {
      switch (tail)
	{
	case TailMass::Tail2p5:
	  lower2p5 = lo;
	  upper2p5 = hi;
	  return;
	case TailMass::Tail5:
	  lower5 = lo;
	  upper5 = hi;
	  return;
	case TailMass::Tail10:
	  lower10 = lo;
	  upper10 = hi;
	  return;
	}
      throw std::invalid_argument("ConfidenceBounds::set: unknown tail mass");
    }

    // Every bound equal to value
    static ConfidenceBounds collapsed(double value)
    {
      ConfidenceBounds b;
      b.lower2p5 = b.upper2p5 = value;
      b.lower5 = b.upper5 = value;
      b.lower10 = b.upper10 = value;
      return b;
    }

    bool operator==(const ConfidenceBounds& rhs) const
    {
      return lower2p5 == rhs.lower2p5 && upper2p5 == rhs.upper2p5 &&
	lower5 == rhs.lower5 && upper5 == rhs.upper5 &&
	lower10 == rhs.lower10 && upper10 == rhs.upper10;
    }

    bool operator!=(const ConfidenceBounds& rhs) const
    {
      return !(*this == rhs);
    }
  };

  /**
   * @brief All three interval types from one set of resamples.
   */
  struct BootstrapReport
  {
    double           statistic = 0.0;  // statistic on the full sample
    std::size_t      sampleSize = 0;
    std::size_t      nboot = 0;
    double           z0 = 0.0;         // BCa bias correction
    double           acceleration = 0.0;
    ConfidenceBounds percentile;
    ConfidenceBounds bca;
    ConfidenceBounds pivot;

    const ConfidenceBounds& bounds(BootstrapMethod method) const
    {
      switch (method)
	{
	case BootstrapMethod::Percentile:
	  return percentile;
	case BootstrapMethod::BCa:
	  return bca;
	case BootstrapMethod::Pivot:
	  return pivot;
	}
      throw std::invalid_argument("BootstrapReport::bounds: unknown method");
    }
  };

  inline std::string bootstrapMethodName(BootstrapMethod method)
  {
    switch (method)
      {
      case BootstrapMethod::Percentile:
	return "percentile";
      case BootstrapMethod::BCa:
	return "bca";
      case BootstrapMethod::Pivot:
	return "pivot";
      }
    return "unknown";
  }

  inline BootstrapMethod bootstrapMethodFromString(const std::string& name)
  {
    const std::string key = boost::algorithm::to_lower_copy(name);

    if (key == "percentile" || key == "pctile")
      return BootstrapMethod::Percentile;
    if (key == "bca")
      return BootstrapMethod::BCa;
    if (key == "pivot")
      return BootstrapMethod::Pivot;

    throw ConfigurationException("Unknown bootstrap method '" + name + "' (expected percentile, bca or pivot)");
  }
}
