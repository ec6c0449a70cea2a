#ifndef __VALIDATION_EXCEPTION_H
#define __VALIDATION_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace oosvalidator
{
  /**
   * @brief Raised for invalid geometry or sizing before any computation runs:
   * walk-forward windows that do not fit the series, a CSCV block count that
   * is zero after rounding down to even, or a returns matrix whose size does
   * not match its declared shape.
   */
  class ConfigurationException : public std::invalid_argument
  {
  public:
    ConfigurationException(const std::string msg)
      : std::invalid_argument(msg)
    {}

    ~ConfigurationException()
    {}
  };
}

#endif
