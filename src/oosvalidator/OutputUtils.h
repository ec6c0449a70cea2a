#pragma once

#include <streambuf>
#include <ostream>
#include <string>
#include "BootstrapTypes.h"

namespace oosvalidator
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to send the driver's report to the console and to the log file at
 * the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Format a value scaled for display with a fixed number of decimals
 */
std::string formatScaled(double value, double scale, int precision = 4);

/**
 * @brief One line "lower2.5 upper2.5 | lower5 upper5 | lower10 upper10"
 */
std::string formatBounds(const ConfidenceBounds& bounds, double scale);

} // namespace utils
} // namespace oosvalidator
