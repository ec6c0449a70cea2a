#include "OutputUtils.h"
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace oosvalidator
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string formatScaled(double value, double scale, int precision)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << std::setw(10) << scale * value;
    return os.str();
}

std::string formatBounds(const ConfidenceBounds& bounds, double scale)
{
    std::ostringstream os;
    os << formatScaled(bounds.lower2p5, scale) << formatScaled(bounds.upper2p5, scale) << "  |"
       << formatScaled(bounds.lower5, scale) << formatScaled(bounds.upper5, scale) << "  |"
       << formatScaled(bounds.lower10, scale) << formatScaled(bounds.upper10, scale);
    return os.str();
}

} // namespace utils
} // namespace oosvalidator
