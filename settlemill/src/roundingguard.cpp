#include "roundingguard.hpp"

#include "errors.hpp"

#include <limits>

namespace settlemill {

namespace {

using Wide = boost::multiprecision::uint512_t;

const Wide kErrorScale = 1000000; // Parts per million
const Wide kMaxErrorPpm = 1000;   // 0.1%

void requireDenominator(const Amount& denominator)
{
    if (denominator == 0) {
        throw ExchangeError(ErrorCode::InvalidAmount, "zero denominator in proportional amount");
    }
}

} // namespace

bool hasRoundingError(const Amount& numerator, const Amount& denominator, const Amount& target)
{
    requireDenominator(denominator);

    Wide product = Wide(target) * Wide(numerator);
    Wide remainder = product % Wide(denominator);
    if (remainder == 0) {
        return false;
    }

    // remainder != 0 implies product != 0
    Wide errorPpm = (remainder * kErrorScale) / product;
    return errorPpm > kMaxErrorPpm;
}

Amount getPartialAmount(const Amount& numerator, const Amount& denominator, const Amount& target)
{
    requireDenominator(denominator);

    Wide partial = (Wide(numerator) * Wide(target)) / Wide(denominator);
    if (partial > Wide((std::numeric_limits<Amount>::max)())) {
        throw ExchangeError(ErrorCode::ArithmeticOverflow, "partial amount exceeds 256 bits");
    }
    return static_cast<Amount>(partial);
}

} // namespace settlemill
