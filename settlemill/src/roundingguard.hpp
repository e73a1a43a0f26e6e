#pragma once

#include "types.hpp"

namespace settlemill {

// Products are taken in 512 bits, so numerator * target never overflows.
// A zero denominator throws ExchangeError(InvalidAmount).

// True when floor(numerator * target / denominator) truncates away more than 0.1%
// of the exact value (error ratio in millionths strictly above 1000).
[[nodiscard]] bool hasRoundingError(const Amount& numerator, const Amount& denominator, const Amount& target);

// floor(numerator * target / denominator); throws ArithmeticOverflow if the result exceeds 256 bits
[[nodiscard]] Amount getPartialAmount(const Amount& numerator, const Amount& denominator, const Amount& target);

} // namespace settlemill
