#pragma once

#include "types.hpp"

namespace settlemill {

// A unit is 10^decimals base units; conversion down truncates
[[nodiscard]] Amount toUnitAmount(const Amount& baseUnitAmount, unsigned decimals);

// Throws ExchangeError(ArithmeticOverflow) if the result exceeds 256 bits
[[nodiscard]] Amount toBaseUnitAmount(const Amount& unitAmount, unsigned decimals);

// Uniformly random 256-bit salt from std::random_device
[[nodiscard]] Uint256 generatePseudoRandomSalt();

} // namespace settlemill
