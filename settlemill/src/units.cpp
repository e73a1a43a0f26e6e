#include "units.hpp"

#include "abicodec.hpp"
#include "errors.hpp"

#include <random>
#include <stdexcept>

namespace settlemill {

namespace {

Amount powerOfTen(unsigned exponent)
{
    try {
        return boost::multiprecision::pow(Amount(10), exponent);
    } catch (const std::overflow_error&) {
        throw ExchangeError(ErrorCode::ArithmeticOverflow, "10^" + std::to_string(exponent) + " exceeds 256 bits");
    }
}

} // namespace

Amount toUnitAmount(const Amount& baseUnitAmount, unsigned decimals)
{
    // 10^78 no longer fits; every 256-bit amount is below one such unit
    if (decimals > 77) {
        return 0;
    }
    return baseUnitAmount / powerOfTen(decimals);
}

Amount toBaseUnitAmount(const Amount& unitAmount, unsigned decimals)
{
    try {
        return unitAmount * powerOfTen(decimals);
    } catch (const std::overflow_error& e) {
        throw ExchangeError(ErrorCode::ArithmeticOverflow, e.what());
    }
}

Uint256 generatePseudoRandomSalt()
{
    std::random_device device;
    std::uniform_int_distribution<unsigned> byteDistribution(0, 255);

    Hash256 bytes{};
    for (auto& byte : bytes) {
        byte = static_cast<uint8_t>(byteDistribution(device));
    }
    return abi::decodeUint256(bytes.data());
}

} // namespace settlemill
