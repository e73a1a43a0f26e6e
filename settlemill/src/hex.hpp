#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace settlemill::hex {

// Lowercase, 0x-prefixed
[[nodiscard]] std::string encode(const uint8_t* data, size_t length);
[[nodiscard]] inline std::string encode(const Bytes& data) { return encode(data.data(), data.size()); }

template <size_t N>
[[nodiscard]] std::string encode(const std::array<uint8_t, N>& data)
{
    return encode(data.data(), N);
}

// Accepts an optional 0x prefix and either case; throws std::invalid_argument on bad input
[[nodiscard]] Bytes decode(std::string_view text);

[[nodiscard]] Address toAddress(std::string_view text);
[[nodiscard]] Hash256 toHash(std::string_view text);

// Exactly 0x followed by 64 hex digits
[[nodiscard]] bool isValidOrderHash(std::string_view text);

} // namespace settlemill::hex
