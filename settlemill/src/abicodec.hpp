#pragma once

#include "order.hpp"
#include "types.hpp"

namespace settlemill::abi {

inline constexpr size_t kWordSize = 32;
inline constexpr size_t kAddressSize = 20;
inline constexpr size_t kSignatureSize = 65; // r(32) || s(32) || v(1)

// 32-byte big-endian
[[nodiscard]] Hash256 encodeUint256(const Uint256& value);
[[nodiscard]] Uint256 decodeUint256(const uint8_t* word);

// Tightly packed: addresses take 20 bytes, integers 32
void appendPacked(Bytes& out, const Address& address);
void appendPacked(Bytes& out, const Uint256& value);

// Word aligned: addresses are left-padded with zeros to 32 bytes
void appendWord(Bytes& out, const Address& address);
void appendWord(Bytes& out, const Uint256& value);

// Returns false when the 12 padding bytes are not zero
[[nodiscard]] bool decodeAddressWord(const uint8_t* word, Address& address);

[[nodiscard]] Bytes encodeSignature(const Signature& signature);

// Throws std::invalid_argument unless exactly 65 bytes
[[nodiscard]] Signature decodeSignature(const Bytes& bytes);

} // namespace settlemill::abi
