#pragma once

#include "order.hpp"
#include "types.hpp"

#include <array>

namespace settlemill {

// Fill-order calldata layout (every word 32 bytes, big-endian):
//
//   offset  size  field
//   0       4     selector = keccak256(kFillOrderSignature)[0..4)
//   4       32    senderAddress        (address, left-padded with zeros)
//   36      32    makerAddress
//   68      32    takerAddress
//   100     32    makerAssetAddress
//   132     32    takerAssetAddress
//   164     32    feeRecipientAddress
//   196     32    makerAssetAmount
//   228     32    takerAssetAmount
//   260     32    makerFeeAmount
//   292     32    takerFeeAmount
//   324     32    expirationTimeSeconds
//   356     32    salt
//   388     32    takerAssetFillAmount
//   420     32    signature length (must be 65)
//   452     65    signature r || s || v
//
// Nothing may follow the signature.

using Selector = std::array<uint8_t, 4>;

inline constexpr const char* kFillOrderSignature =
    "fillOrder(address,address,address,address,address,address,uint256,uint256,uint256,uint256,uint256,uint256,"
    "uint256,bytes)";

inline constexpr size_t kSelectorSize = 4;
inline constexpr size_t kFillOrderHeadSize = kSelectorSize + 14 * 32; // Through the signature length word
inline constexpr size_t kFillOrderPayloadSize = kFillOrderHeadSize + 65;

enum class PayloadKind : uint8_t { FillOrder = 1, Unsupported = 2 };

struct FillOrderCall {
    Order order;
    Amount takerAssetFillAmount;
    Signature signature;
};

[[nodiscard]] const Selector& fillOrderSelector();

// Classifies by selector only; payloads shorter than a selector are Unsupported
[[nodiscard]] PayloadKind payloadKind(const Bytes& payload);

// Throws ExchangeError(MalformedCalldata) on any deviation from the layout above
[[nodiscard]] FillOrderCall decodeFillOrderArgs(const Bytes& payload);

[[nodiscard]] Bytes encodeFillOrderCall(const FillOrderCall& call);

} // namespace settlemill
