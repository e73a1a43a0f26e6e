#pragma once

#include "order.hpp"
#include "types.hpp"

namespace settlemill {

// Canonical packed form: venue, the six addresses, then the six integers
// as 32-byte big-endian words, in declared field order.
[[nodiscard]] Bytes serializeOrder(const Order& order, const Address& venue);

// Order identity. Binding the venue prevents replay across exchange instances.
[[nodiscard]] OrderHash hashOrder(const Order& order, const Address& venue);

// keccak256("\x19Ethereum Signed Message:\n32" || hash), the digest signers actually sign
[[nodiscard]] Hash256 personalMessageDigest(const Hash256& hash);

} // namespace settlemill
