#pragma once

#include "types.hpp"

namespace settlemill {

// ECDSA signature over secp256k1; v is 27 or 28 (values below 27 are normalized)
struct Signature {
    uint8_t v;
    Hash256 r;
    Hash256 s;
};

// Signed off-chain, settled against the fill ledger. Field order here is the
// declared order used by both the order hash and the fill-order calldata.
struct Order {
    Address senderAddress;        // Relayer allowed to submit (null = anyone)
    Address makerAddress;         // Signer and owner of the maker asset
    Address takerAddress;         // Counterparty restriction (null = anyone)
    Address makerAssetAddress;    // Token the maker gives
    Address takerAssetAddress;    // Token the maker receives
    Address feeRecipientAddress;  // Receives both fees (null = no fees)
    Amount makerAssetAmount;      // Maker asset offered in total
    Amount takerAssetAmount;      // Taker asset requested in total
    Amount makerFeeAmount;        // Maker fee for a complete fill
    Amount takerFeeAmount;        // Taker fee for a complete fill
    Uint256 expirationTimeSeconds;
    Uint256 salt; // Uniqueness nonce; compared against the maker's cancellation epoch
};

struct SignedOrder {
    Order order;
    Signature signature;
};

struct FillRequest {
    Order order;
    Amount takerAssetFillAmount;
    Signature signature;
};

struct CancelRequest {
    Order order;
    Amount takerAssetCancelAmount;
};

} // namespace settlemill
