#pragma once

#include "types.hpp"

#include <variant>

namespace settlemill {

struct FillEvent {
    Address makerAddress;
    Address takerAddress;
    Address feeRecipientAddress;
    Address makerAssetAddress;
    Address takerAssetAddress;
    Amount makerAssetFilledAmount;
    Amount takerAssetFilledAmount;
    Amount makerFeePaid;
    Amount takerFeePaid;
    OrderHash orderHash;
};

struct CancelEvent {
    Address makerAddress;
    Address feeRecipientAddress;
    Address makerAssetAddress;
    Address takerAssetAddress;
    Amount makerAssetCancelledAmount;
    Amount takerAssetCancelledAmount;
    OrderHash orderHash;
};

struct CancelUpToEvent {
    Address makerAddress;
    Uint256 orderEpoch; // Orders with a lower salt are now cancelled
};

// Invocation completed but did nothing
enum class SoftFailure : uint8_t { OrderExpired = 1, OrderUnfillable = 2, RoundingErrorTooLarge = 3 };

struct SoftFailureEvent {
    SoftFailure kind;
    OrderHash orderHash;
    Amount requestedAmount; // Taker amount asked to fill or cancel
};

using ExchangeEvent = std::variant<FillEvent, CancelEvent, CancelUpToEvent, SoftFailureEvent>;

[[nodiscard]] inline const char* toString(SoftFailure kind)
{
    switch (kind) {
    case SoftFailure::OrderExpired:
        return "OrderExpired";
    case SoftFailure::OrderUnfillable:
        return "OrderUnfillable";
    case SoftFailure::RoundingErrorTooLarge:
        return "RoundingErrorTooLarge";
    }
    return "Unknown";
}

} // namespace settlemill
