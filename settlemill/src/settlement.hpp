#pragma once

#include "order.hpp"
#include "types.hpp"

#include <optional>

namespace settlemill {

struct SettlementResult {
    Amount makerAssetFilledAmount;
    Amount makerFeePaid;
    Amount takerFeePaid;
};

// Moves value for a fill: the proportional maker asset from maker to taker,
// takerAssetFilledAmount from taker to maker, and both fees to the fee recipient.
class SettlementCollaborator {
public:
    virtual ~SettlementCollaborator() = default;

    // std::nullopt when any transfer cannot complete; nothing may have moved in that case
    virtual std::optional<SettlementResult> settle(const Order& order, const Address& takerAddress,
                                                   const Amount& takerAssetFilledAmount) = 0;

    // Undoes an earlier successful settle() when its invocation is rolled back.
    // Reverts arrive in reverse order, so everything the settlement credited is still in place.
    virtual void revert(const Order& order, const Address& takerAddress, const Amount& takerAssetFilledAmount,
                        const SettlementResult& result) = 0;
};

} // namespace settlemill
