#pragma once

#include "settlement.hpp"

#include <map>
#include <utility>
#include <vector>

namespace settlemill {

// In-memory token balances standing in for the ledger host's asset layer.
// A settlement either applies all of its transfers or none.
class BalanceSheet : public SettlementCollaborator {
public:
    // Fees are charged in feeToken, and only when the order names a fee recipient
    explicit BalanceSheet(Address feeToken = kNullAddress);

    void deposit(const Address& token, const Address& owner, const Amount& amount);

    [[nodiscard]] Amount balanceOf(const Address& token, const Address& owner) const;

    std::optional<SettlementResult> settle(const Order& order, const Address& takerAddress,
                                           const Amount& takerAssetFilledAmount) override;

    void revert(const Order& order, const Address& takerAddress, const Amount& takerAssetFilledAmount,
                const SettlementResult& result) override;

    [[nodiscard]] const Address& feeToken() const { return m_feeToken; }
    [[nodiscard]] size_t settlementCount() const { return m_settlementCount; }

private:
    using Key = std::pair<Address, Address>; // (token, owner)

    struct Transfer {
        Address token;
        Address from;
        Address to;
        Amount amount;
    };

    std::vector<Transfer> transfersFor(const Order& order, const Address& takerAddress,
                                       const Amount& takerAssetFilledAmount, const SettlementResult& result) const;

    // Returns false, leaving balances untouched, if any debit is not covered
    bool apply(const std::vector<Transfer>& transfers);

    Address m_feeToken;
    std::map<Key, Amount> m_balances;
    size_t m_settlementCount;
};

} // namespace settlemill
