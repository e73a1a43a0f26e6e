#include "balancesheet.hpp"

#include "roundingguard.hpp"

namespace settlemill {

BalanceSheet::BalanceSheet(Address feeToken) : m_feeToken(feeToken), m_settlementCount(0) {}

void BalanceSheet::deposit(const Address& token, const Address& owner, const Amount& amount)
{
    m_balances[Key{token, owner}] += amount;
}

Amount BalanceSheet::balanceOf(const Address& token, const Address& owner) const
{
    auto iterator = m_balances.find(Key{token, owner});
    if (iterator == m_balances.end()) {
        return 0;
    }
    return iterator->second;
}

std::optional<SettlementResult> BalanceSheet::settle(const Order& order, const Address& takerAddress,
                                                     const Amount& takerAssetFilledAmount)
{
    SettlementResult result{};
    result.makerAssetFilledAmount =
        getPartialAmount(takerAssetFilledAmount, order.takerAssetAmount, order.makerAssetAmount);
    if (!isNullAddress(order.feeRecipientAddress)) {
        result.makerFeePaid = getPartialAmount(takerAssetFilledAmount, order.takerAssetAmount, order.makerFeeAmount);
        result.takerFeePaid = getPartialAmount(takerAssetFilledAmount, order.takerAssetAmount, order.takerFeeAmount);
    }

    if (!apply(transfersFor(order, takerAddress, takerAssetFilledAmount, result))) {
        return std::nullopt;
    }

    ++m_settlementCount;
    return result;
}

void BalanceSheet::revert(const Order& order, const Address& takerAddress, const Amount& takerAssetFilledAmount,
                          const SettlementResult& result)
{
    auto transfers = transfersFor(order, takerAddress, takerAssetFilledAmount, result);
    for (auto it = transfers.rbegin(); it != transfers.rend(); ++it) {
        if (it->amount == 0) {
            continue;
        }
        m_balances[Key{it->token, it->to}] -= it->amount;
        m_balances[Key{it->token, it->from}] += it->amount;
    }
    --m_settlementCount;
}

std::vector<BalanceSheet::Transfer> BalanceSheet::transfersFor(const Order& order, const Address& takerAddress,
                                                               const Amount& takerAssetFilledAmount,
                                                               const SettlementResult& result) const
{
    return {
        {order.makerAssetAddress, order.makerAddress, takerAddress, result.makerAssetFilledAmount},
        {order.takerAssetAddress, takerAddress, order.makerAddress, takerAssetFilledAmount},
        {m_feeToken, order.makerAddress, order.feeRecipientAddress, result.makerFeePaid},
        {m_feeToken, takerAddress, order.feeRecipientAddress, result.takerFeePaid},
    };
}

bool BalanceSheet::apply(const std::vector<Transfer>& transfers)
{
    std::map<Key, Amount> staged;
    auto stagedBalance = [this, &staged](const Address& token, const Address& owner) -> Amount& {
        auto [iterator, inserted] = staged.try_emplace(Key{token, owner}, 0);
        if (inserted) {
            iterator->second = balanceOf(token, owner);
        }
        return iterator->second;
    };

    // All debits first: proceeds of this settlement cannot fund its own debits
    for (const auto& transfer : transfers) {
        if (transfer.amount == 0) {
            continue;
        }
        Amount& balance = stagedBalance(transfer.token, transfer.from);
        if (balance < transfer.amount) {
            return false;
        }
        balance -= transfer.amount;
    }

    // Credits may overflow and throw; nothing is committed until below
    for (const auto& transfer : transfers) {
        if (transfer.amount == 0) {
            continue;
        }
        stagedBalance(transfer.token, transfer.to) += transfer.amount;
    }

    for (const auto& [key, balance] : staged) {
        m_balances[key] = balance;
    }
    return true;
}

} // namespace settlemill
