#include "fillledger.hpp"

#include "errors.hpp"
#include "hex.hpp"

namespace settlemill {

FillLedger::Savepoint::Savepoint(FillLedger& ledger)
    : m_ledger(ledger), m_mark(ledger.m_undoLog.size()), m_committed(false)
{
    ++m_ledger.m_openSavepoints;
}

FillLedger::Savepoint::~Savepoint()
{
    if (!m_committed) {
        m_ledger.rollbackTo(m_mark);
    }
    if (--m_ledger.m_openSavepoints == 0) {
        m_ledger.m_undoLog.clear();
        m_ledger.m_commitActions.clear();
    }
}

void FillLedger::Savepoint::commit()
{
    m_committed = true;
    if (m_ledger.m_openSavepoints != 1) {
        return;
    }

    // Nothing after this point can roll back
    m_ledger.m_undoLog.clear();
    while (!m_ledger.m_commitActions.empty()) {
        std::vector<std::function<void()>> actions;
        actions.swap(m_ledger.m_commitActions);
        for (const auto& action : actions) {
            action();
        }
    }
}

Amount FillLedger::filledAmount(const OrderHash& orderHash) const
{
    const Entry* entry = findEntry(orderHash);
    return entry != nullptr ? entry->filled : Amount(0);
}

Amount FillLedger::cancelledAmount(const OrderHash& orderHash) const
{
    const Entry* entry = findEntry(orderHash);
    return entry != nullptr ? entry->cancelled : Amount(0);
}

Amount FillLedger::getUnavailableAmount(const OrderHash& orderHash) const
{
    const Entry* entry = findEntry(orderHash);
    if (entry == nullptr) {
        return 0;
    }
    return entry->filled + entry->cancelled;
}

void FillLedger::recordFill(const OrderHash& orderHash, const Amount& amount)
{
    Entry& entry = mutableEntry(orderHash);
    entry.filled += amount;
}

void FillLedger::recordCancel(const OrderHash& orderHash, const Amount& amount)
{
    Entry& entry = mutableEntry(orderHash);
    entry.cancelled += amount;
}

Uint256 FillLedger::makerEpoch(const Address& maker) const
{
    auto iterator = m_makerEpochs.find(maker);
    if (iterator == m_makerEpochs.end()) {
        return 0;
    }
    return iterator->second;
}

void FillLedger::bumpMakerEpoch(const Address& maker, const Uint256& newEpoch)
{
    Uint256 current = makerEpoch(maker);
    if (newEpoch <= current) {
        throw ExchangeError(ErrorCode::EpochNotIncreasing, "epoch for maker " + hex::encode(maker) + " is already " +
                                                               current.str() + ", cannot move to " + newEpoch.str());
    }

    auto [iterator, inserted] = m_makerEpochs.try_emplace(maker, newEpoch);
    if (inserted) {
        journal([this, maker] { m_makerEpochs.erase(maker); });
    } else {
        journal([this, maker, current] { m_makerEpochs[maker] = current; });
        iterator->second = newEpoch;
    }
}

bool FillLedger::isTransactionExecuted(const Hash256& transactionHash) const
{
    return m_executedTransactions.count(transactionHash) != 0;
}

void FillLedger::markTransactionExecuted(const Hash256& transactionHash)
{
    auto [iterator, inserted] = m_executedTransactions.insert(transactionHash);
    if (!inserted) {
        throw ExchangeError(ErrorCode::TransactionReplayed, "transaction " + hex::encode(transactionHash) +
                                                                " was already executed");
    }
    journal([this, transactionHash] { m_executedTransactions.erase(transactionHash); });
}

const FillLedger::Entry* FillLedger::findEntry(const OrderHash& orderHash) const
{
    auto iterator = m_entries.find(orderHash);
    if (iterator == m_entries.end()) {
        return nullptr;
    }
    return &iterator->second;
}

FillLedger::Entry& FillLedger::mutableEntry(const OrderHash& orderHash)
{
    auto [iterator, inserted] = m_entries.try_emplace(orderHash, Entry{0, 0});
    if (inserted) {
        journal([this, orderHash] { m_entries.erase(orderHash); });
    } else {
        Entry previous = iterator->second;
        journal([this, orderHash, previous] { m_entries[orderHash] = previous; });
    }
    return iterator->second;
}

void FillLedger::onCommit(std::function<void()> action)
{
    if (m_openSavepoints == 0) {
        action();
        return;
    }
    m_commitActions.push_back(std::move(action));
    journal([this] { m_commitActions.pop_back(); });
}

void FillLedger::journal(std::function<void()> undo)
{
    if (m_openSavepoints > 0) {
        m_undoLog.push_back(std::move(undo));
    }
}

void FillLedger::rollbackTo(size_t mark)
{
    while (m_undoLog.size() > mark) {
        m_undoLog.back()();
        m_undoLog.pop_back();
    }
}

} // namespace settlemill
