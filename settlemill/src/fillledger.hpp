#pragma once

#include "types.hpp"

#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace settlemill {

// Authoritative record of filled and cancelled taker amounts per order hash,
// per-maker cancellation epochs and executed meta-transaction hashes.
// All counters only grow. Writes made while a Savepoint is open are journaled
// and undone if that savepoint is destroyed without commit().
class FillLedger {
public:
    // Scoped transaction; savepoints nest and only the outermost one discards the journal
    class Savepoint {
    public:
        explicit Savepoint(FillLedger& ledger);
        ~Savepoint();

        Savepoint(const Savepoint&) = delete;
        Savepoint& operator=(const Savepoint&) = delete;

        // Committing the outermost savepoint runs the registered commit actions
        void commit();

    private:
        FillLedger& m_ledger;
        size_t m_mark;
        bool m_committed;
    };

    FillLedger() = default;

    // Per-order counters (zero for orders never referenced)
    [[nodiscard]] Amount filledAmount(const OrderHash& orderHash) const;
    [[nodiscard]] Amount cancelledAmount(const OrderHash& orderHash) const;
    [[nodiscard]] Amount getUnavailableAmount(const OrderHash& orderHash) const; // filled + cancelled

    // Callers must have checked amount <= remaining
    void recordFill(const OrderHash& orderHash, const Amount& amount);
    void recordCancel(const OrderHash& orderHash, const Amount& amount);

    // Orders with salt below the maker's epoch are cancelled
    [[nodiscard]] Uint256 makerEpoch(const Address& maker) const;

    // Throws ExchangeError(EpochNotIncreasing) unless newEpoch > current epoch
    void bumpMakerEpoch(const Address& maker, const Uint256& newEpoch);

    [[nodiscard]] bool isTransactionExecuted(const Hash256& transactionHash) const;

    // Throws ExchangeError(TransactionReplayed) if already present
    void markTransactionExecuted(const Hash256& transactionHash);

    // Registers an undo action for state kept outside the ledger; runs only if the
    // enclosing savepoint rolls back, and is dropped when no savepoint is open
    void onRollback(std::function<void()> undo) { journal(std::move(undo)); }

    // Runs action when the outermost open savepoint commits, or at once when none is
    // open. An action registered under a savepoint that rolls back is dropped.
    void onCommit(std::function<void()> action);

    // Statistics
    [[nodiscard]] size_t entryCount() const { return m_entries.size(); }
    [[nodiscard]] size_t executedTransactionCount() const { return m_executedTransactions.size(); }

private:
    struct Entry {
        Amount filled;
        Amount cancelled;
    };

    [[nodiscard]] const Entry* findEntry(const OrderHash& orderHash) const;

    // Creates the entry lazily and journals its previous state
    Entry& mutableEntry(const OrderHash& orderHash);

    void journal(std::function<void()> undo);
    void rollbackTo(size_t mark);

    std::unordered_map<OrderHash, Entry, ByteArrayHash> m_entries;
    std::unordered_map<Address, Uint256, ByteArrayHash> m_makerEpochs;
    std::unordered_set<Hash256, ByteArrayHash> m_executedTransactions;

    std::vector<std::function<void()>> m_undoLog;
    std::vector<std::function<void()>> m_commitActions;
    int m_openSavepoints = 0;
};

} // namespace settlemill
