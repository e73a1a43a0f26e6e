#include "../src/errors.hpp"
#include "../src/fillledger.hpp"
#include "../src/keccak.hpp"
#include "testsigner.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace settlemill;
using testsupport::makeAddress;

class FillLedgerTest : public ::testing::Test {
protected:
    FillLedger ledger;
    OrderHash first = keccak256("first");
    OrderHash second = keccak256("second");
    Address maker = makeAddress(0x01);
};

TEST_F(FillLedgerTest, UnknownOrderIsZero)
{
    EXPECT_EQ(Amount(0), ledger.filledAmount(first));
    EXPECT_EQ(Amount(0), ledger.cancelledAmount(first));
    EXPECT_EQ(Amount(0), ledger.getUnavailableAmount(first));
    EXPECT_EQ(0u, ledger.entryCount());
}

TEST_F(FillLedgerTest, FillsAndCancelsAccumulate)
{
    ledger.recordFill(first, 30);
    ledger.recordFill(first, 20);
    ledger.recordCancel(first, 10);

    EXPECT_EQ(Amount(50), ledger.filledAmount(first));
    EXPECT_EQ(Amount(10), ledger.cancelledAmount(first));
    EXPECT_EQ(Amount(60), ledger.getUnavailableAmount(first));
    EXPECT_EQ(Amount(0), ledger.getUnavailableAmount(second));
    EXPECT_EQ(1u, ledger.entryCount());
}

TEST_F(FillLedgerTest, EpochOnlyIncreases)
{
    EXPECT_EQ(Uint256(0), ledger.makerEpoch(maker));

    ledger.bumpMakerEpoch(maker, 5);
    EXPECT_EQ(Uint256(5), ledger.makerEpoch(maker));

    try {
        ledger.bumpMakerEpoch(maker, 5);
        FAIL() << "Expected ExchangeError";
    } catch (const ExchangeError& e) {
        EXPECT_EQ(ErrorCode::EpochNotIncreasing, e.code());
    }
    EXPECT_THROW(ledger.bumpMakerEpoch(maker, 4), ExchangeError);
    EXPECT_EQ(Uint256(5), ledger.makerEpoch(maker));

    ledger.bumpMakerEpoch(maker, 6);
    EXPECT_EQ(Uint256(6), ledger.makerEpoch(maker));

    // Epochs are per maker
    EXPECT_EQ(Uint256(0), ledger.makerEpoch(makeAddress(0x02)));
}

TEST_F(FillLedgerTest, TransactionsExecuteOnce)
{
    Hash256 tx = keccak256("tx");
    EXPECT_FALSE(ledger.isTransactionExecuted(tx));

    ledger.markTransactionExecuted(tx);
    EXPECT_TRUE(ledger.isTransactionExecuted(tx));
    EXPECT_EQ(1u, ledger.executedTransactionCount());

    try {
        ledger.markTransactionExecuted(tx);
        FAIL() << "Expected ExchangeError";
    } catch (const ExchangeError& e) {
        EXPECT_EQ(ErrorCode::TransactionReplayed, e.code());
    }
}

TEST_F(FillLedgerTest, UncommittedSavepointRollsBack)
{
    ledger.recordFill(first, 10);
    ledger.bumpMakerEpoch(maker, 3);

    {
        FillLedger::Savepoint savepoint(ledger);
        ledger.recordFill(first, 5);
        ledger.recordFill(second, 7);
        ledger.recordCancel(first, 1);
        ledger.bumpMakerEpoch(maker, 9);
        ledger.bumpMakerEpoch(makeAddress(0x02), 1);
        ledger.markTransactionExecuted(keccak256("tx"));
    }

    EXPECT_EQ(Amount(10), ledger.filledAmount(first));
    EXPECT_EQ(Amount(0), ledger.cancelledAmount(first));
    EXPECT_EQ(Amount(0), ledger.getUnavailableAmount(second));
    EXPECT_EQ(1u, ledger.entryCount());
    EXPECT_EQ(Uint256(3), ledger.makerEpoch(maker));
    EXPECT_EQ(Uint256(0), ledger.makerEpoch(makeAddress(0x02)));
    EXPECT_FALSE(ledger.isTransactionExecuted(keccak256("tx")));
}

TEST_F(FillLedgerTest, CommittedSavepointKeepsWrites)
{
    {
        FillLedger::Savepoint savepoint(ledger);
        ledger.recordFill(first, 5);
        savepoint.commit();
    }
    EXPECT_EQ(Amount(5), ledger.filledAmount(first));
}

TEST_F(FillLedgerTest, RollbackOnException)
{
    auto failingWrite = [this] {
        FillLedger::Savepoint savepoint(ledger);
        ledger.recordFill(first, 5);
        throw std::runtime_error("abort");
    };
    EXPECT_THROW(failingWrite(), std::runtime_error);
    EXPECT_EQ(Amount(0), ledger.filledAmount(first));
}

TEST_F(FillLedgerTest, NestedSavepoints)
{
    {
        FillLedger::Savepoint outer(ledger);
        ledger.recordFill(first, 1);

        {
            FillLedger::Savepoint inner(ledger);
            ledger.recordFill(first, 2);
        }
        EXPECT_EQ(Amount(1), ledger.filledAmount(first));

        {
            FillLedger::Savepoint inner(ledger);
            ledger.recordFill(second, 4);
            inner.commit();
        }
        EXPECT_EQ(Amount(4), ledger.filledAmount(second));
    }

    // Outer rollback also undoes the committed inner savepoint
    EXPECT_EQ(Amount(0), ledger.filledAmount(first));
    EXPECT_EQ(Amount(0), ledger.filledAmount(second));
    EXPECT_EQ(0u, ledger.entryCount());
}

TEST_F(FillLedgerTest, ExternalUndoRunsOnlyOnRollback)
{
    int undone = 0;
    {
        FillLedger::Savepoint savepoint(ledger);
        ledger.onRollback([&undone] { ++undone; });
        savepoint.commit();
    }
    EXPECT_EQ(0, undone);

    {
        FillLedger::Savepoint savepoint(ledger);
        ledger.onRollback([&undone] { ++undone; });
    }
    EXPECT_EQ(1, undone);

    // Outside any savepoint there is nothing to undo
    ledger.onRollback([&undone] { ++undone; });
    {
        FillLedger::Savepoint savepoint(ledger);
    }
    EXPECT_EQ(1, undone);
}

TEST_F(FillLedgerTest, CommitActionsWaitForOutermostSavepoint)
{
    int committed = 0;
    ledger.onCommit([&committed] { ++committed; });
    EXPECT_EQ(1, committed);

    {
        FillLedger::Savepoint outer(ledger);
        {
            FillLedger::Savepoint inner(ledger);
            ledger.onCommit([&committed] { ++committed; });
            inner.commit();
        }
        {
            FillLedger::Savepoint dropped(ledger);
            ledger.onCommit([&committed] { committed += 100; });
        }
        EXPECT_EQ(1, committed);
        outer.commit();
        EXPECT_EQ(2, committed);
    }

    {
        FillLedger::Savepoint rolledBack(ledger);
        ledger.onCommit([&committed] { ++committed; });
    }
    EXPECT_EQ(2, committed);
}

TEST_F(FillLedgerTest, KeyHashCoversEveryByte)
{
    Address vanity{};
    Address other{};
    other.back() = 0x01;
    EXPECT_NE(ByteArrayHash{}(vanity), ByteArrayHash{}(other));

    OrderHash shared = first;
    shared.back() ^= 0xFF;
    EXPECT_NE(ByteArrayHash{}(first), ByteArrayHash{}(shared));
}
