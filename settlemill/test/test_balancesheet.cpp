#include "../src/balancesheet.hpp"
#include "testsigner.hpp"
#include <gtest/gtest.h>

using namespace settlemill;
using testsupport::makeAddress;

class BalanceSheetTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        order.makerAddress = maker;
        order.makerAssetAddress = makerToken;
        order.takerAssetAddress = takerToken;
        order.makerAssetAmount = 200;
        order.takerAssetAmount = 100;
        order.makerFeeAmount = 10;
        order.takerFeeAmount = 20;

        sheet.deposit(makerToken, maker, 1000);
        sheet.deposit(takerToken, taker, 1000);
        sheet.deposit(feeToken, maker, 100);
        sheet.deposit(feeToken, taker, 100);
    }

    Address maker = makeAddress(0x01);
    Address taker = makeAddress(0x02);
    Address relayer = makeAddress(0x09);
    Address makerToken = makeAddress(0xA1);
    Address takerToken = makeAddress(0xB2);
    Address feeToken = makeAddress(0xFE);

    BalanceSheet sheet{feeToken};
    Order order{};
};

TEST_F(BalanceSheetTest, DepositAndBalance)
{
    EXPECT_EQ(Amount(1000), sheet.balanceOf(makerToken, maker));
    EXPECT_EQ(Amount(0), sheet.balanceOf(makerToken, taker));
    sheet.deposit(makerToken, maker, 5);
    EXPECT_EQ(Amount(1005), sheet.balanceOf(makerToken, maker));
    EXPECT_EQ(feeToken, sheet.feeToken());
}

TEST_F(BalanceSheetTest, ProportionalTransfersWithoutFeeRecipient)
{
    auto result = sheet.settle(order, taker, 50);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(Amount(100), result->makerAssetFilledAmount);
    EXPECT_EQ(Amount(0), result->makerFeePaid);
    EXPECT_EQ(Amount(0), result->takerFeePaid);

    EXPECT_EQ(Amount(900), sheet.balanceOf(makerToken, maker));
    EXPECT_EQ(Amount(100), sheet.balanceOf(makerToken, taker));
    EXPECT_EQ(Amount(950), sheet.balanceOf(takerToken, taker));
    EXPECT_EQ(Amount(50), sheet.balanceOf(takerToken, maker));
    EXPECT_EQ(Amount(100), sheet.balanceOf(feeToken, maker));
    EXPECT_EQ(1u, sheet.settlementCount());
}

TEST_F(BalanceSheetTest, FeesGoToRecipient)
{
    order.feeRecipientAddress = relayer;

    auto result = sheet.settle(order, taker, 50);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(Amount(5), result->makerFeePaid);
    EXPECT_EQ(Amount(10), result->takerFeePaid);

    EXPECT_EQ(Amount(95), sheet.balanceOf(feeToken, maker));
    EXPECT_EQ(Amount(90), sheet.balanceOf(feeToken, taker));
    EXPECT_EQ(Amount(15), sheet.balanceOf(feeToken, relayer));
}

TEST_F(BalanceSheetTest, InsufficientBalanceMovesNothing)
{
    BalanceSheet poor{feeToken};
    poor.deposit(makerToken, maker, 1000);
    poor.deposit(takerToken, taker, 10);

    EXPECT_FALSE(poor.settle(order, taker, 50).has_value());
    EXPECT_EQ(Amount(1000), poor.balanceOf(makerToken, maker));
    EXPECT_EQ(Amount(0), poor.balanceOf(makerToken, taker));
    EXPECT_EQ(Amount(10), poor.balanceOf(takerToken, taker));
    EXPECT_EQ(0u, poor.settlementCount());
}

TEST_F(BalanceSheetTest, MissingFeeBalanceMovesNothing)
{
    order.feeRecipientAddress = relayer;
    order.takerFeeAmount = 1000; // Half is 500, taker holds 100

    EXPECT_FALSE(sheet.settle(order, taker, 50).has_value());
    EXPECT_EQ(Amount(1000), sheet.balanceOf(makerToken, maker));
    EXPECT_EQ(Amount(1000), sheet.balanceOf(takerToken, taker));
    EXPECT_EQ(Amount(100), sheet.balanceOf(feeToken, maker));
    EXPECT_EQ(Amount(0), sheet.balanceOf(feeToken, relayer));
}

TEST_F(BalanceSheetTest, ProceedsCannotFundOwnDebits)
{
    // The taker pays in the maker's token; it must hold it before receiving any
    BalanceSheet sheetSameToken{feeToken};
    order.takerAssetAddress = makerToken;
    sheetSameToken.deposit(makerToken, maker, 1000);

    EXPECT_FALSE(sheetSameToken.settle(order, taker, 50).has_value());
    EXPECT_EQ(Amount(1000), sheetSameToken.balanceOf(makerToken, maker));
}

TEST_F(BalanceSheetTest, RevertRestoresBalances)
{
    order.feeRecipientAddress = relayer;

    auto result = sheet.settle(order, taker, 50);
    ASSERT_TRUE(result.has_value());
    sheet.revert(order, taker, 50, *result);

    EXPECT_EQ(Amount(1000), sheet.balanceOf(makerToken, maker));
    EXPECT_EQ(Amount(0), sheet.balanceOf(makerToken, taker));
    EXPECT_EQ(Amount(1000), sheet.balanceOf(takerToken, taker));
    EXPECT_EQ(Amount(0), sheet.balanceOf(takerToken, maker));
    EXPECT_EQ(Amount(100), sheet.balanceOf(feeToken, maker));
    EXPECT_EQ(Amount(100), sheet.balanceOf(feeToken, taker));
    EXPECT_EQ(Amount(0), sheet.balanceOf(feeToken, relayer));
    EXPECT_EQ(0u, sheet.settlementCount());
}
