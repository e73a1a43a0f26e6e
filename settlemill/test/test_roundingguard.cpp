#include "../src/errors.hpp"
#include "../src/roundingguard.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace settlemill;

TEST(RoundingGuardTest, ExactDivisionHasNoError)
{
    EXPECT_FALSE(hasRoundingError(50, 100, 200));
    EXPECT_FALSE(hasRoundingError(0, 100, 200));
    EXPECT_FALSE(hasRoundingError(100, 100, 0));
}

TEST(RoundingGuardTest, ThresholdIsStrict)
{
    // 1 * 1000 / 999: remainder 1 of 1000, exactly 0.1%
    EXPECT_FALSE(hasRoundingError(1, 999, 1000));

    // 1 * 999 / 998: remainder 1 of 999, just above 0.1%
    EXPECT_TRUE(hasRoundingError(1, 998, 999));
}

TEST(RoundingGuardTest, LargeTruncationIsRejected)
{
    // 1 * 3 / 2 = 1.5 truncates to 1
    EXPECT_TRUE(hasRoundingError(1, 2, 3));
    EXPECT_TRUE(hasRoundingError(1, 3, 1));
}

TEST(RoundingGuardTest, ProductBeyond256BitsIsExact)
{
    Amount max = (std::numeric_limits<Amount>::max)();
    EXPECT_FALSE(hasRoundingError(max, max, max));
    EXPECT_EQ(max, getPartialAmount(max, max, max));
    EXPECT_EQ(Amount(1), getPartialAmount(max, max, 1));
}

TEST(RoundingGuardTest, PartialAmountFloors)
{
    EXPECT_EQ(Amount(100), getPartialAmount(50, 100, 200));
    EXPECT_EQ(Amount(1), getPartialAmount(1, 2, 3));
    EXPECT_EQ(Amount(0), getPartialAmount(1, 3, 1));
}

TEST(RoundingGuardTest, PartialAmountOverflow)
{
    Amount max = (std::numeric_limits<Amount>::max)();
    try {
        (void)getPartialAmount(max, 1, 2);
        FAIL() << "Expected ExchangeError";
    } catch (const ExchangeError& e) {
        EXPECT_EQ(ErrorCode::ArithmeticOverflow, e.code());
    }
}

TEST(RoundingGuardTest, ZeroDenominator)
{
    EXPECT_THROW((void)hasRoundingError(1, 0, 1), ExchangeError);
    EXPECT_THROW((void)getPartialAmount(1, 0, 1), ExchangeError);
}
