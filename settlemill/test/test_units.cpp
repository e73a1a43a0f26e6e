#include "../src/errors.hpp"
#include "../src/units.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace settlemill;

TEST(UnitsTest, ToBaseUnits)
{
    EXPECT_EQ(Amount("1000000000000000000"), toBaseUnitAmount(1, 18));
    EXPECT_EQ(Amount(1500), toBaseUnitAmount(15, 2));
    EXPECT_EQ(Amount(7), toBaseUnitAmount(7, 0));
}

TEST(UnitsTest, ToUnitsTruncates)
{
    EXPECT_EQ(Amount(1), toUnitAmount(Amount("1999999999999999999"), 18));
    EXPECT_EQ(Amount(15), toUnitAmount(1500, 2));
    EXPECT_EQ(Amount(0), toUnitAmount(99, 2));
    EXPECT_EQ(Amount(0), toUnitAmount((std::numeric_limits<Amount>::max)(), 78));
}

TEST(UnitsTest, BaseUnitOverflow)
{
    try {
        (void)toBaseUnitAmount(1, 78);
        FAIL() << "Expected ExchangeError";
    } catch (const ExchangeError& e) {
        EXPECT_EQ(ErrorCode::ArithmeticOverflow, e.code());
    }
    EXPECT_THROW((void)toBaseUnitAmount((std::numeric_limits<Amount>::max)(), 1), ExchangeError);
}

TEST(UnitsTest, SaltsDiffer)
{
    Uint256 first = generatePseudoRandomSalt();
    Uint256 second = generatePseudoRandomSalt();
    EXPECT_NE(first, second);
}
