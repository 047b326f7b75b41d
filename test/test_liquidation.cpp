// lendx - Liquidation Pricing Tests

#include "test_helpers.hpp"

using namespace lendx;
using namespace lendx::testing;

TEST_CASE("Liquidation quote", "[liquidation]") {
    LiquidationQuote q{};

    SECTION("Request above the close factor is truncated") {
        REQUIRE(liquidation::quote(units(800), units(1000), dec("1.06375"), X18_ONE,
                                   units(1000), q) == errors::OK);
        REQUIRE(q.max_repay_x18 == units(400));
        REQUIRE(q.actual_repay_x18 == units(400));
        REQUIRE(q.seize_x18 == dec("459.54"));
    }

    SECTION("Request below the cap is used as is") {
        REQUIRE(liquidation::quote(units(800), units(1000), X18_ONE, X18_ONE,
                                   units(100), q) == errors::OK);
        REQUIRE(q.actual_repay_x18 == units(100));
        REQUIRE(q.seize_x18 == units(108));
    }

    SECTION("Price ratio scales the seizure") {
        // Repay 1000 USDC against WETH at 2000
        REQUIRE(liquidation::quote(units(5000), units(10), X18_ONE, units(2000),
                                   units(1000), q) == errors::OK);
        REQUIRE(q.seize_x18 == dec("0.54"));
    }

    SECTION("Seizure larger than the collateral") {
        REQUIRE(liquidation::quote(units(800), units(100), X18_ONE, X18_ONE,
                                   units(400), q) == errors::SEIZE_EXCEEDS_COLLATERAL);
    }

    SECTION("Rejections") {
        REQUIRE(liquidation::quote(units(800), units(1000), X18_ONE, X18_ONE, 0, q)
                == errors::INVALID_AMOUNT);
        REQUIRE(liquidation::quote(0, units(1000), X18_ONE, X18_ONE, units(1), q)
                == errors::NO_COLLATERAL_OR_NO_DEBT);
        REQUIRE(liquidation::quote(units(800), 0, X18_ONE, X18_ONE, units(1), q)
                == errors::NO_COLLATERAL_OR_NO_DEBT);
        REQUIRE(liquidation::quote(units(800), units(1000), 0, X18_ONE, units(1), q)
                == errors::INVALID_PRICE);
        // Half of one wei floors to zero
        REQUIRE(liquidation::quote(1, units(1000), X18_ONE, X18_ONE, units(1), q)
                == errors::INVALID_AMOUNT);
    }
}

TEST_CASE("Close factor cap", "[liquidation]") {
    for (I128 debt : {I128{1}, I128{3}, units(1), units(851), dec("12345.678901234567890123")}) {
        REQUIRE(liquidation::max_repay(debt) <= debt / 2);
    }
}
