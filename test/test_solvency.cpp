// lendx - Solvency Evaluator Tests

#include "test_helpers.hpp"

using namespace lendx;
using namespace lendx::testing;

namespace {

AssetExposure exposure(const Currency& asset, I128 supplied, I128 borrowed, bool collateral,
                       I128 price = X18_ONE) {
    return AssetExposure{asset, supplied, borrowed, collateral, price, dec("0.80"), dec("0.85")};
}

} // namespace

TEST_CASE("Account liquidity at the borrow ceiling", "[solvency]") {
    std::vector<AssetExposure> exposures{
        exposure(USDC, units(1000), 0, true),
        exposure(DAI, 0, units(800), false)
    };

    AccountLiquidity info = SolvencyEvaluator::evaluate(exposures);
    REQUIRE(info.collateral_value_x18 == units(800));
    REQUIRE(info.liquidation_value_x18 == units(850));
    REQUIRE(info.borrow_value_x18 == units(800));
    REQUIRE(info.health_factor_x18 == dec("1.0625"));
    REQUIRE_FALSE(info.liquidatable);

    SECTION("No further borrowing") {
        REQUIRE(SolvencyEvaluator::can_borrow(exposures, X18_ONE, 0));
        REQUIRE_FALSE(SolvencyEvaluator::can_borrow(exposures, X18_ONE, 1));
    }

    SECTION("No collateral withdrawal") {
        REQUIRE_FALSE(SolvencyEvaluator::remains_solvent_after_withdraw(exposures, USDC, units(1)));
        REQUIRE_FALSE(SolvencyEvaluator::remains_solvent_without_collateral(exposures, USDC));
    }

    SECTION("Debt above the liquidation value") {
        exposures[1].price_x18 = dec("1.06375");
        AccountLiquidity after = SolvencyEvaluator::evaluate(exposures);
        REQUIRE(after.borrow_value_x18 == units(851));
        REQUIRE(after.health_factor_x18 < constants::SCALE);
        REQUIRE(after.liquidatable);
    }
}

TEST_CASE("Only collateral-flagged supply counts", "[solvency]") {
    std::vector<AssetExposure> exposures{
        exposure(USDC, units(1000), 0, false),
        exposure(WETH, units(1), 0, true, units(2000))
    };

    AccountLiquidity info = SolvencyEvaluator::evaluate(exposures);
    REQUIRE(info.collateral_value_x18 == units(1600));
    REQUIRE(info.health_factor_x18 == I128_MAX);
    REQUIRE_FALSE(info.liquidatable);

    REQUIRE(SolvencyEvaluator::remains_solvent_after_withdraw(exposures, USDC, units(1000)));
    REQUIRE(SolvencyEvaluator::remains_solvent_without_collateral(exposures, WETH));
}

TEST_CASE("Health factor is monotone in collateral and debt", "[solvency]") {
    std::vector<AssetExposure> exposures{
        exposure(USDC, units(1000), 0, true),
        exposure(DAI, 0, units(500), false)
    };
    I128 base = SolvencyEvaluator::evaluate(exposures).health_factor_x18;

    SECTION("More collateral") {
        exposures[0].supplied_x18 = units(1100);
        REQUIRE(SolvencyEvaluator::evaluate(exposures).health_factor_x18 >= base);
    }

    SECTION("More debt") {
        exposures[1].borrowed_x18 = units(600);
        REQUIRE(SolvencyEvaluator::evaluate(exposures).health_factor_x18 <= base);
    }
}

TEST_CASE("Borrowing against an existing borrow position", "[solvency]") {
    // Supply and debt in the same asset
    std::vector<AssetExposure> exposures{
        exposure(USDC, units(1000), units(700), true)
    };

    REQUIRE(SolvencyEvaluator::can_borrow(exposures, X18_ONE, units(100)));
    REQUIRE_FALSE(SolvencyEvaluator::can_borrow(exposures, X18_ONE, units(101)));
}
