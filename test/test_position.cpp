// lendx - Position Accounting Tests

#include "test_helpers.hpp"

using namespace lendx;
using namespace lendx::testing;

TEST_CASE("Balance projection", "[position]") {
    SECTION("Scaled by index growth") {
        REQUIRE(positions::project_balance(units(100), X18_ONE, dec("1.05")) == units(105));
    }

    SECTION("Zero principal") {
        REQUIRE(positions::project_balance(0, X18_ONE, dec("2")) == 0);
    }

    SECTION("Unset snapshot carries no delta") {
        REQUIRE(positions::project_balance(units(100), 0, dec("2")) == units(100));
    }

    SECTION("Floors") {
        REQUIRE(positions::project_balance(10, 3 * X18_ONE, X18_ONE) == 3);
    }
}

TEST_CASE("Reconcile folds interest into principal", "[position]") {
    Market m = make_market(market_params(USDC), 0, constants::SECONDS_PER_YEAR);
    m.supply_index_x18 = dec("1.10");
    m.borrow_index_x18 = dec("1.20");

    Position p{USDC, units(100), units(50), X18_ONE, X18_ONE, true};

    positions::reconcile_supply(p, m);
    REQUIRE(p.supplied_x18 == units(110));
    REQUIRE(p.supply_index_snapshot_x18 == dec("1.10"));
    REQUIRE(p.borrowed_x18 == units(50));

    positions::reconcile_borrow(p, m);
    REQUIRE(p.borrowed_x18 == units(60));
    REQUIRE(p.borrow_index_snapshot_x18 == dec("1.20"));

    SECTION("Second reconcile at the same index changes nothing") {
        positions::reconcile_supply(p, m);
        positions::reconcile_borrow(p, m);
        REQUIRE(p.supplied_x18 == units(110));
        REQUIRE(p.borrowed_x18 == units(60));
    }

    SECTION("First touch only snapshots") {
        Position fresh{USDC, 0, 0, 0, 0, false};
        positions::reconcile_supply(fresh, m);
        REQUIRE(fresh.supplied_x18 == 0);
        REQUIRE(fresh.supply_index_snapshot_x18 == dec("1.10"));
    }
}

TEST_CASE("Touched set", "[position]") {
    AccountState state;

    positions::touch(state, WETH).supplied_x18 = units(1);
    positions::touch(state, USDC);
    positions::touch(state, WETH).supplied_x18 += units(1);

    REQUIRE(state.touched.size() == 2);
    REQUIRE(state.touched[0] == WETH);
    REQUIRE(state.touched[1] == USDC);
    REQUIRE(positions::find(state, WETH)->supplied_x18 == units(2));
    REQUIRE(positions::find(state, DAI) == nullptr);
}
