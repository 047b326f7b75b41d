// lendx - Market and Interest Accrual Tests

#include "test_helpers.hpp"

using namespace lendx;
using namespace lendx::testing;

TEST_CASE("Risk parameter validation", "[market]") {
    MarketParams params = market_params(USDC);
    REQUIRE(valid_risk_parameters(params));

    SECTION("Collateral factor must stay below the threshold") {
        params.collateral_factor_x18 = params.liquidation_threshold_x18;
        REQUIRE_FALSE(valid_risk_parameters(params));
    }

    SECTION("Threshold capped at one") {
        params.liquidation_threshold_x18 = X18_ONE + 1;
        REQUIRE_FALSE(valid_risk_parameters(params));
    }

    SECTION("Reserve factor in [0, 1]") {
        params.reserve_factor_x18 = -1;
        REQUIRE_FALSE(valid_risk_parameters(params));
        params.reserve_factor_x18 = X18_ONE;
        REQUIRE(valid_risk_parameters(params));
    }

    SECTION("Negative rates") {
        params.annual_borrow_rate_x18 = -1;
        REQUIRE_FALSE(valid_risk_parameters(params));
    }
}

TEST_CASE("New market", "[market]") {
    Market m = make_market(market_params(USDC, dec("0.05"), dec("0.08")), 100, constants::SECONDS_PER_YEAR);

    REQUIRE(m.active);
    REQUIRE(m.supply_index_x18 == constants::SCALE);
    REQUIRE(m.borrow_index_x18 == constants::SCALE);
    REQUIRE(m.last_update_time == 100);
    REQUIRE(m.borrow_rate_per_second_x18 == I128{2536783358LL});
    REQUIRE(m.supply_rate_per_second_x18 == I128{1585489599LL});
}

TEST_CASE("Index accrual", "[market][accrual]") {
    Market m = make_market(market_params(USDC, 0, dec("0.08")), 0, constants::SECONDS_PER_YEAR);
    m.total_borrowed_x18 = units(1000);

    SECTION("One year at 8% in a single call") {
        accrual::accrue(m, constants::SECONDS_PER_YEAR);

        // floor(8e16 / 31536000) per second
        REQUIRE(m.borrow_index_x18 == I128{1079999999977888000LL});
        REQUIRE(m.total_borrowed_x18 == units(1000) + I128{79999999977888000LL} * 1000);
        REQUIRE(m.supply_index_x18 == constants::SCALE);
        REQUIRE(m.last_update_time == constants::SECONDS_PER_YEAR);
    }

    SECTION("Same timestamp is a no-op") {
        accrual::accrue(m, 5000);
        Market once = m;
        accrual::accrue(m, 5000);
        REQUIRE(m.borrow_index_x18 == once.borrow_index_x18);
        REQUIRE(m.total_borrowed_x18 == once.total_borrowed_x18);
    }

    SECTION("Earlier timestamp is ignored") {
        accrual::accrue(m, 5000);
        I128 index = m.borrow_index_x18;
        accrual::accrue(m, 4000);
        REQUIRE(m.borrow_index_x18 == index);
        REQUIRE(m.last_update_time == 5000);
    }

    SECTION("Totals compound across calls, the index adds") {
        Market split = m;
        accrual::accrue(m, constants::SECONDS_PER_YEAR);

        accrual::accrue(split, constants::SECONDS_PER_YEAR / 2);
        accrual::accrue(split, constants::SECONDS_PER_YEAR);

        REQUIRE(split.total_borrowed_x18 == dec("1081.59999997700352"));
        REQUIRE(m.total_borrowed_x18 == dec("1079.999999977888"));
        REQUIRE(split.borrow_index_x18 == m.borrow_index_x18 - 1);
    }

    SECTION("Indices never decrease") {
        I128 previous = m.borrow_index_x18;
        for (uint64_t t = 1; t <= 10; ++t) {
            accrual::accrue(m, t * 86400);
            REQUIRE(m.borrow_index_x18 >= previous);
            previous = m.borrow_index_x18;
        }
    }

    SECTION("Empty side does not move") {
        m.total_borrowed_x18 = 0;
        accrual::accrue(m, constants::SECONDS_PER_YEAR);
        REQUIRE(m.borrow_index_x18 == constants::SCALE);
        REQUIRE(m.last_update_time == constants::SECONDS_PER_YEAR);
    }
}

TEST_CASE("Projection matches accrual without writing", "[market][accrual]") {
    Market m = make_market(market_params(DAI, dec("0.05"), dec("0.08")), 0, constants::SECONDS_PER_YEAR);
    m.total_supplied_x18 = units(2000);
    m.total_borrowed_x18 = units(1000);

    IndexProjection p = accrual::project(m, 86400 * 30);
    REQUIRE(m.last_update_time == 0);
    REQUIRE(m.borrow_index_x18 == constants::SCALE);

    accrual::accrue(m, 86400 * 30);
    REQUIRE(p.borrow_index_x18 == m.borrow_index_x18);
    REQUIRE(p.supply_index_x18 == m.supply_index_x18);
    REQUIRE(p.total_supplied_x18 == m.total_supplied_x18);
    REQUIRE(p.total_borrowed_x18 == m.total_borrowed_x18);
}

TEST_CASE("Saturating debit", "[market]") {
    REQUIRE(accrual::debit(units(10), units(4)) == units(6));
    REQUIRE(accrual::debit(units(10), units(10)) == 0);
    REQUIRE(accrual::debit(units(10), units(10) + 1) == 0);
}

TEST_CASE("Utilization summary", "[market]") {
    Market m = make_market(market_params(WETH), 0, constants::SECONDS_PER_YEAR);

    SECTION("Empty market") {
        UtilizationSummary s = accrual::summarize(m, 0);
        REQUIRE(s.utilization_x18 == 0);
    }

    SECTION("Half borrowed") {
        m.total_supplied_x18 = units(100);
        m.total_borrowed_x18 = units(50);
        UtilizationSummary s = accrual::summarize(m, 0);
        REQUIRE(s.utilization_x18 == X18_HALF);
        REQUIRE(s.reserve_factor_x18 == dec("0.10"));
    }
}
