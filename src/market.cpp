// =============================================================================
// market.cpp - Market record and interest accrual
// =============================================================================

#include "lendx/market.hpp"

namespace lendx {

// =============================================================================
// Validation / Construction
// =============================================================================

bool valid_risk_parameters(const MarketParams& params) {
    if (params.annual_supply_rate_x18 < 0 || params.annual_borrow_rate_x18 < 0) {
        return false;
    }
    if (params.reserve_factor_x18 < 0 || params.reserve_factor_x18 > constants::SCALE) {
        return false;
    }
    if (params.collateral_factor_x18 < 0) {
        return false;
    }
    return params.collateral_factor_x18 < params.liquidation_threshold_x18 &&
           params.liquidation_threshold_x18 <= constants::SCALE;
}

Market make_market(const MarketParams& params, uint64_t now, uint64_t seconds_per_year) {
    I128 per_year = static_cast<I128>(seconds_per_year == 0 ? constants::SECONDS_PER_YEAR
                                                            : seconds_per_year);
    Market market{};
    market.asset = params.asset;
    market.active = true;
    market.total_supplied_x18 = 0;
    market.total_borrowed_x18 = 0;
    market.supply_rate_per_second_x18 = params.annual_supply_rate_x18 / per_year;
    market.borrow_rate_per_second_x18 = params.annual_borrow_rate_x18 / per_year;
    market.reserve_factor_x18 = params.reserve_factor_x18;
    market.collateral_factor_x18 = params.collateral_factor_x18;
    market.liquidation_threshold_x18 = params.liquidation_threshold_x18;
    market.last_update_time = now;
    market.supply_index_x18 = constants::SCALE;
    market.borrow_index_x18 = constants::SCALE;
    return market;
}

// =============================================================================
// Accrual
// =============================================================================

namespace accrual {

I128 interest(I128 total_x18, I128 rate_per_second_x18, uint64_t elapsed) {
    if (total_x18 <= 0 || rate_per_second_x18 <= 0 || elapsed == 0) return 0;
    return x18::mul_div(total_x18, rate_per_second_x18, static_cast<I128>(elapsed),
                        constants::SCALE, 1);
}

I128 debit(I128 total_x18, I128 amount_x18) {
    return total_x18 > amount_x18 ? total_x18 - amount_x18 : 0;
}

IndexProjection project(const Market& market, uint64_t now) {
    IndexProjection p{market.supply_index_x18, market.borrow_index_x18,
                      market.total_supplied_x18, market.total_borrowed_x18};

    if (now <= market.last_update_time) {
        return p;
    }
    uint64_t elapsed = now - market.last_update_time;

    // Each side folds its interest into the index using the totals as of the
    // previous update; compounding happens across calls, not within one.
    if (market.total_borrowed_x18 > 0) {
        I128 borrow_interest = interest(market.total_borrowed_x18,
                                        market.borrow_rate_per_second_x18, elapsed);
        p.borrow_index_x18 = x18::add(p.borrow_index_x18,
                                      x18::mul_div(borrow_interest, constants::SCALE,
                                                   market.total_borrowed_x18));
        p.total_borrowed_x18 = x18::add(p.total_borrowed_x18, borrow_interest);
    }

    if (market.total_supplied_x18 > 0) {
        I128 supply_interest = interest(market.total_supplied_x18,
                                        market.supply_rate_per_second_x18, elapsed);
        p.supply_index_x18 = x18::add(p.supply_index_x18,
                                      x18::mul_div(supply_interest, constants::SCALE,
                                                   market.total_supplied_x18));
        p.total_supplied_x18 = x18::add(p.total_supplied_x18, supply_interest);
    }

    return p;
}

void accrue(Market& market, uint64_t now) {
    if (now <= market.last_update_time) {
        return;
    }
    IndexProjection p = project(market, now);
    market.supply_index_x18 = p.supply_index_x18;
    market.borrow_index_x18 = p.borrow_index_x18;
    market.total_supplied_x18 = p.total_supplied_x18;
    market.total_borrowed_x18 = p.total_borrowed_x18;
    market.last_update_time = now;
}

UtilizationSummary summarize(const Market& market, uint64_t now) {
    IndexProjection p = project(market, now);

    UtilizationSummary s{};
    s.asset = market.asset;
    s.total_supplied_x18 = p.total_supplied_x18;
    s.total_borrowed_x18 = p.total_borrowed_x18;
    s.utilization_x18 = p.total_supplied_x18 > 0
        ? x18::mul_div(p.total_borrowed_x18, constants::SCALE, p.total_supplied_x18)
        : 0;
    s.supply_rate_per_second_x18 = market.supply_rate_per_second_x18;
    s.borrow_rate_per_second_x18 = market.borrow_rate_per_second_x18;
    s.supply_index_x18 = p.supply_index_x18;
    s.borrow_index_x18 = p.borrow_index_x18;
    s.reserve_factor_x18 = market.reserve_factor_x18;
    return s;
}

} // namespace accrual

} // namespace lendx
