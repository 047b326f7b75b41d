#ifndef LENDX_MARKET_HPP
#define LENDX_MARKET_HPP

#include "types.hpp"

namespace lendx {

// =============================================================================
// Market Parameters (administrative registration input)
// =============================================================================

struct MarketParams {
    Currency asset;
    I128 annual_supply_rate_x18;     // e.g., 0.03 = 3% APR
    I128 annual_borrow_rate_x18;     // e.g., 0.05 = 5% APR
    I128 reserve_factor_x18;
    I128 collateral_factor_x18;      // e.g., 0.8 = 80% LTV
    I128 liquidation_threshold_x18;  // e.g., 0.85
    I128 initial_price_x18;
};

// =============================================================================
// Market - per-asset ledger record
// =============================================================================

struct Market {
    Currency asset;
    bool active;

    // Principal-equivalent aggregates
    I128 total_supplied_x18;
    I128 total_borrowed_x18;

    // Per-second rates, derived once as annual / seconds_per_year
    I128 supply_rate_per_second_x18;
    I128 borrow_rate_per_second_x18;

    I128 reserve_factor_x18;
    I128 collateral_factor_x18;
    I128 liquidation_threshold_x18;

    uint64_t last_update_time;
    I128 supply_index_x18;
    I128 borrow_index_x18;
};

// Indices and totals as of a given time, computed without writing them
struct IndexProjection {
    I128 supply_index_x18;
    I128 borrow_index_x18;
    I128 total_supplied_x18;
    I128 total_borrowed_x18;
};

// Read-only market summary
struct UtilizationSummary {
    Currency asset;
    I128 total_supplied_x18;
    I128 total_borrowed_x18;
    I128 utilization_x18;           // borrowed / supplied
    I128 supply_rate_per_second_x18;
    I128 borrow_rate_per_second_x18;
    I128 supply_index_x18;
    I128 borrow_index_x18;
    I128 reserve_factor_x18;
};

// =============================================================================
// Market validation and construction
// =============================================================================

// 0 <= collateral_factor < liquidation_threshold <= SCALE,
// 0 <= reserve_factor <= SCALE, non-negative rates
bool valid_risk_parameters(const MarketParams& params);

// Fresh market with indices at SCALE. Caller validates first.
Market make_market(const MarketParams& params, uint64_t now, uint64_t seconds_per_year);

// =============================================================================
// InterestAccrual - index-additive per-call compounding
// =============================================================================

namespace accrual {

// Advance indices and totals to `now`. No-op when now <= last_update_time.
void accrue(Market& market, uint64_t now);

// What accrue() would produce at `now`
IndexProjection project(const Market& market, uint64_t now);

// floor(total * rate * elapsed / SCALE)
I128 interest(I128 total_x18, I128 rate_per_second_x18, uint64_t elapsed);

// total - amount, saturating at zero (rounding dust)
I128 debit(I128 total_x18, I128 amount_x18);

UtilizationSummary summarize(const Market& market, uint64_t now);

} // namespace accrual

} // namespace lendx

#endif // LENDX_MARKET_HPP
