#ifndef LENDX_LIQUIDATION_HPP
#define LENDX_LIQUIDATION_HPP

#include "types.hpp"

namespace lendx {

// =============================================================================
// Liquidation Quote
// =============================================================================

struct LiquidationQuote {
    I128 max_repay_x18;     // debt * CLOSE_FACTOR
    I128 actual_repay_x18;  // min(requested, max_repay)
    I128 seize_x18;         // collateral units owed to the liquidator
};

// =============================================================================
// Liquidation Result
// =============================================================================

struct LiquidationResult {
    int32_t status;
    Account liquidator;
    Account borrower;
    Currency borrow_asset;
    Currency collateral_asset;
    I128 repaid_x18;
    I128 seized_x18;
    I128 health_factor_x18;  // Borrower health factor before settlement
};

// =============================================================================
// Settlement pricing
// =============================================================================

namespace liquidation {

I128 max_repay(I128 debt_x18);

// repay * price(borrow) * LIQUIDATION_INCENTIVE / (price(collateral) * SCALE)
I128 seize_amount(I128 repay_x18, I128 borrow_price_x18, I128 collateral_price_x18);

// Caps the request by the close factor and prices the seizure.
// Requests above the cap are truncated, not rejected.
int32_t quote(I128 debt_x18, I128 collateral_x18,
              I128 borrow_price_x18, I128 collateral_price_x18,
              I128 requested_repay_x18, LiquidationQuote& out);

} // namespace liquidation

} // namespace lendx

#endif // LENDX_LIQUIDATION_HPP
