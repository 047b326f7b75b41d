// =============================================================================
// liquidation.cpp - Close factor and seize pricing
// =============================================================================

#include "lendx/liquidation.hpp"
#include <algorithm>

namespace lendx {

namespace liquidation {

I128 max_repay(I128 debt_x18) {
    return x18::mul_div(debt_x18, constants::CLOSE_FACTOR_X18, constants::SCALE);
}

I128 seize_amount(I128 repay_x18, I128 borrow_price_x18, I128 collateral_price_x18) {
    return x18::mul_div(repay_x18, borrow_price_x18, constants::LIQUIDATION_INCENTIVE_X18,
                        collateral_price_x18, constants::SCALE);
}

int32_t quote(I128 debt_x18, I128 collateral_x18,
              I128 borrow_price_x18, I128 collateral_price_x18,
              I128 requested_repay_x18, LiquidationQuote& out) {
    if (requested_repay_x18 <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (debt_x18 <= 0 || collateral_x18 <= 0) {
        return errors::NO_COLLATERAL_OR_NO_DEBT;
    }
    if (borrow_price_x18 <= 0 || collateral_price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }

    LiquidationQuote q{};
    q.max_repay_x18 = max_repay(debt_x18);
    q.actual_repay_x18 = std::min(requested_repay_x18, q.max_repay_x18);
    if (q.actual_repay_x18 <= 0) {
        // Dust debt whose half floors to zero
        return errors::INVALID_AMOUNT;
    }
    q.seize_x18 = seize_amount(q.actual_repay_x18, borrow_price_x18, collateral_price_x18);

    if (q.seize_x18 > collateral_x18) {
        return errors::SEIZE_EXCEEDS_COLLATERAL;
    }

    out = q;
    return errors::OK;
}

} // namespace liquidation

} // namespace lendx
