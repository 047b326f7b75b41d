#ifndef LENDX_SOLVENCY_HPP
#define LENDX_SOLVENCY_HPP

#include <vector>

#include "types.hpp"

namespace lendx {

// =============================================================================
// Asset Exposure - one touched asset, balances already reconstructed
// =============================================================================

struct AssetExposure {
    Currency asset;
    I128 supplied_x18;             // Current supply balance
    I128 borrowed_x18;             // Current borrow balance
    bool is_collateral;
    I128 price_x18;
    I128 collateral_factor_x18;
    I128 liquidation_threshold_x18;
};

// =============================================================================
// Account Liquidity
// =============================================================================

struct AccountLiquidity {
    I128 collateral_value_x18;    // Collateral-factor weighted (borrow ceiling)
    I128 liquidation_value_x18;   // Liquidation-threshold weighted
    I128 borrow_value_x18;
    I128 health_factor_x18;       // liquidation_value / borrow_value, I128_MAX if no debt
    bool liquidatable;
};

// =============================================================================
// SolvencyEvaluator
//
// Stateless valuation over a set of exposures. Callers are responsible for
// building exposures from balances reconstructed against accrued indices.
// =============================================================================

class SolvencyEvaluator {
public:
    static AccountLiquidity evaluate(const std::vector<AssetExposure>& exposures);

    // amount * price / SCALE
    static I128 value_of(I128 amount_x18, I128 price_x18);

    // amount * price * collateral_factor / SCALE^2
    static I128 collateral_value_of(I128 amount_x18, I128 price_x18, I128 collateral_factor_x18);

    // collateral_value >= borrow_value + value(amount)
    static bool can_borrow(const std::vector<AssetExposure>& exposures,
                           I128 price_x18, I128 amount_x18);

    // Withdrawing `amount` of a collateral asset keeps collateral_value >= borrow_value
    static bool remains_solvent_after_withdraw(const std::vector<AssetExposure>& exposures,
                                               const Currency& asset, I128 amount_x18);

    // Dropping the asset's whole collateral contribution keeps the account solvent
    static bool remains_solvent_without_collateral(const std::vector<AssetExposure>& exposures,
                                                   const Currency& asset);

private:
    static const AssetExposure* find(const std::vector<AssetExposure>& exposures,
                                     const Currency& asset);
};

} // namespace lendx

#endif // LENDX_SOLVENCY_HPP
