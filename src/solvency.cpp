// =============================================================================
// solvency.cpp - Collateral valuation and health factor
// =============================================================================

#include "lendx/solvency.hpp"

namespace lendx {

AccountLiquidity SolvencyEvaluator::evaluate(const std::vector<AssetExposure>& exposures) {
    AccountLiquidity info{};

    for (const auto& e : exposures) {
        if (e.is_collateral && e.supplied_x18 > 0) {
            info.collateral_value_x18 = x18::add(
                info.collateral_value_x18,
                collateral_value_of(e.supplied_x18, e.price_x18, e.collateral_factor_x18));
            info.liquidation_value_x18 = x18::add(
                info.liquidation_value_x18,
                collateral_value_of(e.supplied_x18, e.price_x18, e.liquidation_threshold_x18));
        }
        if (e.borrowed_x18 > 0) {
            info.borrow_value_x18 = x18::add(info.borrow_value_x18,
                                             value_of(e.borrowed_x18, e.price_x18));
        }
    }

    if (info.borrow_value_x18 > 0) {
        info.health_factor_x18 = x18::mul_div(info.liquidation_value_x18, constants::SCALE,
                                              info.borrow_value_x18);
    } else {
        info.health_factor_x18 = I128_MAX;
    }
    info.liquidatable = info.health_factor_x18 < constants::SCALE;

    return info;
}

I128 SolvencyEvaluator::value_of(I128 amount_x18, I128 price_x18) {
    return x18::mul_div(amount_x18, price_x18, constants::SCALE);
}

I128 SolvencyEvaluator::collateral_value_of(I128 amount_x18, I128 price_x18,
                                            I128 collateral_factor_x18) {
    return x18::mul_div(amount_x18, price_x18, collateral_factor_x18,
                        constants::SCALE, constants::SCALE);
}

bool SolvencyEvaluator::can_borrow(const std::vector<AssetExposure>& exposures,
                                   I128 price_x18, I128 amount_x18) {
    AccountLiquidity info = evaluate(exposures);
    return info.collateral_value_x18 >=
           x18::add(info.borrow_value_x18, value_of(amount_x18, price_x18));
}

bool SolvencyEvaluator::remains_solvent_after_withdraw(const std::vector<AssetExposure>& exposures,
                                                       const Currency& asset, I128 amount_x18) {
    AccountLiquidity info = evaluate(exposures);

    I128 removed = 0;
    const AssetExposure* e = find(exposures, asset);
    if (e && e->is_collateral) {
        removed = collateral_value_of(amount_x18, e->price_x18, e->collateral_factor_x18);
    }
    return info.collateral_value_x18 - removed >= info.borrow_value_x18;
}

bool SolvencyEvaluator::remains_solvent_without_collateral(const std::vector<AssetExposure>& exposures,
                                                           const Currency& asset) {
    AccountLiquidity info = evaluate(exposures);

    I128 removed = 0;
    const AssetExposure* e = find(exposures, asset);
    if (e && e->is_collateral && e->supplied_x18 > 0) {
        removed = collateral_value_of(e->supplied_x18, e->price_x18, e->collateral_factor_x18);
    }
    return info.collateral_value_x18 - removed >= info.borrow_value_x18;
}

const AssetExposure* SolvencyEvaluator::find(const std::vector<AssetExposure>& exposures,
                                             const Currency& asset) {
    for (const auto& e : exposures) {
        if (e.asset == asset) return &e;
    }
    return nullptr;
}

} // namespace lendx
