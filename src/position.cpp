// =============================================================================
// position.cpp - Per-account position accounting
// =============================================================================

#include "lendx/position.hpp"

namespace lendx {

namespace positions {

I128 project_balance(I128 principal_x18, I128 snapshot_x18, I128 index_x18) {
    if (principal_x18 <= 0) return 0;
    if (snapshot_x18 <= 0) return principal_x18;
    return x18::mul_div(principal_x18, index_x18, snapshot_x18);
}

void reconcile_supply(Position& position, const Market& market) {
    position.supplied_x18 = project_balance(position.supplied_x18,
                                            position.supply_index_snapshot_x18,
                                            market.supply_index_x18);
    position.supply_index_snapshot_x18 = market.supply_index_x18;
}

void reconcile_borrow(Position& position, const Market& market) {
    position.borrowed_x18 = project_balance(position.borrowed_x18,
                                            position.borrow_index_snapshot_x18,
                                            market.borrow_index_x18);
    position.borrow_index_snapshot_x18 = market.borrow_index_x18;
}

I128 supply_balance(const Position& position, I128 supply_index_x18) {
    return project_balance(position.supplied_x18, position.supply_index_snapshot_x18,
                           supply_index_x18);
}

I128 borrow_balance(const Position& position, I128 borrow_index_x18) {
    return project_balance(position.borrowed_x18, position.borrow_index_snapshot_x18,
                           borrow_index_x18);
}

Position& touch(AccountState& state, const Currency& asset) {
    auto it = state.positions.find(asset);
    if (it == state.positions.end()) {
        Position position{};
        position.asset = asset;
        it = state.positions.emplace(asset, position).first;
        state.touched.push_back(asset);
    }
    return it->second;
}

const Position* find(const AccountState& state, const Currency& asset) {
    auto it = state.positions.find(asset);
    return it != state.positions.end() ? &it->second : nullptr;
}

Position* find(AccountState& state, const Currency& asset) {
    auto it = state.positions.find(asset);
    return it != state.positions.end() ? &it->second : nullptr;
}

} // namespace positions

} // namespace lendx
