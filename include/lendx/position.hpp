#ifndef LENDX_POSITION_HPP
#define LENDX_POSITION_HPP

#include <map>
#include <optional>
#include <vector>

#include "market.hpp"

namespace lendx {

// =============================================================================
// Position - one per (account, asset) ever touched
// =============================================================================

struct Position {
    Currency asset;
    I128 supplied_x18;               // Principal as of the last snapshot
    I128 borrowed_x18;
    I128 supply_index_snapshot_x18;  // Market index when last touched
    I128 borrow_index_snapshot_x18;
    bool is_collateral;
};

// =============================================================================
// Account State
// =============================================================================

struct AccountState {
    std::map<Currency, Position> positions;  // asset -> position
    std::vector<Currency> touched;           // assets ever supplied or borrowed
};

// =============================================================================
// Position accounting
// =============================================================================

namespace positions {

// principal * index / snapshot; a zero snapshot means the position predates
// any accrual and carries no delta
I128 project_balance(I128 principal_x18, I128 snapshot_x18, I128 index_x18);

// Fold accrued interest into principal and re-snapshot against an accrued market
void reconcile_supply(Position& position, const Market& market);
void reconcile_borrow(Position& position, const Market& market);

// Current balances against the given indices, no writes
I128 supply_balance(const Position& position, I128 supply_index_x18);
I128 borrow_balance(const Position& position, I128 borrow_index_x18);

// Find-or-create; registers the asset in the touched set on creation
Position& touch(AccountState& state, const Currency& asset);

const Position* find(const AccountState& state, const Currency& asset);
Position* find(AccountState& state, const Currency& asset);

} // namespace positions

} // namespace lendx

#endif // LENDX_POSITION_HPP
