// =============================================================================
// ledger.cpp - LendingPool Implementation
// =============================================================================

#include "lendx/ledger.hpp"
#include "lendx/snapshot.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

namespace lendx {

namespace {

constexpr const char* COMPONENT = "lendx";

// Pools with an operation in flight on this thread
thread_local std::vector<const void*> t_active_pools;

class EntryGuard {
public:
    explicit EntryGuard(const void* pool) : pool_(pool) {
        reentered_ = std::find(t_active_pools.begin(), t_active_pools.end(), pool_)
                     != t_active_pools.end();
        if (!reentered_) t_active_pools.push_back(pool_);
    }

    ~EntryGuard() {
        if (!reentered_) t_active_pools.pop_back();
    }

    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;

    bool reentered() const { return reentered_; }

private:
    const void* pool_;
    bool reentered_;
};

std::string describe(const Account& account) {
    return addresses::to_hex(account.main) + "/" + std::to_string(account.subaccount_id);
}

std::string describe(const Currency& asset) {
    return addresses::to_hex(asset.addr);
}

uint64_t system_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

bool valid_market(const Market& m) {
    if (m.collateral_factor_x18 < 0 ||
        m.collateral_factor_x18 >= m.liquidation_threshold_x18 ||
        m.liquidation_threshold_x18 > constants::SCALE) {
        return false;
    }
    if (m.reserve_factor_x18 < 0 || m.reserve_factor_x18 > constants::SCALE) {
        return false;
    }
    return m.supply_rate_per_second_x18 >= 0 && m.borrow_rate_per_second_x18 >= 0;
}

} // namespace

// =============================================================================
// Session
// =============================================================================

struct LendingPool::Session {
    std::shared_lock<std::shared_mutex> state_lock;

    // Held while a first-time account's slot is staged; the slot joins the
    // account table only on commit
    std::unique_lock<std::shared_mutex> accounts_lock;
    std::unique_ptr<AccountSlot> fresh_account;

    AccountSlot* account = nullptr;
    std::unique_lock<std::mutex> account_lock;
    std::vector<std::unique_lock<std::mutex>> market_locks;
    std::map<Currency, MarketSlot*> markets;
};

// =============================================================================
// Constructor
// =============================================================================

LendingPool::LendingPool(IAssetTransfer& transfer)
    : transfer_(transfer)
    , clock_(system_seconds)
    , seconds_per_year_(constants::SECONDS_PER_YEAR) {}

LendingPool::~LendingPool() = default;

void LendingPool::set_clock(ClockFn clock) {
    std::unique_lock lock(state_mutex_);
    clock_ = std::move(clock);
}

uint64_t LendingPool::now() const {
    return clock_ ? clock_() : system_seconds();
}

template <typename Body>
int32_t LendingPool::run_mutation(const char* op, bool check_pause, Body&& body) {
    EntryGuard guard(this);
    if (guard.reentered()) {
        logger_.warn(COMPONENT, op, " rejected: reentrant call");
        return errors::REENTRANCY;
    }
    if (check_pause && is_paused()) {
        logger_.debug(COMPONENT, op, " rejected: paused");
        return errors::PAUSED;
    }

    int32_t rc;
    try {
        rc = body();
    } catch (const std::overflow_error& e) {
        logger_.error(COMPONENT, op, " failed: ", e.what());
        return errors::ARITHMETIC_OVERFLOW;
    }

    if (rc != errors::OK) {
        logger_.debug(COMPONENT, op, " rejected: ", errors::to_string(rc));
    }
    return rc;
}

void LendingPool::enter_read() const {
    if (std::find(t_active_pools.begin(), t_active_pools.end(), this) != t_active_pools.end()) {
        throw std::runtime_error("LendingPool: read issued from inside an operation");
    }
}

// =============================================================================
// Administration
// =============================================================================

int32_t LendingPool::register_market(const MarketParams& params) {
    return run_mutation("register_market", false, [&]() -> int32_t {
        if (!valid_risk_parameters(params)) {
            return errors::INVALID_RISK_PARAMETERS;
        }
        if (params.initial_price_x18 <= 0) {
            return errors::INVALID_PRICE;
        }

        std::unique_lock lock(state_mutex_);

        if (markets_.find(params.asset) != markets_.end()) {
            return errors::ASSET_ALREADY_REGISTERED;
        }

        uint64_t ts = now();
        int32_t rc = oracle_.set_price(params.asset, params.initial_price_x18, ts);
        if (rc != errors::OK) return rc;

        auto slot = std::make_unique<MarketSlot>();
        slot->market = make_market(params, ts, seconds_per_year_);
        markets_.emplace(params.asset, std::move(slot));

        logger_.info(COMPONENT, "registered market ", describe(params.asset),
                     " cf=", x18::format(params.collateral_factor_x18),
                     " lt=", x18::format(params.liquidation_threshold_x18),
                     " borrow_apr=", x18::format(params.annual_borrow_rate_x18));
        return errors::OK;
    });
}

int32_t LendingPool::update_rates(const Currency& asset, I128 annual_supply_rate_x18,
                                  I128 annual_borrow_rate_x18) {
    return run_mutation("update_rates", false, [&]() -> int32_t {
        if (annual_supply_rate_x18 < 0 || annual_borrow_rate_x18 < 0) {
            return errors::INVALID_RISK_PARAMETERS;
        }

        std::shared_lock state_lock(state_mutex_);
        MarketSlot* slot = find_market(asset);
        if (!slot) return errors::MARKET_NOT_FOUND;

        std::unique_lock lock(slot->mutex);
        Market market = slot->market;
        accrual::accrue(market, now());

        I128 per_year = static_cast<I128>(seconds_per_year_);
        market.supply_rate_per_second_x18 = annual_supply_rate_x18 / per_year;
        market.borrow_rate_per_second_x18 = annual_borrow_rate_x18 / per_year;
        slot->market = market;

        logger_.info(COMPONENT, "updated rates for ", describe(asset),
                     " supply_apr=", x18::format(annual_supply_rate_x18),
                     " borrow_apr=", x18::format(annual_borrow_rate_x18));
        return errors::OK;
    });
}

int32_t LendingPool::set_price(const Currency& asset, I128 price_x18) {
    return run_mutation("set_price", false, [&]() -> int32_t {
        if (price_x18 <= 0) return errors::INVALID_PRICE;

        std::shared_lock state_lock(state_mutex_);
        if (!find_market(asset)) return errors::MARKET_NOT_FOUND;

        int32_t rc = oracle_.set_price(asset, price_x18, now());
        if (rc == errors::OK) {
            logger_.debug(COMPONENT, "price ", describe(asset), " = ", x18::format(price_x18));
        }
        return rc;
    });
}

void LendingPool::pause() {
    paused_.store(true, std::memory_order_release);
    logger_.info(COMPONENT, "paused");
}

void LendingPool::unpause() {
    paused_.store(false, std::memory_order_release);
    logger_.info(COMPONENT, "unpaused");
}

int32_t LendingPool::bootstrap(const Config& config) {
    if (auto level = log::parse_level(config.general.log_level)) {
        logger_.set_level(*level);
    }
    if (config.general.seconds_per_year > 0) {
        std::unique_lock lock(state_mutex_);
        seconds_per_year_ = config.general.seconds_per_year;
    }

    const std::string& path = config.general.snapshot_path;
    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        logger_.info(COMPONENT, "restoring from ", path);
        int32_t rc = snapshot::load(*this, path);
        if (rc != errors::OK) {
            logger_.error(COMPONENT, "restore from ", path, " failed: ", errors::to_string(rc));
        }
        return rc;
    }

    for (const auto& [name, params] : config.markets) {
        int32_t rc = register_market(params);
        if (rc != errors::OK) {
            logger_.error(COMPONENT, "market ", name, " rejected: ", errors::to_string(rc));
            return rc;
        }
    }
    return errors::OK;
}

// =============================================================================
// Account Operations
// =============================================================================

int32_t LendingPool::supply(const Account& account, const Currency& asset, I128 amount_x18) {
    return run_mutation("supply", true, [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;

        Session session;
        session.state_lock = std::shared_lock(state_mutex_);

        MarketSlot* slot = find_market(asset);
        if (!slot) return errors::MARKET_NOT_FOUND;

        int32_t rc = open_session(session, stage_account(session, account), {asset});
        if (rc != errors::OK) return rc;

        Market market = slot->market;
        if (!market.active) return errors::ASSET_NOT_ACTIVE;
        accrual::accrue(market, now());

        AccountState& state = session.account->state;
        const Position* existing = positions::find(state, asset);
        Position position = existing ? *existing : Position{asset, 0, 0, 0, 0, false};

        positions::reconcile_supply(position, market);
        position.supplied_x18 = x18::add(position.supplied_x18, amount_x18);
        market.total_supplied_x18 = x18::add(market.total_supplied_x18, amount_x18);

        if (transfer_.pull(asset, account, amount_x18) != errors::OK) {
            return errors::TRANSFER_FAILED;
        }

        slot->market = market;
        positions::touch(state, asset) = position;
        commit_account(session, account);
        total_supplies_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    });
}

int32_t LendingPool::withdraw(const Account& account, const Currency& asset, I128 amount_x18) {
    return run_mutation("withdraw", true, [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;

        Session session;
        session.state_lock = std::shared_lock(state_mutex_);

        MarketSlot* slot = find_market(asset);
        if (!slot) return errors::MARKET_NOT_FOUND;

        AccountSlot* account_slot = find_account(account);
        if (!account_slot) return errors::INSUFFICIENT_BALANCE;

        int32_t rc = open_session(session, account_slot, {asset});
        if (rc != errors::OK) return rc;

        AccountState& state = account_slot->state;
        const Position* existing = positions::find(state, asset);
        if (!existing) return errors::INSUFFICIENT_BALANCE;

        uint64_t ts = now();
        Market market = slot->market;
        accrual::accrue(market, ts);

        Position position = *existing;
        positions::reconcile_supply(position, market);
        if (position.supplied_x18 < amount_x18) {
            return errors::INSUFFICIENT_BALANCE;
        }

        if (position.is_collateral) {
            std::vector<AssetExposure> exposures;
            rc = build_exposures(session, {{asset, market}}, {{asset, position}}, ts, exposures);
            if (rc != errors::OK) return rc;
            if (!SolvencyEvaluator::remains_solvent_after_withdraw(exposures, asset, amount_x18)) {
                return errors::INSUFFICIENT_COLLATERAL;
            }
        }

        position.supplied_x18 -= amount_x18;
        market.total_supplied_x18 = accrual::debit(market.total_supplied_x18, amount_x18);

        if (transfer_.push(asset, account, amount_x18) != errors::OK) {
            return errors::TRANSFER_FAILED;
        }

        slot->market = market;
        state.positions[asset] = position;
        total_withdrawals_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    });
}

int32_t LendingPool::borrow(const Account& account, const Currency& asset, I128 amount_x18) {
    return run_mutation("borrow", true, [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;

        Session session;
        session.state_lock = std::shared_lock(state_mutex_);

        MarketSlot* slot = find_market(asset);
        if (!slot) return errors::MARKET_NOT_FOUND;

        int32_t rc = open_session(session, stage_account(session, account), {asset});
        if (rc != errors::OK) return rc;

        Market market = slot->market;
        if (!market.active) return errors::ASSET_NOT_ACTIVE;

        uint64_t ts = now();
        accrual::accrue(market, ts);

        auto price = oracle_.get_price(asset);
        if (!price) return errors::INVALID_PRICE;

        std::vector<AssetExposure> exposures;
        rc = build_exposures(session, {{asset, market}}, {}, ts, exposures);
        if (rc != errors::OK) return rc;
        if (!SolvencyEvaluator::can_borrow(exposures, *price, amount_x18)) {
            return errors::INSUFFICIENT_COLLATERAL;
        }

        AccountState& state = session.account->state;
        const Position* existing = positions::find(state, asset);
        Position position = existing ? *existing : Position{asset, 0, 0, 0, 0, false};

        positions::reconcile_borrow(position, market);
        position.borrowed_x18 = x18::add(position.borrowed_x18, amount_x18);
        market.total_borrowed_x18 = x18::add(market.total_borrowed_x18, amount_x18);

        if (transfer_.push(asset, account, amount_x18) != errors::OK) {
            return errors::TRANSFER_FAILED;
        }

        slot->market = market;
        positions::touch(state, asset) = position;
        commit_account(session, account);
        total_borrows_.fetch_add(1, std::memory_order_relaxed);
        return errors::OK;
    });
}

int32_t LendingPool::repay(const Account& account, const Currency& asset, I128 amount_x18,
                           I128* repaid_x18) {
    if (repaid_x18) *repaid_x18 = 0;

    return run_mutation("repay", true, [&]() -> int32_t {
        if (amount_x18 <= 0) return errors::INVALID_AMOUNT;

        Session session;
        session.state_lock = std::shared_lock(state_mutex_);

        MarketSlot* slot = find_market(asset);
        if (!slot) return errors::MARKET_NOT_FOUND;

        AccountSlot* account_slot = find_account(account);
        if (!account_slot) return errors::NO_COLLATERAL_OR_NO_DEBT;

        int32_t rc = open_session(session, account_slot, {asset});
        if (rc != errors::OK) return rc;

        AccountState& state = account_slot->state;
        const Position* existing = positions::find(state, asset);
        if (!existing) return errors::NO_COLLATERAL_OR_NO_DEBT;

        Market market = slot->market;
        accrual::accrue(market, now());

        Position position = *existing;
        positions::reconcile_borrow(position, market);
        if (position.borrowed_x18 <= 0) {
            return errors::NO_COLLATERAL_OR_NO_DEBT;
        }

        I128 actual = std::min(amount_x18, position.borrowed_x18);

        if (transfer_.pull(asset, account, actual) != errors::OK) {
            return errors::TRANSFER_FAILED;
        }

        position.borrowed_x18 -= actual;
        market.total_borrowed_x18 = accrual::debit(market.total_borrowed_x18, actual);

        slot->market = market;
        state.positions[asset] = position;
        total_repays_.fetch_add(1, std::memory_order_relaxed);
        if (repaid_x18) *repaid_x18 = actual;
        return errors::OK;
    });
}

int32_t LendingPool::set_collateral(const Account& account, const Currency& asset, bool enabled) {
    return run_mutation("set_collateral", true, [&]() -> int32_t {
        Session session;
        session.state_lock = std::shared_lock(state_mutex_);

        if (!find_market(asset)) return errors::MARKET_NOT_FOUND;

        AccountSlot* account_slot = find_account(account);
        if (!account_slot) return errors::NO_COLLATERAL_OR_NO_DEBT;

        int32_t rc = open_session(session, account_slot, {asset});
        if (rc != errors::OK) return rc;

        Position* position = positions::find(account_slot->state, asset);
        if (!position) return errors::NO_COLLATERAL_OR_NO_DEBT;

        if (enabled) {
            if (position->supplied_x18 <= 0) return errors::NO_COLLATERAL_OR_NO_DEBT;
            position->is_collateral = true;
            return errors::OK;
        }

        if (!position->is_collateral) return errors::OK;

        std::vector<AssetExposure> exposures;
        rc = build_exposures(session, {}, {}, now(), exposures);
        if (rc != errors::OK) return rc;
        if (!SolvencyEvaluator::remains_solvent_without_collateral(exposures, asset)) {
            return errors::INSUFFICIENT_COLLATERAL;
        }

        position->is_collateral = false;
        return errors::OK;
    });
}

int32_t LendingPool::accrue(const Currency& asset) {
    return run_mutation("accrue", true, [&]() -> int32_t {
        std::shared_lock state_lock(state_mutex_);
        MarketSlot* slot = find_market(asset);
        if (!slot) return errors::MARKET_NOT_FOUND;

        std::unique_lock lock(slot->mutex);
        accrual::accrue(slot->market, now());
        return errors::OK;
    });
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult LendingPool::liquidate(const Account& liquidator, const Account& borrower,
                                         const Currency& borrow_asset,
                                         const Currency& collateral_asset,
                                         I128 repay_amount_x18) {
    LiquidationResult result{};
    result.liquidator = liquidator;
    result.borrower = borrower;
    result.borrow_asset = borrow_asset;
    result.collateral_asset = collateral_asset;

    result.status = run_mutation("liquidate", true, [&]() -> int32_t {
        if (liquidator == borrower) return errors::SELF_LIQUIDATION_DISALLOWED;
        if (repay_amount_x18 <= 0) return errors::INVALID_AMOUNT;
        return liquidate_locked(result, repay_amount_x18);
    });
    return result;
}

int32_t LendingPool::liquidate_locked(LiquidationResult& result, I128 repay_amount_x18) {
    const Currency& borrow_asset = result.borrow_asset;
    const Currency& collateral_asset = result.collateral_asset;

    Session session;
    session.state_lock = std::shared_lock(state_mutex_);

    if (!find_market(borrow_asset) || !find_market(collateral_asset)) {
        return errors::MARKET_NOT_FOUND;
    }

    AccountSlot* account_slot = find_account(result.borrower);
    if (!account_slot) return errors::NOT_LIQUIDATABLE;

    int32_t rc = open_session(session, account_slot, {borrow_asset, collateral_asset});
    if (rc != errors::OK) return rc;

    // Both target markets and every market the borrower touched are brought current
    uint64_t ts = now();
    std::map<Currency, Market> staged;
    for (const auto& [asset, slot] : session.markets) {
        Market market = slot->market;
        accrual::accrue(market, ts);
        staged.emplace(asset, market);
    }

    std::vector<AssetExposure> exposures;
    rc = build_exposures(session, staged, {}, ts, exposures);
    if (rc != errors::OK) return rc;

    AccountLiquidity info = SolvencyEvaluator::evaluate(exposures);
    result.health_factor_x18 = info.health_factor_x18;
    if (!info.liquidatable) return errors::NOT_LIQUIDATABLE;

    AccountState& state = account_slot->state;
    const Position* debt_existing = positions::find(state, borrow_asset);
    const Position* collateral_existing = positions::find(state, collateral_asset);
    if (!debt_existing || !collateral_existing) return errors::NO_COLLATERAL_OR_NO_DEBT;

    std::map<Currency, Position> staged_positions;
    staged_positions.emplace(borrow_asset, *debt_existing);
    staged_positions.emplace(collateral_asset, *collateral_existing);

    Position& debt = staged_positions.at(borrow_asset);
    Position& collateral = staged_positions.at(collateral_asset);
    Market& borrow_market = staged.at(borrow_asset);
    Market& collateral_market = staged.at(collateral_asset);

    positions::reconcile_borrow(debt, borrow_market);
    positions::reconcile_supply(collateral, collateral_market);

    if (debt.borrowed_x18 <= 0 || !collateral.is_collateral || collateral.supplied_x18 <= 0) {
        return errors::NO_COLLATERAL_OR_NO_DEBT;
    }

    // Same prices the health check used
    I128 borrow_price = 0;
    I128 collateral_price = 0;
    for (const auto& e : exposures) {
        if (e.asset == borrow_asset) borrow_price = e.price_x18;
        if (e.asset == collateral_asset) collateral_price = e.price_x18;
    }

    LiquidationQuote quote{};
    rc = liquidation::quote(debt.borrowed_x18, collateral.supplied_x18,
                            borrow_price, collateral_price, repay_amount_x18, quote);
    if (rc != errors::OK) return rc;

    if (transfer_.pull(borrow_asset, result.liquidator, quote.actual_repay_x18) != errors::OK) {
        return errors::TRANSFER_FAILED;
    }

    debt.borrowed_x18 -= quote.actual_repay_x18;
    borrow_market.total_borrowed_x18 =
        accrual::debit(borrow_market.total_borrowed_x18, quote.actual_repay_x18);
    collateral.supplied_x18 -= quote.seize_x18;
    collateral_market.total_supplied_x18 =
        accrual::debit(collateral_market.total_supplied_x18, quote.seize_x18);

    if (transfer_.push(collateral_asset, result.liquidator, quote.seize_x18) != errors::OK) {
        if (transfer_.push(borrow_asset, result.liquidator, quote.actual_repay_x18) != errors::OK) {
            logger_.error(COMPONENT, "liquidation refund to ", describe(result.liquidator),
                          " failed: ", x18::format(quote.actual_repay_x18), " of ",
                          describe(borrow_asset));
        }
        return errors::TRANSFER_FAILED;
    }

    for (const auto& [asset, market] : staged) {
        session.markets.at(asset)->market = market;
    }
    for (const auto& [asset, position] : staged_positions) {
        state.positions[asset] = position;
    }

    result.repaid_x18 = quote.actual_repay_x18;
    result.seized_x18 = quote.seize_x18;
    total_liquidations_.fetch_add(1, std::memory_order_relaxed);

    logger_.info(COMPONENT, "liquidated ", describe(result.borrower),
                 " by ", describe(result.liquidator),
                 " repaid=", x18::format(result.repaid_x18),
                 " seized=", x18::format(result.seized_x18),
                 " hf=", x18::format(info.health_factor_x18));
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

I128 LendingPool::supply_balance(const Account& account, const Currency& asset) const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);

    MarketSlot* slot = find_market(asset);
    AccountSlot* account_slot = find_account(account);
    if (!slot || !account_slot) return 0;

    std::unique_lock account_lock(account_slot->mutex);
    std::unique_lock market_lock(slot->mutex);

    const Position* position = positions::find(account_slot->state, asset);
    if (!position) return 0;

    IndexProjection idx = accrual::project(slot->market, now());
    return positions::supply_balance(*position, idx.supply_index_x18);
}

I128 LendingPool::borrow_balance(const Account& account, const Currency& asset) const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);

    MarketSlot* slot = find_market(asset);
    AccountSlot* account_slot = find_account(account);
    if (!slot || !account_slot) return 0;

    std::unique_lock account_lock(account_slot->mutex);
    std::unique_lock market_lock(slot->mutex);

    const Position* position = positions::find(account_slot->state, asset);
    if (!position) return 0;

    IndexProjection idx = accrual::project(slot->market, now());
    return positions::borrow_balance(*position, idx.borrow_index_x18);
}

AccountLiquidity LendingPool::account_liquidity(const Account& account) const {
    enter_read();

    Session session;
    session.state_lock = std::shared_lock(state_mutex_);

    std::vector<AssetExposure> exposures;
    AccountSlot* account_slot = find_account(account);
    if (!account_slot) return SolvencyEvaluator::evaluate(exposures);

    int32_t rc = open_session(session, account_slot, {});
    if (rc == errors::OK) {
        rc = build_exposures(session, {}, {}, now(), exposures);
    }
    if (rc != errors::OK) {
        logger_.error(COMPONENT, "account_liquidity for ", describe(account),
                      " unavailable: ", errors::to_string(rc));
        throw std::runtime_error(std::string("LendingPool: cannot value account: ") +
                                 errors::to_string(rc));
    }
    return SolvencyEvaluator::evaluate(exposures);
}

std::optional<UtilizationSummary> LendingPool::utilization(const Currency& asset) const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);

    MarketSlot* slot = find_market(asset);
    if (!slot) return std::nullopt;

    std::unique_lock lock(slot->mutex);
    return accrual::summarize(slot->market, now());
}

std::optional<Market> LendingPool::get_market(const Currency& asset) const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);

    MarketSlot* slot = find_market(asset);
    if (!slot) return std::nullopt;

    std::unique_lock lock(slot->mutex);
    return slot->market;
}

std::optional<Position> LendingPool::get_position(const Account& account,
                                                  const Currency& asset) const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);

    AccountSlot* account_slot = find_account(account);
    if (!account_slot) return std::nullopt;

    std::unique_lock lock(account_slot->mutex);
    const Position* position = positions::find(account_slot->state, asset);
    if (!position) return std::nullopt;
    return *position;
}

std::vector<Currency> LendingPool::touched_assets(const Account& account) const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);

    AccountSlot* account_slot = find_account(account);
    if (!account_slot) return {};

    std::unique_lock lock(account_slot->mutex);
    return account_slot->state.touched;
}

std::vector<Currency> LendingPool::list_markets() const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);

    std::vector<Currency> assets;
    assets.reserve(markets_.size());
    for (const auto& [asset, slot] : markets_) {
        assets.push_back(asset);
    }
    return assets;
}

// =============================================================================
// Persistence
// =============================================================================

LedgerState LendingPool::export_state() const {
    enter_read();

    // Exclusive: waits out in-flight operations and holds off new ones
    std::unique_lock state_lock(state_mutex_);
    std::shared_lock accounts_lock(accounts_mutex_);

    LedgerState state{};
    state.paused = is_paused();

    for (const auto& [asset, slot] : markets_) {
        state.markets.push_back(slot->market);
    }
    for (const auto& [account, slot] : accounts_) {
        if (slot->state.positions.empty()) continue;
        state.accounts.emplace(account, slot->state);
    }
    for (const auto& [asset, data] : oracle_.all_prices()) {
        if (markets_.find(asset) != markets_.end()) {
            state.prices.emplace_back(asset, data);
        }
    }
    return state;
}

int32_t LendingPool::import_state(const LedgerState& state) {
    return run_mutation("import_state", false, [&]() -> int32_t {
        std::set<Currency> known;
        for (const auto& market : state.markets) {
            if (!known.insert(market.asset).second) return errors::SNAPSHOT_IO;
            if (!valid_market(market)) return errors::INVALID_RISK_PARAMETERS;
            if (market.total_supplied_x18 < 0 || market.total_borrowed_x18 < 0 ||
                market.supply_index_x18 < constants::SCALE ||
                market.borrow_index_x18 < constants::SCALE) {
                return errors::SNAPSHOT_IO;
            }
        }

        std::set<Currency> priced;
        for (const auto& [asset, data] : state.prices) {
            if (data.price_x18 <= 0) return errors::INVALID_PRICE;
            if (known.count(asset)) priced.insert(asset);
        }
        if (priced.size() != known.size()) return errors::SNAPSHOT_IO;

        for (const auto& [account, account_state] : state.accounts) {
            std::set<Currency> touched(account_state.touched.begin(), account_state.touched.end());
            if (touched.size() != account_state.touched.size() ||
                touched.size() != account_state.positions.size()) {
                return errors::SNAPSHOT_IO;
            }
            for (const auto& [asset, position] : account_state.positions) {
                if (!known.count(asset) || !touched.count(asset) || position.asset != asset) {
                    return errors::SNAPSHOT_IO;
                }
                if (position.supplied_x18 < 0 || position.borrowed_x18 < 0 ||
                    position.supply_index_snapshot_x18 < 0 ||
                    position.borrow_index_snapshot_x18 < 0) {
                    return errors::SNAPSHOT_IO;
                }
            }
        }

        std::unique_lock state_lock(state_mutex_);
        std::unique_lock accounts_lock(accounts_mutex_);

        markets_.clear();
        for (const auto& market : state.markets) {
            auto slot = std::make_unique<MarketSlot>();
            slot->market = market;
            markets_.emplace(market.asset, std::move(slot));
        }

        accounts_.clear();
        for (const auto& [account, account_state] : state.accounts) {
            auto slot = std::make_unique<AccountSlot>();
            slot->state = account_state;
            accounts_.emplace(account, std::move(slot));
        }

        oracle_.clear();
        for (const auto& [asset, data] : state.prices) {
            if (known.count(asset) &&
                oracle_.set_price(asset, data.price_x18, data.timestamp) != errors::OK) {
                logger_.error(COMPONENT, "import: price for ", describe(asset), " refused");
            }
        }

        paused_.store(state.paused, std::memory_order_release);

        logger_.info(COMPONENT, "imported ", state.markets.size(), " markets, ",
                     state.accounts.size(), " accounts");
        return errors::OK;
    });
}

// =============================================================================
// Statistics
// =============================================================================

LendingPool::Stats LendingPool::get_stats() const {
    enter_read();
    std::shared_lock state_lock(state_mutex_);
    std::shared_lock accounts_lock(accounts_mutex_);

    uint64_t total_positions = 0;
    for (const auto& [account, slot] : accounts_) {
        std::unique_lock lock(slot->mutex);
        total_positions += slot->state.positions.size();
    }

    return Stats{
        markets_.size(),
        accounts_.size(),
        total_positions,
        total_supplies_.load(std::memory_order_relaxed),
        total_withdrawals_.load(std::memory_order_relaxed),
        total_borrows_.load(std::memory_order_relaxed),
        total_repays_.load(std::memory_order_relaxed),
        total_liquidations_.load(std::memory_order_relaxed)
    };
}

// =============================================================================
// Internal Helpers
// =============================================================================

LendingPool::AccountSlot* LendingPool::stage_account(Session& session, const Account& account) {
    if (AccountSlot* slot = find_account(account)) return slot;

    session.accounts_lock = std::unique_lock(accounts_mutex_);
    auto it = accounts_.find(account);
    if (it != accounts_.end()) {
        session.accounts_lock.unlock();
        return it->second.get();
    }
    session.fresh_account = std::make_unique<AccountSlot>();
    return session.fresh_account.get();
}

void LendingPool::commit_account(Session& session, const Account& account) {
    if (!session.fresh_account) return;
    accounts_.emplace(account, std::move(session.fresh_account));
}

LendingPool::AccountSlot* LendingPool::find_account(const Account& account) const {
    std::shared_lock lock(accounts_mutex_);
    auto it = accounts_.find(account);
    return (it != accounts_.end()) ? it->second.get() : nullptr;
}

LendingPool::MarketSlot* LendingPool::find_market(const Currency& asset) const {
    auto it = markets_.find(asset);
    return (it != markets_.end()) ? it->second.get() : nullptr;
}

int32_t LendingPool::open_session(Session& session, AccountSlot* account,
                                  const std::vector<Currency>& targets) const {
    std::set<Currency> needed(targets.begin(), targets.end());

    if (account) {
        session.account = account;
        session.account_lock = std::unique_lock(account->mutex);
        needed.insert(account->state.touched.begin(), account->state.touched.end());
    }

    // Asset order is the global market lock order
    for (const auto& asset : needed) {
        MarketSlot* slot = find_market(asset);
        if (!slot) return errors::MARKET_NOT_FOUND;
        session.market_locks.emplace_back(slot->mutex);
        session.markets.emplace(asset, slot);
    }
    return errors::OK;
}

int32_t LendingPool::build_exposures(const Session& session,
                                     const std::map<Currency, Market>& staged_markets,
                                     const std::map<Currency, Position>& staged_positions,
                                     uint64_t now, std::vector<AssetExposure>& out) const {
    out.clear();
    if (!session.account) return errors::OK;

    const AccountState& state = session.account->state;

    std::vector<Currency> assets = state.touched;
    for (const auto& [asset, position] : staged_positions) {
        if (std::find(assets.begin(), assets.end(), asset) == assets.end()) {
            assets.push_back(asset);
        }
    }

    for (const auto& asset : assets) {
        auto sp = staged_positions.find(asset);
        const Position* position = sp != staged_positions.end()
            ? &sp->second
            : positions::find(state, asset);
        if (!position) continue;

        const Market* market = nullptr;
        auto sm = staged_markets.find(asset);
        if (sm != staged_markets.end()) {
            market = &sm->second;
        } else {
            auto lm = session.markets.find(asset);
            if (lm == session.markets.end()) return errors::MARKET_NOT_FOUND;
            market = &lm->second->market;
        }

        auto price = oracle_.get_price(asset);
        if (!price) return errors::INVALID_PRICE;

        IndexProjection idx = accrual::project(*market, now);

        AssetExposure e{};
        e.asset = asset;
        e.supplied_x18 = positions::supply_balance(*position, idx.supply_index_x18);
        e.borrowed_x18 = positions::borrow_balance(*position, idx.borrow_index_x18);
        e.is_collateral = position->is_collateral;
        e.price_x18 = *price;
        e.collateral_factor_x18 = market->collateral_factor_x18;
        e.liquidation_threshold_x18 = market->liquidation_threshold_x18;
        out.push_back(e);
    }
    return errors::OK;
}

} // namespace lendx
