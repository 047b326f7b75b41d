#ifndef LENDX_LEDGER_HPP
#define LENDX_LEDGER_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "config.hpp"
#include "liquidation.hpp"
#include "log.hpp"
#include "market.hpp"
#include "oracle.hpp"
#include "position.hpp"
#include "solvency.hpp"
#include "transfer.hpp"

namespace lendx {

// =============================================================================
// Ledger State - plain copy of every persisted table
// =============================================================================

struct LedgerState {
    bool paused;
    std::vector<Market> markets;                   // Market table, by asset
    std::map<Account, AccountState> accounts;      // Position table + touched index
    std::vector<std::pair<Currency, PriceData>> prices;
};

// =============================================================================
// LendingPool - multi-asset credit ledger
//
// Owns market and position tables. Every mutating call locks the acting
// account, then every market it reads or writes (in asset order), stages its
// changes on copies and commits only after all checks and transfers pass.
// =============================================================================

class LendingPool {
public:
    using ClockFn = std::function<uint64_t()>;

    explicit LendingPool(IAssetTransfer& transfer);
    ~LendingPool();

    // Non-copyable
    LendingPool(const LendingPool&) = delete;
    LendingPool& operator=(const LendingPool&) = delete;

    // =========================================================================
    // Administration
    // =========================================================================

    int32_t register_market(const MarketParams& params);

    // Accrues at the old rates first
    int32_t update_rates(const Currency& asset, I128 annual_supply_rate_x18,
                         I128 annual_borrow_rate_x18);

    int32_t set_price(const Currency& asset, I128 price_x18);

    void pause();
    void unpause();
    bool is_paused() const { return paused_.load(std::memory_order_acquire); }

    // Applies log level / seconds_per_year, then restores snapshot_path when
    // that file exists, otherwise registers every configured market
    int32_t bootstrap(const Config& config);

    // Time source in seconds. Setup only: waits out in-flight operations but
    // must not race with direct now() callers.
    void set_clock(ClockFn clock);
    uint64_t now() const;

    // =========================================================================
    // Account Operations
    // =========================================================================

    int32_t supply(const Account& account, const Currency& asset, I128 amount_x18);
    int32_t withdraw(const Account& account, const Currency& asset, I128 amount_x18);
    int32_t borrow(const Account& account, const Currency& asset, I128 amount_x18);

    // Repays min(amount, debt); the amount actually repaid goes to `repaid_x18`
    int32_t repay(const Account& account, const Currency& asset, I128 amount_x18,
                  I128* repaid_x18 = nullptr);

    int32_t set_collateral(const Account& account, const Currency& asset, bool enabled);

    LiquidationResult liquidate(const Account& liquidator, const Account& borrower,
                                const Currency& borrow_asset, const Currency& collateral_asset,
                                I128 repay_amount_x18);

    // Bring one market's indices current
    int32_t accrue(const Currency& asset);

    // =========================================================================
    // Queries (read-only index projection, nothing is written)
    // =========================================================================

    I128 supply_balance(const Account& account, const Currency& asset) const;
    I128 borrow_balance(const Account& account, const Currency& asset) const;
    // Throws std::runtime_error when the account cannot be valued (missing
    // price, overflow)
    AccountLiquidity account_liquidity(const Account& account) const;
    std::optional<UtilizationSummary> utilization(const Currency& asset) const;

    std::optional<Market> get_market(const Currency& asset) const;
    std::optional<Position> get_position(const Account& account, const Currency& asset) const;
    std::vector<Currency> touched_assets(const Account& account) const;
    std::vector<Currency> list_markets() const;

    // Prices change only through register_market / set_price / import_state
    const PriceOracle& oracle() const { return oracle_; }

    log::Logger& logger() { return logger_; }

    // =========================================================================
    // Persistence
    // =========================================================================

    LedgerState export_state() const;

    // Validates, then replaces the whole ledger
    int32_t import_state(const LedgerState& state);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_markets;
        uint64_t total_accounts;
        uint64_t total_positions;
        uint64_t total_supplies;
        uint64_t total_withdrawals;
        uint64_t total_borrows;
        uint64_t total_repays;
        uint64_t total_liquidations;
    };
    Stats get_stats() const;

private:
    struct MarketSlot {
        Market market;
        std::mutex mutex;
    };

    struct AccountSlot {
        AccountState state;
        std::mutex mutex;
    };

    // Locks held for the span of one operation
    struct Session;

    IAssetTransfer& transfer_;
    PriceOracle oracle_;
    mutable log::Logger logger_;
    ClockFn clock_;
    uint64_t seconds_per_year_;
    std::atomic<bool> paused_{false};

    // Held shared by every operation, exclusively by register/import
    mutable std::shared_mutex state_mutex_;

    std::map<Currency, std::unique_ptr<MarketSlot>> markets_;

    std::map<Account, std::unique_ptr<AccountSlot>> accounts_;
    mutable std::shared_mutex accounts_mutex_;

    // Statistics
    std::atomic<uint64_t> total_supplies_{0};
    std::atomic<uint64_t> total_withdrawals_{0};
    std::atomic<uint64_t> total_borrows_{0};
    std::atomic<uint64_t> total_repays_{0};
    std::atomic<uint64_t> total_liquidations_{0};

    // Re-entry, pause and overflow handling around a mutating body
    template <typename Body>
    int32_t run_mutation(const char* op, bool check_pause, Body&& body);

    // Internal helpers
    // Existing slot, or a private one held in `session` until commit_account
    AccountSlot* stage_account(Session& session, const Account& account);
    void commit_account(Session& session, const Account& account);
    AccountSlot* find_account(const Account& account) const;
    MarketSlot* find_market(const Currency& asset) const;

    // Locks `account` (may be null) and the union of `targets` and its touched assets
    int32_t open_session(Session& session, AccountSlot* account,
                         const std::vector<Currency>& targets) const;

    // Reconstructed exposures for every touched asset; staged markets and
    // positions take precedence over the locked live ones
    int32_t build_exposures(const Session& session,
                            const std::map<Currency, Market>& staged_markets,
                            const std::map<Currency, Position>& staged_positions,
                            uint64_t now, std::vector<AssetExposure>& out) const;

    int32_t liquidate_locked(LiquidationResult& result, I128 repay_amount_x18);

    void enter_read() const;
};

} // namespace lendx

#endif // LENDX_LEDGER_HPP
