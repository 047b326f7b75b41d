#ifndef LENDX_ORACLE_HPP
#define LENDX_ORACLE_HPP

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "types.hpp"

namespace lendx {

// =============================================================================
// Price Data
// =============================================================================

struct PriceData {
    I128 price_x18;        // Quote-currency units per 1 asset unit
    uint64_t timestamp;    // Time of last update
};

// =============================================================================
// PriceOracle - Single trusted price source
// =============================================================================

class PriceOracle {
public:
    PriceOracle() = default;
    ~PriceOracle() = default;

    // Non-copyable
    PriceOracle(const PriceOracle&) = delete;
    PriceOracle& operator=(const PriceOracle&) = delete;

    // Administrative write. Rejects non-positive prices.
    int32_t set_price(const Currency& asset, I128 price_x18, uint64_t timestamp = 0);

    // Batch update; all-or-nothing
    int32_t set_prices(const std::vector<std::pair<Currency, I128>>& prices, uint64_t timestamp = 0);

    std::optional<I128> get_price(const Currency& asset) const;
    std::optional<PriceData> get_price_data(const Currency& asset) const;
    bool has_price(const Currency& asset) const;

    // All known prices, ordered by asset
    std::vector<std::pair<Currency, PriceData>> all_prices() const;

    // Drop every price (snapshot restore)
    void clear();

    uint64_t total_updates() const { return total_updates_.load(std::memory_order_relaxed); }

private:
    std::map<Currency, PriceData> prices_;
    mutable std::shared_mutex prices_mutex_;

    std::atomic<uint64_t> total_updates_{0};

    uint64_t current_timestamp() const;
};

} // namespace lendx

#endif // LENDX_ORACLE_HPP
