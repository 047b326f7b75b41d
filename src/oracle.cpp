// =============================================================================
// oracle.cpp - PriceOracle Implementation
// =============================================================================

#include "lendx/oracle.hpp"
#include <chrono>
#include <mutex>

namespace lendx {

// =============================================================================
// Price Updates
// =============================================================================

int32_t PriceOracle::set_price(const Currency& asset, I128 price_x18, uint64_t timestamp) {
    if (price_x18 <= 0) {
        return errors::INVALID_PRICE;
    }

    if (timestamp == 0) {
        timestamp = current_timestamp();
    }

    std::unique_lock lock(prices_mutex_);
    prices_[asset] = PriceData{price_x18, timestamp};

    total_updates_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t PriceOracle::set_prices(const std::vector<std::pair<Currency, I128>>& prices,
                                uint64_t timestamp) {
    for (const auto& [asset, price] : prices) {
        if (price <= 0) return errors::INVALID_PRICE;
    }

    if (timestamp == 0) {
        timestamp = current_timestamp();
    }

    std::unique_lock lock(prices_mutex_);
    for (const auto& [asset, price] : prices) {
        prices_[asset] = PriceData{price, timestamp};
    }

    total_updates_.fetch_add(prices.size(), std::memory_order_relaxed);
    return errors::OK;
}

// =============================================================================
// Price Queries
// =============================================================================

std::optional<I128> PriceOracle::get_price(const Currency& asset) const {
    auto data = get_price_data(asset);
    if (!data) return std::nullopt;
    return data->price_x18;
}

std::optional<PriceData> PriceOracle::get_price_data(const Currency& asset) const {
    std::shared_lock lock(prices_mutex_);
    auto it = prices_.find(asset);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
}

bool PriceOracle::has_price(const Currency& asset) const {
    std::shared_lock lock(prices_mutex_);
    return prices_.find(asset) != prices_.end();
}

std::vector<std::pair<Currency, PriceData>> PriceOracle::all_prices() const {
    std::shared_lock lock(prices_mutex_);
    return {prices_.begin(), prices_.end()};
}

void PriceOracle::clear() {
    std::unique_lock lock(prices_mutex_);
    prices_.clear();
}

uint64_t PriceOracle::current_timestamp() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

} // namespace lendx
