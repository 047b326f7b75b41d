// =============================================================================
// transfer.cpp - In-memory custody
// =============================================================================

#include "lendx/transfer.hpp"
#include <mutex>

namespace lendx {

int32_t Custody::pull(const Currency& asset, const Account& from, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::TRANSFER_FAILED;
    }

    std::unique_lock lock(mutex_);

    auto it = wallets_.find({from, asset});
    if (it == wallets_.end() || it->second < amount_x18) {
        return errors::TRANSFER_FAILED;
    }

    I128 held;
    if (__builtin_add_overflow(holdings_[asset], amount_x18, &held)) {
        return errors::TRANSFER_FAILED;
    }
    it->second -= amount_x18;
    holdings_[asset] = held;
    return errors::OK;
}

int32_t Custody::push(const Currency& asset, const Account& to, I128 amount_x18) {
    if (amount_x18 <= 0) {
        return errors::TRANSFER_FAILED;
    }

    std::unique_lock lock(mutex_);

    auto it = holdings_.find(asset);
    if (it == holdings_.end() || it->second < amount_x18) {
        return errors::TRANSFER_FAILED;
    }

    I128& wallet = wallets_[{to, asset}];
    I128 credited;
    if (__builtin_add_overflow(wallet, amount_x18, &credited)) {
        return errors::TRANSFER_FAILED;
    }
    it->second -= amount_x18;
    wallet = credited;
    return errors::OK;
}

void Custody::mint(const Currency& asset, const Account& to, I128 amount_x18) {
    if (amount_x18 <= 0) return;
    std::unique_lock lock(mutex_);
    I128& wallet = wallets_[{to, asset}];
    wallet = x18::add(wallet, amount_x18);
}

I128 Custody::wallet_balance(const Currency& asset, const Account& account) const {
    std::shared_lock lock(mutex_);
    auto it = wallets_.find({account, asset});
    return (it != wallets_.end()) ? it->second : 0;
}

I128 Custody::custody_balance(const Currency& asset) const {
    std::shared_lock lock(mutex_);
    auto it = holdings_.find(asset);
    return (it != holdings_.end()) ? it->second : 0;
}

} // namespace lendx
