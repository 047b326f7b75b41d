#ifndef LENDX_TRANSFER_HPP
#define LENDX_TRANSFER_HPP

#include <map>
#include <shared_mutex>

#include "types.hpp"

namespace lendx {

// =============================================================================
// Asset Transfer Interface
//
// Moves value between an account's wallet and protocol custody. Both calls
// are all-or-nothing and return errors::OK or errors::TRANSFER_FAILED.
// =============================================================================

class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    // Wallet -> custody
    virtual int32_t pull(const Currency& asset, const Account& from, I128 amount_x18) = 0;

    // Custody -> wallet
    virtual int32_t push(const Currency& asset, const Account& to, I128 amount_x18) = 0;
};

// =============================================================================
// Custody - in-memory wallets and protocol holdings
// =============================================================================

class Custody : public IAssetTransfer {
public:
    Custody() = default;

    // Non-copyable
    Custody(const Custody&) = delete;
    Custody& operator=(const Custody&) = delete;

    int32_t pull(const Currency& asset, const Account& from, I128 amount_x18) override;
    int32_t push(const Currency& asset, const Account& to, I128 amount_x18) override;

    // Credit a wallet from outside the protocol (faucet / bridge-in).
    // Throws std::overflow_error if the balance would leave I128.
    void mint(const Currency& asset, const Account& to, I128 amount_x18);

    I128 wallet_balance(const Currency& asset, const Account& account) const;
    I128 custody_balance(const Currency& asset) const;

private:
    std::map<std::pair<Account, Currency>, I128> wallets_;
    std::map<Currency, I128> holdings_;
    mutable std::shared_mutex mutex_;
};

} // namespace lendx

#endif // LENDX_TRANSFER_HPP
