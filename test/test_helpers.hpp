// lendx - shared test fixtures

#ifndef LENDX_TEST_HELPERS_HPP
#define LENDX_TEST_HELPERS_HPP

#include <catch2/catch_test_macros.hpp>
#include <lendx/ledger.hpp>
#include <sstream>
#include <string>

namespace Catch {
template <>
struct StringMaker<lendx::I128> {
    static std::string convert(lendx::I128 v) { return lendx::x18::to_string(v); }
};
} // namespace Catch

namespace lendx::testing {

inline I128 units(int64_t n) { return x18::from_int(n); }

// 18-decimal literal, "0.85" -> 850000000000000000
inline I128 dec(const char* text) { return *x18::parse_decimal(text); }

inline const Currency USDC{addresses::from_index(1)};
inline const Currency DAI{addresses::from_index(2)};
inline const Currency WETH{addresses::from_index(3)};

inline Account account(uint16_t n, uint16_t sub = 0) {
    return Account{addresses::from_index(static_cast<uint16_t>(0x1000 + n)), sub};
}

inline MarketParams market_params(const Currency& asset,
                                  I128 supply_apr = 0, I128 borrow_apr = 0,
                                  const char* cf = "0.80", const char* lt = "0.85") {
    return MarketParams{
        .asset = asset,
        .annual_supply_rate_x18 = supply_apr,
        .annual_borrow_rate_x18 = borrow_apr,
        .reserve_factor_x18 = dec("0.10"),
        .collateral_factor_x18 = dec(cf),
        .liquidation_threshold_x18 = dec(lt),
        .initial_price_x18 = X18_ONE
    };
}

// Pool over in-memory custody with a hand-driven clock
struct PoolFixture {
    Custody custody;
    LendingPool pool{custody};
    uint64_t clock = 1'700'000'000;
    std::ostringstream log_output;

    PoolFixture() {
        pool.set_clock([this] { return clock; });
        pool.logger().set_sink(&log_output);
        pool.logger().set_level(log::Level::DEBUG);
    }

    void advance(uint64_t seconds) { clock += seconds; }

    void deposit(const Account& who, const Currency& asset, I128 amount) {
        custody.mint(asset, who, amount);
        REQUIRE(pool.supply(who, asset, amount) == errors::OK);
    }
};

} // namespace lendx::testing

#endif // LENDX_TEST_HELPERS_HPP
