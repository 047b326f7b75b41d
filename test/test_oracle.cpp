// lendx - Price Oracle Tests

#include "test_helpers.hpp"

using namespace lendx;
using namespace lendx::testing;

TEST_CASE("PriceOracle updates", "[oracle]") {
    PriceOracle oracle;

    REQUIRE_FALSE(oracle.has_price(USDC));
    REQUIRE_FALSE(oracle.get_price(USDC).has_value());

    SECTION("Single update keeps its timestamp") {
        REQUIRE(oracle.set_price(USDC, X18_ONE, 1234) == errors::OK);
        auto data = oracle.get_price_data(USDC);
        REQUIRE(data.has_value());
        REQUIRE(data->price_x18 == X18_ONE);
        REQUIRE(data->timestamp == 1234);
    }

    SECTION("Zero timestamp means now") {
        REQUIRE(oracle.set_price(USDC, X18_ONE) == errors::OK);
        REQUIRE(oracle.get_price_data(USDC)->timestamp > 0);
    }

    SECTION("Non-positive prices are refused") {
        REQUIRE(oracle.set_price(USDC, 0) == errors::INVALID_PRICE);
        REQUIRE(oracle.set_price(USDC, -X18_ONE) == errors::INVALID_PRICE);
        REQUIRE(oracle.total_updates() == 0);
    }

    SECTION("Batch is all-or-nothing") {
        REQUIRE(oracle.set_prices({{USDC, X18_ONE}, {WETH, 0}}, 10) == errors::INVALID_PRICE);
        REQUIRE_FALSE(oracle.has_price(USDC));

        REQUIRE(oracle.set_prices({{USDC, X18_ONE}, {WETH, units(2000)}}, 10) == errors::OK);
        REQUIRE(oracle.get_price(WETH) == units(2000));
        REQUIRE(oracle.total_updates() == 2);

        auto all = oracle.all_prices();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0].first == USDC);

        oracle.clear();
        REQUIRE(oracle.all_prices().empty());
    }
}
