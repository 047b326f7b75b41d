// lendx - Fixed-Point and Identifier Tests

#include "test_helpers.hpp"
#include <stdexcept>

using namespace lendx;
using namespace lendx::testing;

TEST_CASE("mul_div floors through a wide intermediate", "[types]") {
    SECTION("Floor, not round") {
        REQUIRE(x18::mul_div(10, 10, 3) == 33);
        REQUIRE(x18::mul_div(2, 1, 3) == 0);
    }

    SECTION("Product above 128 bits") {
        REQUIRE(x18::mul_div(I128_MAX, 4, 4) == I128_MAX);
        REQUIRE(x18::mul_div(I128_MAX, X18_ONE, 2 * X18_ONE) == I128_MAX / 2);
    }

    SECTION("Three-factor form rounds once") {
        I128 seize = x18::mul_div(units(400), dec("1.06375"), dec("1.08"), X18_ONE, X18_ONE);
        REQUIRE(seize == dec("459.54"));
    }

    SECTION("Quotient overflow throws") {
        REQUIRE_THROWS_AS(x18::mul_div(I128_MAX, 3, 2), std::overflow_error);
        REQUIRE_THROWS_AS(x18::mul_div(I128_MAX, I128_MAX, I128_MAX, 1, 1), std::overflow_error);
    }

    SECTION("Bad operands") {
        REQUIRE_THROWS_AS(x18::mul_div(-1, 1, 1), std::invalid_argument);
        REQUIRE_THROWS_AS(x18::mul_div(1, 1, 0), std::invalid_argument);
    }
}

TEST_CASE("Checked addition", "[types]") {
    REQUIRE(x18::add(X18_ONE, X18_HALF) == dec("1.5"));
    REQUIRE(x18::add(I128_MAX, 0) == I128_MAX);
    REQUIRE(x18::add(I128_MAX, -1) == I128_MAX - 1);
    REQUIRE_THROWS_AS(x18::add(I128_MAX, 1), std::overflow_error);
    REQUIRE_THROWS_AS(x18::add(-I128_MAX, -2), std::overflow_error);
}

TEST_CASE("Decimal parsing and formatting", "[types]") {
    SECTION("Exact parse") {
        REQUIRE(x18::parse_decimal("0.05") == I128{50000000000000000LL});
        REQUIRE(x18::parse_decimal("1.08") == constants::LIQUIDATION_INCENTIVE_X18);
        REQUIRE(x18::parse_decimal("1_000") == units(1000));
        REQUIRE(x18::parse_decimal("-0.5") == -X18_HALF);
    }

    SECTION("Digits past 18 places are dropped") {
        REQUIRE(x18::parse_decimal("0.0000000000000000019") == I128{1});
    }

    SECTION("Malformed") {
        REQUIRE_FALSE(x18::parse_decimal("").has_value());
        REQUIRE_FALSE(x18::parse_decimal("abc").has_value());
        REQUIRE_FALSE(x18::parse_decimal("1.2.3").has_value());
        REQUIRE_FALSE(x18::parse_decimal(".").has_value());
    }

    SECTION("Format drops trailing zeros") {
        REQUIRE(x18::format(dec("1.5")) == "1.5");
        REQUIRE(x18::format(units(1000)) == "1000");
        REQUIRE(x18::format(-X18_HALF) == "-0.5");
        REQUIRE(x18::format(1) == "0.000000000000000001");
    }

    SECTION("Raw integers") {
        REQUIRE(x18::to_string(I128_MAX) == "170141183460469231731687303715884105727");
        REQUIRE(x18::parse_int("170141183460469231731687303715884105727") == I128_MAX);
        REQUIRE_FALSE(x18::parse_int("170141183460469231731687303715884105728").has_value());
        REQUIRE_FALSE(x18::parse_int("12a").has_value());
        REQUIRE(x18::parse_int("-42") == I128{-42});
    }
}

TEST_CASE("Address hex encoding", "[types]") {
    Address addr = addresses::from_index(0x0102);

    REQUIRE(addresses::to_hex(addr) == "0x0000000000000000000000000000000000000102");
    REQUIRE(addresses::from_hex("0000000000000000000000000000000000000102") == addr);
    REQUIRE(addresses::from_hex("0X0000000000000000000000000000000000000102") == addr);
    REQUIRE_FALSE(addresses::from_hex("0x0102").has_value());
    REQUIRE_FALSE(addresses::from_hex("0xg000000000000000000000000000000000000102").has_value());
}

TEST_CASE("Account ordering", "[types]") {
    Account a = account(1);
    Account a_sub = account(1, 1);
    Account b = account(2);

    REQUIRE(a < a_sub);
    REQUIRE(a_sub < b);
    REQUIRE(a != a_sub);
    REQUIRE(a.hash() != a_sub.hash());
}

TEST_CASE("Error names", "[types]") {
    REQUIRE(std::string(errors::to_string(errors::OK)) == "ok");
    REQUIRE(std::string(errors::to_string(errors::PAUSED)) == "paused");
    REQUIRE(std::string(errors::to_string(12345)) == "unknown error");
}
