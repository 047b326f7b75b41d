// lendx - Custody Tests

#include "test_helpers.hpp"

using namespace lendx;
using namespace lendx::testing;

TEST_CASE("Custody moves funds between wallets and holdings", "[transfer]") {
    Custody custody;
    Account alice = account(1);
    Account bob = account(2);

    custody.mint(USDC, alice, units(100));

    SECTION("Pull then push") {
        REQUIRE(custody.pull(USDC, alice, units(60)) == errors::OK);
        REQUIRE(custody.wallet_balance(USDC, alice) == units(40));
        REQUIRE(custody.custody_balance(USDC) == units(60));

        REQUIRE(custody.push(USDC, bob, units(60)) == errors::OK);
        REQUIRE(custody.wallet_balance(USDC, bob) == units(60));
        REQUIRE(custody.custody_balance(USDC) == 0);
    }

    SECTION("Short wallet") {
        REQUIRE(custody.pull(USDC, alice, units(101)) == errors::TRANSFER_FAILED);
        REQUIRE(custody.pull(USDC, bob, units(1)) == errors::TRANSFER_FAILED);
        REQUIRE(custody.wallet_balance(USDC, alice) == units(100));
    }

    SECTION("Short holdings") {
        REQUIRE(custody.push(USDC, bob, units(1)) == errors::TRANSFER_FAILED);
        REQUIRE(custody.push(DAI, bob, units(1)) == errors::TRANSFER_FAILED);
    }

    SECTION("Non-positive amounts") {
        REQUIRE(custody.pull(USDC, alice, 0) == errors::TRANSFER_FAILED);
        REQUIRE(custody.push(USDC, alice, -1) == errors::TRANSFER_FAILED);
    }

    SECTION("Subaccounts hold separate balances") {
        REQUIRE(custody.wallet_balance(USDC, account(1, 1)) == 0);
    }
}
