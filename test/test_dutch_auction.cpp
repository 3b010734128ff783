// nftmart - Dutch Auction Tests

#include <catch2/catch_test_macros.hpp>
#include <nftmart/dutch_auction.hpp>
#include "test_helpers.hpp"

using namespace nftmart;
using namespace nftmart::test;

namespace {

DutchAuctionParams dutch_params(Timestamp start_at = T0, Timestamp end_at = T0 + 100) {
    return DutchAuctionParams{"dutch", NATIVE_COIN, 1000, 100, start_at, end_at, make_fees()};
}

} // namespace

TEST_CASE("Dutch auction creation", "[dutch_auction]") {
    MarketFixture fx;
    DutchAuctionMarket market(fx.host);

    SECTION("Prices must decay to a positive reserve") {
        DutchAuctionParams params = dutch_params();
        params.reserve_price = 0;
        REQUIRE(market.create(CREATOR, params, fx.escrow("d", 1)) == errors::INVALID_PRICE);

        params = dutch_params();
        params.starting_price = 100;
        REQUIRE(market.create(CREATOR, params, fx.escrow("d", 1)) == errors::INVALID_PRICE);
    }

    SECTION("Window must be non-empty") {
        REQUIRE(market.create(CREATOR, dutch_params(T0, T0), fx.escrow("d", 1)) ==
                errors::INVALID_TIME_WINDOW);
    }

    SECTION("Empty asset set") {
        REQUIRE(market.create(CREATOR, dutch_params(), {}) == errors::EMPTY_ASSETS);
    }
}

TEST_CASE("Dutch auction pricing and minting", "[dutch_auction]") {
    MarketFixture fx;
    DutchAuctionMarket market(fx.host);
    REQUIRE(market.create(CREATOR, dutch_params(T0 + 10, T0 + 110), fx.escrow("d", 3)) ==
            errors::OK);

    SECTION("No price before start") {
        REQUIRE_FALSE(market.current_price(CREATOR, "dutch").has_value());
        REQUIRE_FALSE(market.current_price(CREATOR, "missing").has_value());
    }

    SECTION("Minting at start_at is still closed") {
        fx.clock.set(T0 + 10);
        REQUIRE(market.current_price(CREATOR, "dutch") == Amount(1000));
        REQUIRE(market.mint(CREATOR, "dutch", ALICE, 1000, 1) == errors::NOT_OPEN);
    }

    SECTION("Halfway price") {
        fx.clock.set(T0 + 60);
        REQUIRE(market.current_price(CREATOR, "dutch") == Amount(550));

        REQUIRE(market.mint(CREATOR, "dutch", ALICE, 1099, 2) == errors::INSUFFICIENT_PAYMENT);
        REQUIRE(market.mint(CREATOR, "dutch", ALICE, 1100, 2) == errors::OK);
        REQUIRE(fx.tokens.holdings(ALICE) == 2);
        REQUIRE(fx.balance(CREATOR) == 1100);
        REQUIRE(market.get_pool(CREATOR, "dutch")->remaining == 1);
    }

    SECTION("Reserve price after end") {
        fx.clock.set(T0 + 5000);
        REQUIRE(market.current_price(CREATOR, "dutch") == Amount(100));
        REQUIRE(market.mint(CREATOR, "dutch", BOB, 300, 3) == errors::OK);
        REQUIRE(market.mint(CREATOR, "dutch", BOB, 100, 1) == errors::INSUFFICIENT_ASSETS);
        REQUIRE(market.destroy(CREATOR, "dutch") == errors::OK);
    }

    SECTION("Rejections") {
        fx.clock.set(T0 + 60);
        REQUIRE(market.mint(CREATOR, "dutch", ALICE, 1000, 0) == errors::INVALID_COUNT);
        REQUIRE(market.mint(CREATOR, "dutch", ALICE, 5000, 4) == errors::INSUFFICIENT_ASSETS);
        REQUIRE(market.destroy(CREATOR, "dutch") == errors::NOT_EMPTY);
        REQUIRE(fx.balance(ALICE) == STARTING_BALANCE);
    }

    SECTION("Price never rises between purchases") {
        Amount previous = 1000;
        for (Timestamp t = T0 + 11; t <= T0 + 200; t += 7) {
            fx.clock.set(t);
            Amount price = *market.current_price(CREATOR, "dutch");
            REQUIRE(price <= previous);
            previous = price;
        }
        REQUIRE(previous == 100);
    }
}
