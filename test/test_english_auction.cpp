// nftmart - English Auction Tests

#include <catch2/catch_test_macros.hpp>
#include <nftmart/english_auction.hpp>
#include "test_helpers.hpp"
#include <stdexcept>

using namespace nftmart;
using namespace nftmart::test;

namespace {

constexpr uint64_t CONFIRM = 600;

EnglishAuctionParams auction_params(bool fixed_end = false) {
    return EnglishAuctionParams{"lot", NATIVE_COIN, 10, 5, T0, CONFIRM, fixed_end,
                                make_fees(1, 40, 1, 20)};
}

} // namespace

TEST_CASE("English auction creation", "[english_auction]") {
    MarketFixture fx;
    EnglishAuctionMarket market(fx.host);

    SECTION("Close time starts at open_at + confirm_time") {
        REQUIRE(market.create(CREATOR, auction_params(), fx.single("lot")) == errors::OK);
        auto info = market.get_pool(CREATOR, "lot");
        REQUIRE(info->close_at == T0 + CONFIRM);
        REQUIRE(info->has_asset);
        REQUIRE_FALSE(info->current_bidder.has_value());
    }

    SECTION("Confirm window bounds come from config") {
        EnglishAuctionParams params = auction_params();
        params.confirm_time = 299;
        REQUIRE(market.create(CREATOR, params, fx.single("lot")) == errors::INVALID_TIME_WINDOW);
        params.confirm_time = 86401;
        REQUIRE(market.create(CREATOR, params, fx.single("lot", 1)) ==
                errors::INVALID_TIME_WINDOW);

        EnglishAuctionMarket narrowed(fx.host, MarketConfig().with_confirm_window(600, 3600));
        params.confirm_time = 599;
        REQUIRE(narrowed.create(CREATOR, params, fx.single("lot", 2)) ==
                errors::INVALID_TIME_WINDOW);
        params.confirm_time = 3601;
        REQUIRE(narrowed.create(CREATOR, params, fx.single("lot", 3)) ==
                errors::INVALID_TIME_WINDOW);
        params.confirm_time = 3600;
        REQUIRE(narrowed.create(CREATOR, params, fx.single("lot", 4)) == errors::OK);
    }

    SECTION("Config cannot widen the confirm window past 5 minutes to 24 hours") {
        REQUIRE_THROWS_AS(EnglishAuctionMarket(fx.host, MarketConfig().with_confirm_window(1, 600)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(
            EnglishAuctionMarket(fx.host, MarketConfig().with_confirm_window(300, 100000)),
            std::invalid_argument);
    }

    SECTION("Invalid amounts") {
        EnglishAuctionParams params = auction_params();
        params.min_amount = 0;
        REQUIRE(market.create(CREATOR, params, fx.single("lot")) == errors::INVALID_PRICE);

        params = auction_params();
        params.min_increase = 0;
        REQUIRE(market.create(CREATOR, params, fx.single("lot", 1)) ==
                errors::INVALID_PARAMETER);
    }
}

TEST_CASE("English auction bidding", "[english_auction]") {
    MarketFixture fx;
    EnglishAuctionMarket market(fx.host);
    REQUIRE(market.create(CREATOR, auction_params(), fx.single("lot")) == errors::OK);

    SECTION("Outbid bidder is refunded exactly") {
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::OK);
        REQUIRE(fx.balance(ALICE) == STARTING_BALANCE - 100);

        REQUIRE(market.bid(CREATOR, "lot", BOB, 150) == errors::OK);
        REQUIRE(fx.balance(ALICE) == STARTING_BALANCE);
        REQUIRE(fx.balance(BOB) == STARTING_BALANCE - 150);

        auto info = market.get_pool(CREATOR, "lot");
        REQUIRE(info->current_bidder == BOB);
        REQUIRE(info->current_bid == 150);
        REQUIRE(info->held_funds == 150);
    }

    SECTION("Bids must beat the minimum and the current bid") {
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 10) == errors::BID_TOO_LOW);
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::OK);
        REQUIRE(market.bid(CREATOR, "lot", BOB, 100) == errors::BID_TOO_LOW);
        REQUIRE(fx.balance(BOB) == STARTING_BALANCE);
    }

    SECTION("min_increase is recorded but not enforced") {
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::OK);
        // 101 < 100 + min_increase(5), still accepted
        REQUIRE(market.bid(CREATOR, "lot", BOB, 101) == errors::OK);
        REQUIRE(market.get_pool(CREATOR, "lot")->min_increase == 5);
    }

    SECTION("Bid at close_at - 1 extends the close") {
        fx.clock.set(T0 + CONFIRM - 1);
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::OK);
        REQUIRE(market.get_pool(CREATOR, "lot")->close_at == fx.clock.now() + CONFIRM);

        fx.clock.advance(CONFIRM - 1);
        REQUIRE(market.bid(CREATOR, "lot", BOB, 200) == errors::OK);
    }

    SECTION("Bid at close is rejected") {
        fx.clock.set(T0 + CONFIRM);
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::CLOSED);
    }

    SECTION("Bidder without funds") {
        const Address broke = addresses::from_id(99);
        REQUIRE(market.bid(CREATOR, "lot", broke, 100) == errors::INSUFFICIENT_BALANCE);
        REQUIRE_FALSE(market.get_pool(CREATOR, "lot")->current_bidder.has_value());
    }
}

TEST_CASE("English auction timing", "[english_auction]") {
    MarketFixture fx;
    EnglishAuctionMarket market(fx.host);

    SECTION("Not open yet") {
        EnglishAuctionParams params = auction_params();
        params.open_at = T0 + 100;
        REQUIRE(market.create(CREATOR, params, fx.single("lot")) == errors::OK);
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::NOT_OPEN);
    }

    SECTION("Fixed end never moves") {
        REQUIRE(market.create(CREATOR, auction_params(true), fx.single("lot")) == errors::OK);
        fx.clock.set(T0 + CONFIRM - 1);
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::OK);
        REQUIRE(market.get_pool(CREATOR, "lot")->close_at == T0 + CONFIRM);
        fx.clock.advance(1);
        REQUIRE(market.bid(CREATOR, "lot", BOB, 200) == errors::CLOSED);
    }
}

TEST_CASE("English auction claims", "[english_auction]") {
    MarketFixture fx;
    EnglishAuctionMarket market(fx.host);
    REQUIRE(market.create(CREATOR, auction_params(), fx.single("lot")) == errors::OK);

    SECTION("No bids: creator takes the asset back") {
        REQUIRE(market.creator_claim(CREATOR, "lot") == errors::NOT_CLOSED);
        fx.clock.advance(CONFIRM);
        REQUIRE(market.creator_claim(CREATOR, "lot") == errors::OK);
        REQUIRE(fx.tokens.holdings(CREATOR) == 1);
        REQUIRE_FALSE(market.get_pool(CREATOR, "lot").has_value());
    }

    SECTION("Winning bidder claims and settles") {
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::OK);
        REQUIRE(market.bid(CREATOR, "lot", BOB, 400) == errors::OK);

        int32_t rc = market.bidder_claim(CREATOR, "lot", BOB);
        REQUIRE(rc == errors::NOT_CLOSED);
        REQUIRE(errors::is_retryable(rc));

        fx.clock.advance(CONFIRM);
        REQUIRE(market.bidder_claim(CREATOR, "lot", ALICE) == errors::UNAUTHORIZED);
        REQUIRE(market.bidder_claim(CREATOR, "lot", BOB) == errors::OK);

        REQUIRE(fx.tokens.holdings(BOB) == 1);
        REQUIRE(fx.balance(TREASURY) == 9);    // 1/40 is inexact in FP32, 10 rounds down
        REQUIRE(fx.balance(ARTIST) == 19);
        REQUIRE(fx.balance(CREATOR) == 372);
        REQUIRE_FALSE(market.get_pool(CREATOR, "lot").has_value());
        REQUIRE(market.creator_claim(CREATOR, "lot") == errors::POOL_NOT_FOUND);
    }

    SECTION("Creator settles first, bidder still gets the asset") {
        REQUIRE(market.bid(CREATOR, "lot", ALICE, 100) == errors::OK);
        fx.clock.advance(CONFIRM);

        REQUIRE(market.creator_claim(CREATOR, "lot") == errors::OK);
        const Amount creator_after = fx.balance(CREATOR);
        REQUIRE(creator_after > 0);
        REQUIRE(market.get_pool(CREATOR, "lot")->has_asset);
        REQUIRE(market.creator_claim(CREATOR, "lot") == errors::ALREADY_SETTLED);

        REQUIRE(market.bidder_claim(CREATOR, "lot", ALICE) == errors::OK);
        REQUIRE(fx.tokens.holdings(ALICE) == 1);
        REQUIRE(fx.balance(CREATOR) == creator_after);
        REQUIRE(fx.coins.total_supply(NATIVE_COIN) == 5 * STARTING_BALANCE);
        REQUIRE(market.get_stats().volume_settled == 100);
    }
}
