// nftmart - Marketplace walkthrough
//
// Usage: nftmart_demo [config.json]
// Bootstraps a few accounts in memory and runs every sale mechanism once.

#include <nftmart/market.hpp>
#include <nftmart/log.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace nftmart;

namespace {

const Address CREATOR = addresses::from_id(1);
const Address TREASURY = addresses::from_id(2);
const Address ARTIST = addresses::from_id(3);
const Address ALICE = addresses::from_id(10);
const Address BOB = addresses::from_id(11);
const Address CAROL = addresses::from_id(12);

class PrintingListener : public EventListener {
public:
    void on_event(const MarketEvent& event) override {
        market_log().info("[event] {} kind={} pool='{}' amount={} count={}",
                          mechanism_name(event.mechanism), static_cast<int>(event.kind),
                          event.pool, event.amount, event.count);
    }
};

// Mint `count` fresh tokens to the creator and pull them into a vector
std::vector<Token> take_tokens(MemoryTokenStore& store, const std::string& collection,
                               size_t count) {
    std::vector<Token> out;
    for (size_t i = 0; i < count; ++i) {
        TokenId id{CREATOR, collection, collection + " #" + std::to_string(i), 0};
        store.mint(CREATOR, id);
        Token token;
        if (store.withdraw(CREATOR, id, 1, token) == errors::OK) {
            out.push_back(std::move(token));
        }
    }
    return out;
}

FeeSchedule default_fees() {
    FeeSchedule fees;
    fees.fee = Fraction{25, 1000};      // 2.5%
    fees.royalty = Fraction{5, 100};    // 5%
    fees.fee_recipient = TREASURY;
    fees.royalty_recipient = ARTIST;
    return fees;
}

void report(const char* step, int32_t rc) {
    if (rc == errors::OK) {
        std::cout << "  " << step << ": ok\n";
    } else {
        std::cout << "  " << step << ": " << errors::message(rc) << " (" << rc << ")\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    MarketConfig config;
    try {
        if (argc > 1) {
            config = MarketConfig::from_file(argv[1]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }
    init_logging(config);

    MemoryCoinStore coins;
    MemoryTokenStore tokens;
    // Start at wall time; the demo advances it by hand
    ManualClock clock(SystemClock().now(), 1);
    const Timestamp start = clock.now();
    Host host{coins, tokens, clock, clock};

    Marketplace market(host, config);
    PrintingListener listener;
    market.set_event_listener(&listener);

    for (const Address& who : {ALICE, BOB, CAROL}) {
        coins.mint(who, NATIVE_COIN, 1000000);
    }

    std::cout << "nftmart " << Marketplace::version() << "\n\n";

    std::cout << "Fixed price\n";
    report("create", market.fixed_price().create(
        CREATOR, FixedPriceParams{"swap", NATIVE_COIN, 100, start, default_fees()},
        take_tokens(tokens, "swap", 3)));
    report("alice pays 250", market.fixed_price().buy(CREATOR, "swap", ALICE, 250));

    std::cout << "Blind box\n";
    report("create", market.blind_box().create(
        CREATOR, BlindBoxParams{"box", NATIVE_COIN, 50, start, default_fees()},
        take_tokens(tokens, "box", 4)));
    report("bob mints 2", market.blind_box().mint(CREATOR, "box", BOB, 100, 2));

    std::cout << "Dutch auction\n";
    report("create", market.dutch_auction().create(
        CREATOR, DutchAuctionParams{"dutch", NATIVE_COIN, 1000, 100, start, start + 100, default_fees()},
        take_tokens(tokens, "dutch", 2)));
    clock.advance(50);
    if (auto price = market.dutch_auction().current_price(CREATOR, "dutch")) {
        std::cout << "  price at t+50: " << *price << "\n";
        report("carol buys 1", market.dutch_auction().mint(CREATOR, "dutch", CAROL, *price, 1));
    }

    std::cout << "English auction\n";
    {
        std::vector<Token> lot = take_tokens(tokens, "english", 1);
        report("create", market.english_auction().create(
            CREATOR,
            EnglishAuctionParams{"english", NATIVE_COIN, 10, 1, clock.now(), 600, false,
                                 default_fees()},
            std::move(lot.front())));
    }
    report("alice bids 100", market.english_auction().bid(CREATOR, "english", ALICE, 100));
    report("bob bids 150", market.english_auction().bid(CREATOR, "english", BOB, 150));
    clock.advance(601);
    report("bob claims", market.english_auction().bidder_claim(CREATOR, "english", BOB));

    std::cout << "Lottery\n";
    report("create", market.lottery().create(
        CREATOR, LotteryParams{"lotto", NATIVE_COIN, clock.now() + 100, 5, 2, default_fees()},
        take_tokens(tokens, "lotto", 2)));
    for (const Address& who : {ALICE, BOB, CAROL}) {
        clock.next_block();
        report("bet", market.lottery().bet(CREATOR, "lotto", who, 20));
    }
    clock.advance(100);
    for (const Address& who : {ALICE, BOB, CAROL}) {
        bool winner = false;
        if (market.lottery().is_winner(CREATOR, "lotto", who, winner) == errors::OK) {
            std::cout << "  " << addresses::to_hex(who) << (winner ? " wins" : " loses") << "\n";
        }
        report("claim", market.lottery().claim(CREATOR, "lotto", who));
    }

    auto stats = market.get_stats();
    std::cout << "\nVolume settled: " << stats.total_volume
              << ", fees: " << stats.total_fees
              << ", royalties: " << stats.total_royalties << "\n";
    std::cout << "Treasury balance: " << coins.balance(TREASURY, NATIVE_COIN)
              << ", artist balance: " << coins.balance(ARTIST, NATIVE_COIN)
              << ", creator balance: " << coins.balance(CREATOR, NATIVE_COIN) << "\n";
    return 0;
}
