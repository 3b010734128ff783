#ifndef NFTMART_MARKET_HPP
#define NFTMART_MARKET_HPP

// =============================================================================
// nftmart - NFT Marketplace Settlement Engine
//
// Sale mechanisms:
//   FixedPriceMarket     (atomic swap at a fixed unit price)
//   BlindBoxMarket       (batch mint, buyer does not choose)
//   EnglishAuctionMarket (ascending bids, anti-snipe close)
//   DutchAuctionMarket   (linearly decaying price)
//   LotteryMarket        (bet to enter, share_num winners)
//
// Every mechanism settles through PaymentSplitter (proceeds/fee/royalty).
// =============================================================================

#include <memory>

#include "types.hpp"
#include "config.hpp"
#include "host.hpp"
#include "events.hpp"
#include "fixed_price.hpp"
#include "blind_box.hpp"
#include "english_auction.hpp"
#include "dutch_auction.hpp"
#include "lottery.hpp"

namespace nftmart {

class Marketplace {
public:
    // Throws std::invalid_argument if config fails validation
    explicit Marketplace(const Host& host, const MarketConfig& config = {});
    ~Marketplace();

    // Non-copyable
    Marketplace(const Marketplace&) = delete;
    Marketplace& operator=(const Marketplace&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    FixedPriceMarket& fixed_price() { return *fixed_price_; }
    const FixedPriceMarket& fixed_price() const { return *fixed_price_; }

    BlindBoxMarket& blind_box() { return *blind_box_; }
    const BlindBoxMarket& blind_box() const { return *blind_box_; }

    EnglishAuctionMarket& english_auction() { return *english_auction_; }
    const EnglishAuctionMarket& english_auction() const { return *english_auction_; }

    DutchAuctionMarket& dutch_auction() { return *dutch_auction_; }
    const DutchAuctionMarket& dutch_auction() const { return *dutch_auction_; }

    LotteryMarket& lottery() { return *lottery_; }
    const LotteryMarket& lottery() const { return *lottery_; }

    const MarketConfig& config() const { return config_; }

    // Route every mechanism's events to one listener (nullptr to detach)
    void set_event_listener(EventListener* listener);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct GlobalStats {
        MechanismStats fixed_price;
        MechanismStats blind_box;
        MechanismStats english_auction;
        MechanismStats dutch_auction;
        MechanismStats lottery;
        Amount total_volume;
        Amount total_fees;
        Amount total_royalties;
    };
    GlobalStats get_stats() const;

    static constexpr const char* version() { return "1.0.0"; }

private:
    MarketConfig config_;

    std::unique_ptr<FixedPriceMarket> fixed_price_;
    std::unique_ptr<BlindBoxMarket> blind_box_;
    std::unique_ptr<EnglishAuctionMarket> english_auction_;
    std::unique_ptr<DutchAuctionMarket> dutch_auction_;
    std::unique_ptr<LotteryMarket> lottery_;
};

} // namespace nftmart

#endif // NFTMART_MARKET_HPP
