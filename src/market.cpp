// =============================================================================
// market.cpp - Marketplace controller
// =============================================================================

#include "nftmart/market.hpp"
#include "nftmart/log.hpp"

namespace nftmart {

Marketplace::Marketplace(const Host& host, const MarketConfig& config)
    : config_(config) {
    config_.validate();

    fixed_price_ = std::make_unique<FixedPriceMarket>(host);
    blind_box_ = std::make_unique<BlindBoxMarket>(host);
    english_auction_ = std::make_unique<EnglishAuctionMarket>(host, config_);
    dutch_auction_ = std::make_unique<DutchAuctionMarket>(host);
    lottery_ = std::make_unique<LotteryMarket>(host, config_);

    market_log().debug("marketplace {} ready (confirm window [{}, {}], lottery cap {})",
                       version(), config_.min_confirm_time, config_.max_confirm_time,
                       config_.max_lottery_players);
}

Marketplace::~Marketplace() = default;

void Marketplace::set_event_listener(EventListener* listener) {
    fixed_price_->set_event_listener(listener);
    blind_box_->set_event_listener(listener);
    english_auction_->set_event_listener(listener);
    dutch_auction_->set_event_listener(listener);
    lottery_->set_event_listener(listener);
}

Marketplace::GlobalStats Marketplace::get_stats() const {
    GlobalStats stats{};
    stats.fixed_price = fixed_price_->get_stats();
    stats.blind_box = blind_box_->get_stats();
    stats.english_auction = english_auction_->get_stats();
    stats.dutch_auction = dutch_auction_->get_stats();
    stats.lottery = lottery_->get_stats();

    for (const MechanismStats* s : {&stats.fixed_price, &stats.blind_box,
                                    &stats.english_auction, &stats.dutch_auction,
                                    &stats.lottery}) {
        stats.total_volume += s->volume_settled;
        stats.total_fees += s->fees_collected;
        stats.total_royalties += s->royalties_collected;
    }
    return stats;
}

} // namespace nftmart
