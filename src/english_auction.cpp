// =============================================================================
// english_auction.cpp - English auction pools with anti-snipe extension
// =============================================================================

#include "nftmart/english_auction.hpp"
#include "nftmart/log.hpp"

namespace nftmart {

EnglishAuctionMarket::EnglishAuctionMarket(const Host& host, const MarketConfig& config)
    : MechanismBase(host, Mechanism::ENGLISH_AUCTION),
      min_confirm_time_(config.min_confirm_time),
      max_confirm_time_(config.max_confirm_time) {
    config.validate();
}

int32_t EnglishAuctionMarket::create(const Address& creator, const EnglishAuctionParams& params,
                                     Token&& token) {
    if (params.name.empty()) {
        return reject("create", params.name, errors::INVALID_PARAMETER);
    }
    if (params.min_amount == 0) {
        return reject("create", params.name, errors::INVALID_PRICE);
    }
    if (params.min_increase == 0) {
        return reject("create", params.name, errors::INVALID_PARAMETER);
    }
    if (params.confirm_time < min_confirm_time_ || params.confirm_time > max_confirm_time_) {
        return reject("create", params.name, errors::INVALID_TIME_WINDOW);
    }
    if (token.amount() == 0) {
        return reject("create", params.name, errors::EMPTY_ASSETS);
    }

    Payout payout;
    int32_t rc = Payout::from_schedule(params.fees, creator, payout);
    if (rc != errors::OK) {
        return reject("create", params.name, rc);
    }
    if (registry_.contains(creator, params.name)) {
        return reject("create", params.name, errors::POOL_ALREADY_EXISTS);
    }

    EnglishAuctionPool pool{creator, params.currency, params.min_amount, params.min_increase,
                            params.open_at, params.open_at + params.confirm_time,
                            params.confirm_time, params.fixed_end, payout,
                            std::move(token), std::nullopt, 0, std::nullopt};
    rc = registry_.insert(creator, params.name, std::move(pool));
    if (rc != errors::OK) {
        return rc;
    }

    on_created(creator, params.name, 1);
    return errors::OK;
}

int32_t EnglishAuctionMarket::bid(const Address& owner, const std::string& name,
                                  const Address& bidder, Amount amount) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("bid", name, rc);
    }
    EnglishAuctionPool& pool = *registry_.find(owner, name);

    const Timestamp t = now();
    if (t < pool.open_at) {
        return reject("bid", name, errors::NOT_OPEN);
    }
    if (t >= pool.close_at) {
        return reject("bid", name, errors::CLOSED);
    }
    if (amount <= pool.min_amount) {
        return reject("bid", name, errors::BID_TOO_LOW);
    }
    if (pool.current_bidder && amount <= pool.current_bid) {
        return reject("bid", name, errors::BID_TOO_LOW);
    }

    Coin locked;
    rc = collect(bidder, pool.currency, amount, locked);
    if (rc != errors::OK) {
        return reject("bid", name, rc);
    }

    if (pool.held_bid && pool.current_bidder) {
        const Address previous = *pool.current_bidder;
        const Amount refunded = pool.held_bid->value();
        host_.coins.deposit(previous, std::move(*pool.held_bid));
        emit(EventKind::REFUND, owner, name, previous, refunded, 0);
    }

    pool.held_bid.emplace(std::move(locked));
    pool.current_bidder = bidder;
    pool.current_bid = amount;
    if (!pool.fixed_end) {
        pool.close_at = t + pool.confirm_time;
    }

    market_log().info("english_auction '{}': {} bid {}, closes at {}", name,
                      addresses::to_hex(bidder), amount, pool.close_at);
    emit(EventKind::BID, owner, name, bidder, amount, 0);
    return errors::OK;
}

int32_t EnglishAuctionMarket::bidder_claim(const Address& owner, const std::string& name,
                                           const Address& bidder) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("bidder_claim", name, rc);
    }
    EnglishAuctionPool& pool = *registry_.find(owner, name);

    if (!pool.current_bidder || *pool.current_bidder != bidder) {
        return reject("bidder_claim", name, errors::UNAUTHORIZED);
    }
    if (now() < pool.close_at) {
        return reject("bidder_claim", name, errors::NOT_CLOSED);
    }
    if (!pool.token) {
        return reject("bidder_claim", name, errors::INSUFFICIENT_ASSETS);
    }

    if (pool.held_bid) {
        const Amount funds = pool.held_bid->value();
        rc = settle(pool.payout, *pool.held_bid);
        if (rc != errors::OK) {
            return reject("bidder_claim", name, rc);
        }
        pool.held_bid.reset();
        emit(EventKind::SETTLED, owner, name, bidder, funds, 0);
    }

    std::vector<Token> escrow;
    escrow.push_back(std::move(*pool.token));
    pool.token.reset();
    release(escrow, 1, bidder);
    emit(EventKind::CLAIMED, owner, name, bidder, 0, 1);

    rc = registry_.erase(owner, name);
    if (rc != errors::OK) {
        return rc;
    }
    on_removed(owner, name);
    return errors::OK;
}

int32_t EnglishAuctionMarket::creator_claim(const Address& creator, const std::string& name) {
    int32_t rc = registry_.status(creator, name);
    if (rc != errors::OK) {
        return reject("creator_claim", name, rc);
    }
    EnglishAuctionPool& pool = *registry_.find(creator, name);

    if (pool.creator != creator) {
        return reject("creator_claim", name, errors::UNAUTHORIZED);
    }
    if (now() < pool.close_at) {
        return reject("creator_claim", name, errors::NOT_CLOSED);
    }

    if (pool.current_bidder) {
        // Asset stays escrowed for the winning bidder
        if (!pool.held_bid) {
            return reject("creator_claim", name, errors::ALREADY_SETTLED);
        }
        const Amount funds = pool.held_bid->value();
        rc = settle(pool.payout, *pool.held_bid);
        if (rc != errors::OK) {
            return reject("creator_claim", name, rc);
        }
        pool.held_bid.reset();
        market_log().info("english_auction '{}': creator settled winning bid {}", name, funds);
        emit(EventKind::SETTLED, creator, name, creator, funds, 0);
        return errors::OK;
    }

    if (!pool.token) {
        return reject("creator_claim", name, errors::INSUFFICIENT_ASSETS);
    }
    std::vector<Token> escrow;
    escrow.push_back(std::move(*pool.token));
    pool.token.reset();
    release(escrow, 1, creator);
    emit(EventKind::CLAIMED, creator, name, creator, 0, 1);

    rc = registry_.erase(creator, name);
    if (rc != errors::OK) {
        return rc;
    }
    on_removed(creator, name);
    return errors::OK;
}

std::optional<EnglishAuctionInfo> EnglishAuctionMarket::get_pool(const Address& owner,
                                                                 const std::string& name) const {
    const EnglishAuctionPool* pool = registry_.find(owner, name);
    if (!pool) return std::nullopt;
    return EnglishAuctionInfo{pool->creator, pool->currency, pool->min_amount,
                              pool->min_increase, pool->open_at, pool->close_at,
                              pool->confirm_time, pool->fixed_end, pool->token.has_value(),
                              pool->current_bidder, pool->current_bid,
                              pool->held_bid ? pool->held_bid->value() : 0, pool->payout};
}

} // namespace nftmart
