// =============================================================================
// dutch_auction.cpp - Dutch auction pools
// =============================================================================

#include "nftmart/dutch_auction.hpp"
#include "nftmart/log.hpp"

namespace nftmart {

DutchAuctionMarket::DutchAuctionMarket(const Host& host)
    : MechanismBase(host, Mechanism::DUTCH_AUCTION) {}

int32_t DutchAuctionMarket::create(const Address& creator, const DutchAuctionParams& params,
                                   std::vector<Token>&& tokens) {
    if (params.name.empty()) {
        return reject("create", params.name, errors::INVALID_PARAMETER);
    }
    if (params.reserve_price == 0 || params.starting_price <= params.reserve_price) {
        return reject("create", params.name, errors::INVALID_PRICE);
    }
    if (params.end_at <= params.start_at) {
        return reject("create", params.name, errors::INVALID_TIME_WINDOW);
    }
    int32_t rc = validate_escrow(tokens);
    if (rc != errors::OK) {
        return reject("create", params.name, rc);
    }

    Payout payout;
    rc = Payout::from_schedule(params.fees, creator, payout);
    if (rc != errors::OK) {
        return reject("create", params.name, rc);
    }
    if (registry_.contains(creator, params.name)) {
        return reject("create", params.name, errors::POOL_ALREADY_EXISTS);
    }

    const size_t count = tokens.size();
    DutchAuctionPool pool{creator, params.currency, params.starting_price,
                          params.reserve_price, params.start_at, params.end_at,
                          payout, std::move(tokens)};
    rc = registry_.insert(creator, params.name, std::move(pool));
    if (rc != errors::OK) {
        return rc;
    }

    on_created(creator, params.name, count);
    return errors::OK;
}

int32_t DutchAuctionMarket::mint(const Address& owner, const std::string& name,
                                 const Address& buyer, Amount payment_amount, uint64_t count) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("mint", name, rc);
    }
    DutchAuctionPool& pool = *registry_.find(owner, name);

    if (count == 0) {
        return reject("mint", name, errors::INVALID_COUNT);
    }
    const Timestamp t = now();
    if (t <= pool.start_at) {
        return reject("mint", name, errors::NOT_OPEN);
    }

    const Amount unit_price = price_at(pool, t);
    if (static_cast<U128>(payment_amount) < static_cast<U128>(unit_price) * count) {
        return reject("mint", name, errors::INSUFFICIENT_PAYMENT);
    }
    if (count > pool.tokens.size()) {
        return reject("mint", name, errors::INSUFFICIENT_ASSETS);
    }

    Coin payment;
    rc = collect(buyer, pool.currency, payment_amount, payment);
    if (rc != errors::OK) {
        return reject("mint", name, rc);
    }
    rc = settle_payment(pool.payout, payment, buyer);
    if (rc != errors::OK) {
        return reject("mint", name, rc);
    }

    release(pool.tokens, static_cast<size_t>(count), buyer);

    market_log().info("dutch_auction '{}': {} bought {} at unit price {}", name,
                      addresses::to_hex(buyer), count, unit_price);
    emit(EventKind::PURCHASE, owner, name, buyer, payment_amount, count);
    return errors::OK;
}

int32_t DutchAuctionMarket::destroy(const Address& owner, const std::string& name) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("destroy", name, rc);
    }
    if (!registry_.find(owner, name)->tokens.empty()) {
        return reject("destroy", name, errors::NOT_EMPTY);
    }

    rc = registry_.erase(owner, name);
    if (rc != errors::OK) {
        return rc;
    }
    on_removed(owner, name);
    return errors::OK;
}

std::optional<Amount> DutchAuctionMarket::current_price(const Address& owner,
                                                        const std::string& name) const {
    const DutchAuctionPool* pool = registry_.find(owner, name);
    if (!pool) return std::nullopt;
    const Timestamp t = now();
    if (t < pool->start_at) return std::nullopt;
    return price_at(*pool, t);
}

std::optional<DutchAuctionInfo> DutchAuctionMarket::get_pool(const Address& owner,
                                                             const std::string& name) const {
    const DutchAuctionPool* pool = registry_.find(owner, name);
    if (!pool) return std::nullopt;
    return DutchAuctionInfo{pool->creator, pool->currency, pool->starting_price,
                            pool->reserve_price, pool->start_at, pool->end_at,
                            pool->tokens.size(), pool->payout};
}

} // namespace nftmart
