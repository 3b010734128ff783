// =============================================================================
// fixed_price.cpp - Fixed-price swap pools
// =============================================================================

#include "nftmart/fixed_price.hpp"
#include "nftmart/log.hpp"

namespace nftmart {

FixedPriceMarket::FixedPriceMarket(const Host& host)
    : MechanismBase(host, Mechanism::FIXED_PRICE) {}

int32_t FixedPriceMarket::create(const Address& creator, const FixedPriceParams& params,
                                 std::vector<Token>&& tokens) {
    if (params.name.empty()) {
        return reject("create", params.name, errors::INVALID_PARAMETER);
    }
    if (params.price == 0) {
        return reject("create", params.name, errors::INVALID_PRICE);
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
    FixedPricePool pool{creator, params.currency, params.price, params.open_at,
                        false, payout, std::move(tokens)};
    rc = registry_.insert(creator, params.name, std::move(pool));
    if (rc != errors::OK) {
        return rc;
    }

    on_created(creator, params.name, count);
    return errors::OK;
}

int32_t FixedPriceMarket::buy(const Address& owner, const std::string& name,
                              const Address& buyer, Amount payment_amount) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("buy", name, rc);
    }
    FixedPricePool& pool = *registry_.find(owner, name);

    if (pool.canceled) {
        return reject("buy", name, errors::CANCELED);
    }
    if (now() < pool.open_at) {
        return reject("buy", name, errors::NOT_OPEN);
    }
    if (payment_amount < pool.price) {
        return reject("buy", name, errors::INSUFFICIENT_PAYMENT);
    }

    const Amount units = payment_amount / pool.price;
    if (units == 0) {
        return reject("buy", name, errors::INSUFFICIENT_PAYMENT);
    }
    if (units > pool.tokens.size()) {
        return reject("buy", name, errors::INSUFFICIENT_ASSETS);
    }

    Coin payment;
    rc = collect(buyer, pool.currency, payment_amount, payment);
    if (rc != errors::OK) {
        return reject("buy", name, rc);
    }
    rc = settle_payment(pool.payout, payment, buyer);
    if (rc != errors::OK) {
        return reject("buy", name, rc);
    }

    release(pool.tokens, static_cast<size_t>(units), buyer);

    market_log().info("fixed_price '{}': {} bought {} for {}", name,
                      addresses::to_hex(buyer), units, payment_amount);
    emit(EventKind::PURCHASE, owner, name, buyer, payment_amount, units);
    return errors::OK;
}

int32_t FixedPriceMarket::cancel(const Address& creator, const std::string& name) {
    int32_t rc = registry_.status(creator, name);
    if (rc != errors::OK) {
        return reject("cancel", name, rc);
    }
    FixedPricePool& pool = *registry_.find(creator, name);

    if (pool.canceled) {
        return reject("cancel", name, errors::CANCELED);
    }

    const size_t returned = pool.tokens.size();
    release(pool.tokens, returned, pool.creator);
    pool.canceled = true;

    market_log().info("fixed_price '{}' canceled, {} asset(s) returned", name, returned);
    emit(EventKind::CANCELED, creator, name, creator, 0, returned);
    return errors::OK;
}

int32_t FixedPriceMarket::destroy(const Address& creator, const std::string& name) {
    int32_t rc = registry_.status(creator, name);
    if (rc != errors::OK) {
        return reject("destroy", name, rc);
    }
    if (!registry_.find(creator, name)->tokens.empty()) {
        return reject("destroy", name, errors::NOT_EMPTY);
    }

    rc = registry_.erase(creator, name);
    if (rc != errors::OK) {
        return rc;
    }
    on_removed(creator, name);
    return errors::OK;
}

std::optional<FixedPriceInfo> FixedPriceMarket::get_pool(const Address& owner,
                                                         const std::string& name) const {
    const FixedPricePool* pool = registry_.find(owner, name);
    if (!pool) return std::nullopt;
    return FixedPriceInfo{pool->creator, pool->currency, pool->price, pool->open_at,
                          pool->canceled, pool->tokens.size(), pool->payout};
}

} // namespace nftmart
