// =============================================================================
// blind_box.cpp - Blind box batch mint pools
// =============================================================================

#include "nftmart/blind_box.hpp"
#include "nftmart/log.hpp"

namespace nftmart {

BlindBoxMarket::BlindBoxMarket(const Host& host)
    : MechanismBase(host, Mechanism::BLIND_BOX) {}

int32_t BlindBoxMarket::create(const Address& creator, const BlindBoxParams& params,
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
    BlindBoxPool pool{creator, params.currency, params.price, params.mint_at,
                      payout, std::move(tokens)};
    rc = registry_.insert(creator, params.name, std::move(pool));
    if (rc != errors::OK) {
        return rc;
    }

    on_created(creator, params.name, count);
    return errors::OK;
}

int32_t BlindBoxMarket::mint(const Address& owner, const std::string& name,
                             const Address& buyer, Amount payment_amount, uint64_t count) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("mint", name, rc);
    }
    BlindBoxPool& pool = *registry_.find(owner, name);

    if (count == 0) {
        return reject("mint", name, errors::INVALID_COUNT);
    }
    if (now() < pool.mint_at) {
        return reject("mint", name, errors::NOT_OPEN);
    }
    if (static_cast<U128>(payment_amount) < static_cast<U128>(pool.price) * count) {
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

    market_log().info("blind_box '{}': {} minted {} box(es), {} left", name,
                      addresses::to_hex(buyer), count, pool.tokens.size());
    emit(EventKind::PURCHASE, owner, name, buyer, payment_amount, count);
    return errors::OK;
}

int32_t BlindBoxMarket::destroy(const Address& owner, const std::string& name) {
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

std::optional<BlindBoxInfo> BlindBoxMarket::get_pool(const Address& owner,
                                                     const std::string& name) const {
    const BlindBoxPool* pool = registry_.find(owner, name);
    if (!pool) return std::nullopt;
    return BlindBoxInfo{pool->creator, pool->currency, pool->price, pool->mint_at,
                        pool->tokens.size(), pool->payout};
}

} // namespace nftmart
