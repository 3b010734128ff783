// =============================================================================
// mechanism.cpp - Shared escrow, settlement and event plumbing
// =============================================================================

#include "nftmart/mechanism.hpp"
#include "nftmart/log.hpp"
#include <cassert>

namespace nftmart {

MechanismBase::MechanismBase(const Host& host, Mechanism kind)
    : host_(host), splitter_(host.coins), kind_(kind) {}

int32_t MechanismBase::reject(const char* op, const std::string& pool, int32_t code) const {
    market_log().debug("{} {} '{}' rejected: {} ({})", mechanism_name(kind_), op, pool,
                       errors::message(code), code);
    return code;
}

int32_t MechanismBase::collect(const Address& payer, const Currency& currency,
                               Amount amount, Coin& out) {
    return host_.coins.withdraw(payer, currency, amount, out);
}

int32_t MechanismBase::settle(const Payout& payout, Coin& funds) {
    Settlement s;
    int32_t rc = splitter_.settle(payout, funds, &s);
    if (rc != errors::OK) {
        return rc;
    }
    stats_.volume_settled += s.payment;
    stats_.fees_collected += s.fee;
    stats_.royalties_collected += s.royalty;
    return errors::OK;
}

int32_t MechanismBase::settle_payment(const Payout& payout, Coin& payment, const Address& payer) {
    int32_t rc = settle(payout, payment);
    if (rc != errors::OK) {
        host_.coins.deposit(payer, std::move(payment));
    }
    return rc;
}

void MechanismBase::release(std::vector<Token>& escrow, size_t count, const Address& recipient) {
    const size_t before = escrow.size();
    assert(count <= before);

    for (size_t i = 0; i < count; ++i) {
        Token token = std::move(escrow.back());
        escrow.pop_back();
        host_.tokens.deposit(recipient, std::move(token));
    }

    // Assets only ever leave escrow
    assert(escrow.size() + count == before);
    stats_.tokens_released += count;
}

void MechanismBase::emit(EventKind kind, const Address& owner, const std::string& pool,
                         const Address& actor, Amount amount, uint64_t count) {
    if (!listener_) return;
    MarketEvent event{kind, kind_, owner, pool, actor, amount, count, now()};
    listener_->on_event(event);
}

void MechanismBase::on_created(const Address& owner, const std::string& pool, size_t assets) {
    stats_.pools_created++;
    market_log().info("{} pool '{}' created by {} with {} asset(s)", mechanism_name(kind_),
                      pool, addresses::to_hex(owner), assets);
    emit(EventKind::POOL_CREATED, owner, pool, owner, 0, assets);
}

void MechanismBase::on_removed(const Address& owner, const std::string& pool) {
    stats_.pools_removed++;
    market_log().info("{} pool '{}' of {} removed", mechanism_name(kind_), pool,
                      addresses::to_hex(owner));
    emit(EventKind::DESTROYED, owner, pool, owner, 0, 0);
}

int32_t validate_escrow(const std::vector<Token>& tokens) {
    if (tokens.empty()) {
        return errors::EMPTY_ASSETS;
    }
    for (const auto& token : tokens) {
        if (token.amount() == 0) {
            return errors::EMPTY_ASSETS;
        }
    }
    return errors::OK;
}

} // namespace nftmart
