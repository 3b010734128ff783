// =============================================================================
// lottery.cpp - Lottery pools and winner claims
// =============================================================================

#include "nftmart/lottery.hpp"
#include "nftmart/log.hpp"
#include <openssl/sha.h>
#include <algorithm>

namespace nftmart {

namespace {

inline void put_le64(uint8_t* out, uint64_t v) {
    for (size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
}

} // namespace

uint64_t lottery_hash(Timestamp now, uint64_t height, uint64_t previous) {
    uint8_t input[24];
    put_le64(input, now);
    put_le64(input + 8, height);
    put_le64(input + 16, previous);

    uint8_t digest[SHA256_DIGEST_LENGTH];
    SHA256(input, sizeof(input), digest);

    uint64_t folded = 0;
    for (size_t i = 0; i < 8; ++i) {
        folded += static_cast<uint64_t>(digest[i]) << (8 * i);
    }
    return folded;
}

LotteryMarket::LotteryMarket(const Host& host, const MarketConfig& config)
    : MechanismBase(host, Mechanism::LOTTERY),
      max_players_cap_(std::min<uint64_t>(config.max_lottery_players,
                                          winner_selection::MAX_PLAYERS)) {}

uint64_t LotteryMarket::rank_of(const LotteryPool& pool, const Address& player) {
    auto it = std::find(pool.players.begin(), pool.players.end(), player);
    if (it == pool.players.end()) return 0;
    return static_cast<uint64_t>(it - pool.players.begin()) + 1;
}

bool LotteryMarket::wins(const LotteryPool& pool, uint64_t rank) {
    return winner_selection::is_winner(rank, pool.players.size(), pool.share_num,
                                       pool.last_hash);
}

int32_t LotteryMarket::create(const Address& creator, const LotteryParams& params,
                              std::vector<Token>&& tokens) {
    if (params.name.empty()) {
        return reject("create", params.name, errors::INVALID_PARAMETER);
    }
    int32_t rc = validate_escrow(tokens);
    if (rc != errors::OK) {
        return reject("create", params.name, rc);
    }
    const Timestamp t = now();
    if (params.close_at <= t) {
        return reject("create", params.name, errors::INVALID_TIME_WINDOW);
    }
    if (params.share_num == 0 || params.share_num > tokens.size()) {
        return reject("create", params.name, errors::INVALID_PARAMETER);
    }
    if (params.max_players == 0 || params.max_players > max_players_cap_) {
        return reject("create", params.name, errors::INVALID_PARAMETER);
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
    LotteryPool pool{creator, params.currency, params.close_at, params.max_players,
                     params.share_num, payout, std::move(tokens), {}, {}, std::nullopt,
                     lottery_hash(t, host_.blocks.current_height(), 0)};
    rc = registry_.insert(creator, params.name, std::move(pool));
    if (rc != errors::OK) {
        return rc;
    }

    on_created(creator, params.name, count);
    return errors::OK;
}

int32_t LotteryMarket::bet(const Address& owner, const std::string& name,
                           const Address& player, Amount amount) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("bet", name, rc);
    }
    LotteryPool& pool = *registry_.find(owner, name);

    if (amount == 0) {
        return reject("bet", name, errors::INSUFFICIENT_PAYMENT);
    }
    const Timestamp t = now();
    if (t >= pool.close_at) {
        return reject("bet", name, errors::CLOSED);
    }
    if (pool.players.size() >= pool.max_players) {
        return reject("bet", name, errors::LOTTERY_FULL);
    }
    if (rank_of(pool, player) != 0) {
        return reject("bet", name, errors::ALREADY_ENTERED);
    }

    Coin stake;
    rc = collect(player, pool.currency, amount, stake);
    if (rc != errors::OK) {
        return reject("bet", name, rc);
    }
    if (pool.bids) {
        rc = pool.bids->merge(std::move(stake));
        if (rc != errors::OK) {
            host_.coins.deposit(player, std::move(stake));
            return reject("bet", name, rc);
        }
    } else {
        pool.bids.emplace(std::move(stake));
    }

    pool.players.push_back(player);
    pool.claimed.push_back(false);
    pool.last_hash = lottery_hash(t, host_.blocks.current_height(), pool.last_hash);

    market_log().info("lottery '{}': {} entered with {} (rank {})", name,
                      addresses::to_hex(player), amount, pool.players.size());
    emit(EventKind::BET, owner, name, player, amount, 0);
    return errors::OK;
}

int32_t LotteryMarket::is_winner(const Address& owner, const std::string& name,
                                 const Address& player, bool& winner) const {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return rc;
    }
    const LotteryPool& pool = *registry_.find(owner, name);

    if (now() < pool.close_at) {
        return errors::NOT_CLOSED;
    }
    const uint64_t rank = rank_of(pool, player);
    if (rank == 0) {
        return errors::NOT_ENTRANT;
    }
    winner = wins(pool, rank);
    return errors::OK;
}

int32_t LotteryMarket::claim(const Address& owner, const std::string& name,
                             const Address& player) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("claim", name, rc);
    }
    LotteryPool& pool = *registry_.find(owner, name);

    if (now() < pool.close_at) {
        return reject("claim", name, errors::NOT_CLOSED);
    }
    const uint64_t rank = rank_of(pool, player);
    if (rank == 0) {
        return reject("claim", name, errors::NOT_ENTRANT);
    }
    if (pool.claimed[rank - 1]) {
        return reject("claim", name, errors::ALREADY_CLAIMED);
    }

    const bool winner = wins(pool, rank);
    if (winner && pool.tokens.empty()) {
        return reject("claim", name, errors::INSUFFICIENT_ASSETS);
    }

    // First claimant pays out the whole pot
    if (pool.bids) {
        const Amount pot = pool.bids->value();
        rc = settle(pool.payout, *pool.bids);
        if (rc != errors::OK) {
            return reject("claim", name, rc);
        }
        pool.bids.reset();
        market_log().info("lottery '{}': pot of {} settled on claim by {}", name, pot,
                          addresses::to_hex(player));
        emit(EventKind::SETTLED, owner, name, player, pot, 0);
    }

    if (winner) {
        release(pool.tokens, 1, player);
        emit(EventKind::CLAIMED, owner, name, player, 0, 1);
    }
    pool.claimed[rank - 1] = true;

    market_log().debug("lottery '{}': rank {} claimed, winner={}", name, rank, winner);
    return errors::OK;
}

int32_t LotteryMarket::claim_owner(const Address& creator, const std::string& name) {
    int32_t rc = registry_.status(creator, name);
    if (rc != errors::OK) {
        return reject("claim_owner", name, rc);
    }
    LotteryPool& pool = *registry_.find(creator, name);

    if (now() < pool.close_at) {
        return reject("claim_owner", name, errors::NOT_CLOSED);
    }
    if (pool.players.size() >= pool.share_num) {
        return reject("claim_owner", name, errors::NOT_UNDERFILLED);
    }

    // Drains the whole escrow; pooled bets stay for the first entrant claim.
    // Entrants who claim after this find no asset left.
    const size_t drained = pool.tokens.size();
    release(pool.tokens, drained, pool.creator);

    market_log().info("lottery '{}': {} remaining asset(s) returned to creator", name, drained);
    emit(EventKind::CLAIMED, creator, name, creator, 0, drained);
    return errors::OK;
}

int32_t LotteryMarket::destroy(const Address& owner, const std::string& name) {
    int32_t rc = registry_.status(owner, name);
    if (rc != errors::OK) {
        return reject("destroy", name, rc);
    }
    const LotteryPool& pool = *registry_.find(owner, name);
    if (!pool.tokens.empty() || pool.bids) {
        return reject("destroy", name, errors::NOT_EMPTY);
    }

    rc = registry_.erase(owner, name);
    if (rc != errors::OK) {
        return rc;
    }
    on_removed(owner, name);
    return errors::OK;
}

std::optional<LotteryInfo> LotteryMarket::get_pool(const Address& owner,
                                                   const std::string& name) const {
    const LotteryPool* pool = registry_.find(owner, name);
    if (!pool) return std::nullopt;
    return LotteryInfo{pool->creator, pool->currency, pool->close_at, pool->max_players,
                       pool->share_num, pool->tokens.size(), pool->players,
                       pool->bids ? pool->bids->value() : 0, pool->last_hash, pool->payout};
}

} // namespace nftmart
