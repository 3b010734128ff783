#ifndef NFTMART_LOTTERY_HPP
#define NFTMART_LOTTERY_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "mechanism.hpp"
#include "registry.hpp"
#include "winner.hpp"

namespace nftmart {

// =============================================================================
// Lottery Pool (deposit to enter, share_num winners after close)
// =============================================================================

struct LotteryParams {
    std::string name;
    Currency currency;
    Timestamp close_at;
    uint64_t max_players;
    uint64_t share_num;     // Number of winners
    FeeSchedule fees;
};

struct LotteryPool {
    Address creator;
    Currency currency;
    Timestamp close_at;
    uint64_t max_players;
    uint64_t share_num;
    Payout payout;
    std::vector<Token> tokens;
    std::vector<Address> players;   // Entry order; rank = index + 1
    std::vector<bool> claimed;      // Parallel to players
    std::optional<Coin> bids;       // Aggregate of all bets until settled
    uint64_t last_hash;
};

struct LotteryInfo {
    Address creator;
    Currency currency;
    Timestamp close_at;
    uint64_t max_players;
    uint64_t share_num;
    size_t remaining;
    std::vector<Address> players;
    Amount held_bids;
    uint64_t last_hash;
    Payout payout;
};

// Rolling entropy: SHA-256 over (now, height, previous) folded to 64 bits
uint64_t lottery_hash(Timestamp now, uint64_t height, uint64_t previous);

class LotteryMarket : public MechanismBase {
public:
    explicit LotteryMarket(const Host& host, const MarketConfig& config = {});

    int32_t create(const Address& creator, const LotteryParams& params,
                   std::vector<Token>&& tokens);

    // Enter once with a positive bet before close
    int32_t bet(const Address& owner, const std::string& name,
                const Address& player, Amount amount);

    // Winner check; only defined once the lottery has closed
    int32_t is_winner(const Address& owner, const std::string& name,
                      const Address& player, bool& winner) const;

    // One claim per entrant. A winner takes one asset; whichever claim comes
    // first also settles the whole aggregate bet balance.
    int32_t claim(const Address& owner, const std::string& name, const Address& player);

    // Under-filled lottery: the creator takes back every remaining asset.
    // Pooled bets are not touched.
    int32_t claim_owner(const Address& creator, const std::string& name);

    // Remove a pool with no assets and no held bets
    int32_t destroy(const Address& owner, const std::string& name);

    std::optional<LotteryInfo> get_pool(const Address& owner, const std::string& name) const;
    bool has_registry(const Address& owner) const { return registry_.has_registry(owner); }
    std::vector<std::string> pools(const Address& owner) const { return registry_.names(owner); }

private:
    PoolRegistry<LotteryPool> registry_;
    uint64_t max_players_cap_;

    // 1-based rank, 0 if not entered
    static uint64_t rank_of(const LotteryPool& pool, const Address& player);
    static bool wins(const LotteryPool& pool, uint64_t rank);
};

} // namespace nftmart

#endif // NFTMART_LOTTERY_HPP
