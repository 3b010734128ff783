#ifndef NFTMART_ENGLISH_AUCTION_HPP
#define NFTMART_ENGLISH_AUCTION_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "mechanism.hpp"
#include "registry.hpp"

namespace nftmart {

// =============================================================================
// English Auction Pool (ascending bids, rolling close)
// =============================================================================

struct EnglishAuctionParams {
    std::string name;
    Currency currency;
    Amount min_amount;          // Bids must exceed this
    Amount min_increase;        // Recorded only; see bid()
    Timestamp open_at;
    uint64_t confirm_time;      // Anti-snipe window (seconds)
    bool fixed_end;             // true = close_at never moves
    FeeSchedule fees;
};

struct EnglishAuctionPool {
    Address creator;
    Currency currency;
    Amount min_amount;
    Amount min_increase;
    Timestamp open_at;
    Timestamp close_at;
    uint64_t confirm_time;
    bool fixed_end;
    Payout payout;
    std::optional<Token> token;
    std::optional<Address> current_bidder;
    Amount current_bid;
    std::optional<Coin> held_bid;   // Empty once settled
};

struct EnglishAuctionInfo {
    Address creator;
    Currency currency;
    Amount min_amount;
    Amount min_increase;
    Timestamp open_at;
    Timestamp close_at;
    uint64_t confirm_time;
    bool fixed_end;
    bool has_asset;
    std::optional<Address> current_bidder;
    Amount current_bid;
    Amount held_funds;
    Payout payout;
};

class EnglishAuctionMarket : public MechanismBase {
public:
    explicit EnglishAuctionMarket(const Host& host, const MarketConfig& config = {});

    int32_t create(const Address& creator, const EnglishAuctionParams& params, Token&& token);

    // Lock `amount` as the new highest bid and refund the previous bidder.
    // Only `amount > current_bid` is enforced; min_increase is not.
    int32_t bid(const Address& owner, const std::string& name,
                const Address& bidder, Amount amount);

    // Winning bidder takes the asset after close; settles the bid if the
    // creator has not already, then removes the pool
    int32_t bidder_claim(const Address& owner, const std::string& name, const Address& bidder);

    // Creator after close: settles a held bid (asset stays for the bidder),
    // or takes the asset back and removes the pool when nobody bid
    int32_t creator_claim(const Address& creator, const std::string& name);

    std::optional<EnglishAuctionInfo> get_pool(const Address& owner, const std::string& name) const;
    bool has_registry(const Address& owner) const { return registry_.has_registry(owner); }
    std::vector<std::string> pools(const Address& owner) const { return registry_.names(owner); }

private:
    PoolRegistry<EnglishAuctionPool> registry_;
    uint64_t min_confirm_time_;
    uint64_t max_confirm_time_;
};

} // namespace nftmart

#endif // NFTMART_ENGLISH_AUCTION_HPP
