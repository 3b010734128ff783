#ifndef NFTMART_DUTCH_AUCTION_HPP
#define NFTMART_DUTCH_AUCTION_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "mechanism.hpp"
#include "registry.hpp"
#include "price_curve.hpp"

namespace nftmart {

// =============================================================================
// Dutch Auction Pool (linearly decaying unit price)
// =============================================================================

struct DutchAuctionParams {
    std::string name;
    Currency currency;
    Amount starting_price;
    Amount reserve_price;   // Floor reached at end_at
    Timestamp start_at;
    Timestamp end_at;
    FeeSchedule fees;
};

struct DutchAuctionPool {
    Address creator;
    Currency currency;
    Amount starting_price;
    Amount reserve_price;
    Timestamp start_at;
    Timestamp end_at;
    Payout payout;
    std::vector<Token> tokens;
};

struct DutchAuctionInfo {
    Address creator;
    Currency currency;
    Amount starting_price;
    Amount reserve_price;
    Timestamp start_at;
    Timestamp end_at;
    size_t remaining;
    Payout payout;
};

class DutchAuctionMarket : public MechanismBase {
public:
    explicit DutchAuctionMarket(const Host& host);

    int32_t create(const Address& creator, const DutchAuctionParams& params,
                   std::vector<Token>&& tokens);

    // Buy `count` assets at the current unit price; strictly after start_at
    int32_t mint(const Address& owner, const std::string& name, const Address& buyer,
                 Amount payment_amount, uint64_t count);

    int32_t destroy(const Address& owner, const std::string& name);

    // Unit price at the current clock; nullopt if the pool is unknown or
    // has not started
    std::optional<Amount> current_price(const Address& owner, const std::string& name) const;

    std::optional<DutchAuctionInfo> get_pool(const Address& owner, const std::string& name) const;
    bool has_registry(const Address& owner) const { return registry_.has_registry(owner); }
    std::vector<std::string> pools(const Address& owner) const { return registry_.names(owner); }

private:
    PoolRegistry<DutchAuctionPool> registry_;

    static Amount price_at(const DutchAuctionPool& pool, Timestamp now) {
        return price_curve::current_price(pool.starting_price, pool.reserve_price,
                                          pool.start_at, pool.end_at, now);
    }
};

} // namespace nftmart

#endif // NFTMART_DUTCH_AUCTION_HPP
