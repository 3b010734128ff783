#ifndef NFTMART_FIXED_PRICE_HPP
#define NFTMART_FIXED_PRICE_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "mechanism.hpp"
#include "registry.hpp"

namespace nftmart {

// =============================================================================
// Fixed-Price Pool (atomic swap)
// =============================================================================

struct FixedPriceParams {
    std::string name;
    Currency currency;
    Amount price;           // Per asset
    Timestamp open_at;
    FeeSchedule fees;
};

struct FixedPricePool {
    Address creator;
    Currency currency;
    Amount price;
    Timestamp open_at;
    bool canceled;
    Payout payout;
    std::vector<Token> tokens;
};

// Copyable snapshot of a pool
struct FixedPriceInfo {
    Address creator;
    Currency currency;
    Amount price;
    Timestamp open_at;
    bool canceled;
    size_t remaining;
    Payout payout;
};

class FixedPriceMarket : public MechanismBase {
public:
    explicit FixedPriceMarket(const Host& host);

    // Escrow `tokens` for sale; they are moved from only on success
    int32_t create(const Address& creator, const FixedPriceParams& params,
                   std::vector<Token>&& tokens);

    // Pay `payment_amount`; receives payment_amount / price assets and the
    // whole payment is settled
    int32_t buy(const Address& owner, const std::string& name,
                const Address& buyer, Amount payment_amount);

    // Return every remaining asset to the creator
    int32_t cancel(const Address& creator, const std::string& name);

    // Remove a pool whose escrow is empty
    int32_t destroy(const Address& creator, const std::string& name);

    std::optional<FixedPriceInfo> get_pool(const Address& owner, const std::string& name) const;
    bool has_registry(const Address& owner) const { return registry_.has_registry(owner); }
    std::vector<std::string> pools(const Address& owner) const { return registry_.names(owner); }

private:
    PoolRegistry<FixedPricePool> registry_;
};

} // namespace nftmart

#endif // NFTMART_FIXED_PRICE_HPP
