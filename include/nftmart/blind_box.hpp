#ifndef NFTMART_BLIND_BOX_HPP
#define NFTMART_BLIND_BOX_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "mechanism.hpp"
#include "registry.hpp"

namespace nftmart {

// =============================================================================
// Blind Box Pool (batch mint, buyer does not pick the asset)
// =============================================================================

struct BlindBoxParams {
    std::string name;
    Currency currency;
    Amount price;           // Per box
    Timestamp mint_at;
    FeeSchedule fees;
};

struct BlindBoxPool {
    Address creator;
    Currency currency;
    Amount price;
    Timestamp mint_at;
    Payout payout;
    std::vector<Token> tokens;
};

struct BlindBoxInfo {
    Address creator;
    Currency currency;
    Amount price;
    Timestamp mint_at;
    size_t remaining;
    Payout payout;
};

class BlindBoxMarket : public MechanismBase {
public:
    explicit BlindBoxMarket(const Host& host);

    int32_t create(const Address& creator, const BlindBoxParams& params,
                   std::vector<Token>&& tokens);

    // Mint `count` boxes; requires payment_amount >= price * count
    int32_t mint(const Address& owner, const std::string& name, const Address& buyer,
                 Amount payment_amount, uint64_t count);

    // Only succeeds once every box is minted
    int32_t destroy(const Address& owner, const std::string& name);

    std::optional<BlindBoxInfo> get_pool(const Address& owner, const std::string& name) const;
    bool has_registry(const Address& owner) const { return registry_.has_registry(owner); }
    std::vector<std::string> pools(const Address& owner) const { return registry_.names(owner); }

private:
    PoolRegistry<BlindBoxPool> registry_;
};

} // namespace nftmart

#endif // NFTMART_BLIND_BOX_HPP
