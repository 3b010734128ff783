#ifndef NFTMART_EVENTS_HPP
#define NFTMART_EVENTS_HPP

#include <string>

#include "types.hpp"

namespace nftmart {

enum class EventKind : uint8_t {
    POOL_CREATED = 0,
    PURCHASE = 1,       // Fixed-price buy, blind box / Dutch mint
    BID = 2,
    REFUND = 3,         // Outbid bidder repaid
    BET = 4,
    SETTLED = 5,        // Held funds paid out
    CLAIMED = 6,        // Asset released to a claimant
    CANCELED = 7,
    DESTROYED = 8
};

struct MarketEvent {
    EventKind kind;
    Mechanism mechanism;
    Address owner;          // Pool owner
    std::string pool;       // Pool name
    Address actor;          // Buyer, bidder, player or owner
    Amount amount;          // Coins moved (0 if none)
    uint64_t count;         // Assets moved (0 if none)
    Timestamp timestamp;
};

// Callback interface for marketplace notifications
class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const MarketEvent& event) = 0;
};

} // namespace nftmart

#endif // NFTMART_EVENTS_HPP
