#ifndef NFTMART_MECHANISM_HPP
#define NFTMART_MECHANISM_HPP

#include <string>
#include <vector>

#include "types.hpp"
#include "ledger.hpp"
#include "host.hpp"
#include "settlement.hpp"
#include "events.hpp"

namespace nftmart {

// =============================================================================
// Mechanism Statistics
// =============================================================================

struct MechanismStats {
    uint64_t pools_created;
    uint64_t pools_removed;
    uint64_t tokens_released;
    Amount volume_settled;
    Amount fees_collected;
    Amount royalties_collected;
};

// =============================================================================
// MechanismBase - shared plumbing of the five sale mechanisms
// =============================================================================

class MechanismBase {
public:
    // Non-copyable
    MechanismBase(const MechanismBase&) = delete;
    MechanismBase& operator=(const MechanismBase&) = delete;

    Mechanism kind() const { return kind_; }

    void set_event_listener(EventListener* listener) { listener_ = listener; }

    MechanismStats get_stats() const { return stats_; }

protected:
    MechanismBase(const Host& host, Mechanism kind);
    ~MechanismBase() = default;

    Timestamp now() const { return host_.clock.now(); }

    // Log a rejected operation and hand the code back
    int32_t reject(const char* op, const std::string& pool, int32_t code) const;

    // Withdraw a payment from payer in the pool currency
    int32_t collect(const Address& payer, const Currency& currency, Amount amount, Coin& out);

    // Settle held funds; on failure the coin is left untouched
    int32_t settle(const Payout& payout, Coin& funds);

    // Settle a fresh payment; on failure it goes back to the payer
    int32_t settle_payment(const Payout& payout, Coin& payment, const Address& payer);

    // Move `count` tokens off the back of an escrow to recipient
    void release(std::vector<Token>& escrow, size_t count, const Address& recipient);

    void emit(EventKind kind, const Address& owner, const std::string& pool,
              const Address& actor, Amount amount, uint64_t count);

    void on_created(const Address& owner, const std::string& pool, size_t assets);
    void on_removed(const Address& owner, const std::string& pool);

    Host host_;
    PaymentSplitter splitter_;

private:
    Mechanism kind_;
    EventListener* listener_{nullptr};
    MechanismStats stats_{};
};

// Common creation checks for escrowed token sequences
int32_t validate_escrow(const std::vector<Token>& tokens);

} // namespace nftmart

#endif // NFTMART_MECHANISM_HPP
