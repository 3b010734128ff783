#ifndef NFTMART_SETTLEMENT_HPP
#define NFTMART_SETTLEMENT_HPP

#include <optional>

#include "types.hpp"
#include "ledger.hpp"

namespace nftmart {

// =============================================================================
// Fee Schedule (as supplied at pool creation)
// =============================================================================

struct FeeSchedule {
    Fraction fee;
    Fraction royalty;
    Address fee_recipient{};
    Address royalty_recipient{};
    std::optional<Address> coin_recipient;  // Defaults to the pool creator
};

// =============================================================================
// Payout (validated, stored with each pool)
// =============================================================================

struct Payout {
    Address coin_recipient{};
    Address fee_recipient{};
    Address royalty_recipient{};
    FP32 fee_fraction = 0;
    FP32 royalty_fraction = 0;

    // Validate a schedule and resolve the default coin recipient
    static int32_t from_schedule(const FeeSchedule& schedule, const Address& creator,
                                 Payout& out);
};

// =============================================================================
// Settlement Record
// =============================================================================

struct Settlement {
    Amount payment = 0;
    Amount proceeds = 0;
    Amount fee = 0;
    Amount royalty = 0;
};

// =============================================================================
// PaymentSplitter - proceeds / fee / royalty
// =============================================================================

class PaymentSplitter {
public:
    explicit PaymentSplitter(ICoinStore& coins) : coins_(coins) {}

    // Shares for a payment value; fee and royalty round down
    static Settlement compute(Amount payment, FP32 fee_fraction, FP32 royalty_fraction);

    // Split and deposit the whole payment. On failure nothing moves and
    // `payment` is left intact.
    int32_t settle(const Payout& payout, Coin& payment, Settlement* out = nullptr);

private:
    ICoinStore& coins_;
};

} // namespace nftmart

#endif // NFTMART_SETTLEMENT_HPP
