#ifndef NFTMART_PRICE_CURVE_HPP
#define NFTMART_PRICE_CURVE_HPP

#include "types.hpp"

namespace nftmart {

// =============================================================================
// Dutch Auction Price Curve
// =============================================================================

namespace price_curve {

// Linear decay from starting_price at start_at to reserve_price at end_at.
// Requires starting_price > reserve_price, end_at > start_at, now >= start_at.
inline Amount current_price(Amount starting_price, Amount reserve_price,
                            Timestamp start_at, Timestamp end_at, Timestamp now) {
    if (now >= end_at) {
        return reserve_price;
    }
    U128 elapsed = now - start_at;
    U128 drop = elapsed * (starting_price - reserve_price) / (end_at - start_at);
    return starting_price - static_cast<Amount>(drop);
}

} // namespace price_curve

} // namespace nftmart

#endif // NFTMART_PRICE_CURVE_HPP
