// =============================================================================
// settlement.cpp - Payment splitting into proceeds, fee and royalty
// =============================================================================

#include "nftmart/settlement.hpp"
#include "nftmart/log.hpp"

namespace nftmart {

int32_t Payout::from_schedule(const FeeSchedule& schedule, const Address& creator,
                              Payout& out) {
    if (!schedule.fee.valid() || !schedule.royalty.valid()) {
        return errors::INVALID_FRACTION;
    }

    Payout payout;
    payout.coin_recipient = schedule.coin_recipient.value_or(creator);
    payout.fee_recipient = schedule.fee_recipient;
    payout.royalty_recipient = schedule.royalty_recipient;
    payout.fee_fraction = schedule.fee.to_fp32();
    payout.royalty_fraction = schedule.royalty.to_fp32();

    if (!fp32::is_proper(payout.fee_fraction) || !fp32::is_proper(payout.royalty_fraction)) {
        return errors::INVALID_FRACTION;
    }

    out = payout;
    return errors::OK;
}

Settlement PaymentSplitter::compute(Amount payment, FP32 fee_fraction, FP32 royalty_fraction) {
    Settlement s;
    s.payment = payment;
    s.fee = fp32::mul(payment, fee_fraction);
    s.royalty = fp32::mul(payment, royalty_fraction);
    s.proceeds = (s.fee + s.royalty <= payment) ? payment - s.fee - s.royalty : 0;
    return s;
}

int32_t PaymentSplitter::settle(const Payout& payout, Coin& payment, Settlement* out) {
    Settlement s = compute(payment.value(), payout.fee_fraction, payout.royalty_fraction);

    // Each share is below the payment, so only the sum can overflow it
    if (static_cast<U128>(s.fee) + s.royalty > payment.value()) {
        market_log().debug("settle rejected: fee {} + royalty {} > payment {}",
                           s.fee, s.royalty, s.payment);
        return errors::ARITHMETIC_UNDERFLOW;
    }

    Coin fee;
    Coin royalty;
    int32_t rc = payment.extract(s.fee, fee);
    if (rc != errors::OK) {
        return rc;
    }
    rc = payment.extract(s.royalty, royalty);
    if (rc != errors::OK) {
        // Put the fee share back so the payment is left untouched
        int32_t restored = payment.merge(std::move(fee));
        return restored != errors::OK ? restored : rc;
    }

    coins_.deposit(payout.coin_recipient, std::move(payment));
    coins_.deposit(payout.fee_recipient, std::move(fee));
    coins_.deposit(payout.royalty_recipient, std::move(royalty));

    market_log().debug("settled {}: proceeds {} fee {} royalty {}",
                       s.payment, s.proceeds, s.fee, s.royalty);

    if (out) *out = s;
    return errors::OK;
}

} // namespace nftmart
