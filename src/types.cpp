// =============================================================================
// types.cpp - Address formatting, mechanism names, error messages
// =============================================================================

#include "nftmart/types.hpp"

namespace nftmart {

std::string addresses::to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

const char* mechanism_name(Mechanism mechanism) {
    switch (mechanism) {
        case Mechanism::FIXED_PRICE:     return "fixed_price";
        case Mechanism::BLIND_BOX:       return "blind_box";
        case Mechanism::ENGLISH_AUCTION: return "english_auction";
        case Mechanism::DUTCH_AUCTION:   return "dutch_auction";
        case Mechanism::LOTTERY:         return "lottery";
    }
    return "unknown";
}

namespace errors {

const char* message(int32_t code) {
    switch (code) {
        case OK:                   return "ok";
        case INVALID_PRICE:        return "price must be positive";
        case INVALID_FRACTION:     return "fraction must be in [0, 1)";
        case INVALID_TIME_WINDOW:  return "malformed time window";
        case EMPTY_ASSETS:         return "asset set is empty";
        case INVALID_PARAMETER:    return "invalid pool parameter";
        case REGISTRY_NOT_FOUND:   return "no registry for owner";
        case POOL_NOT_FOUND:       return "pool not found";
        case POOL_ALREADY_EXISTS:  return "pool name already taken";
        case TOKEN_NOT_FOUND:      return "token not held by account";
        case NOT_OPEN:             return "pool not open yet";
        case CLOSED:               return "pool closed";
        case CANCELED:             return "pool canceled";
        case ALREADY_SETTLED:      return "funds already settled";
        case NOT_CLOSED:           return "pool not closed yet";
        case NOT_EMPTY:            return "pool still holds assets or funds";
        case ALREADY_ENTERED:      return "player already entered";
        case ALREADY_CLAIMED:      return "player already claimed";
        case NOT_UNDERFILLED:      return "lottery is not under-filled";
        case INSUFFICIENT_PAYMENT: return "payment below required amount";
        case INSUFFICIENT_ASSETS:  return "not enough assets remaining";
        case INSUFFICIENT_BALANCE: return "insufficient balance";
        case BID_TOO_LOW:          return "bid does not beat current bid";
        case LOTTERY_FULL:         return "no player slots left";
        case INVALID_COUNT:        return "count must be positive";
        case ARITHMETIC_UNDERFLOW: return "fee and royalty exceed payment";
        case CURRENCY_MISMATCH:    return "currency mismatch";
        case UNAUTHORIZED:         return "caller not authorized";
        case NOT_ENTRANT:          return "player did not enter";
        default:                   return "unknown error";
    }
}

bool is_retryable(int32_t code) {
    return code == NOT_OPEN || code == NOT_CLOSED;
}

} // namespace errors

} // namespace nftmart
