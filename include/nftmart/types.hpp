#ifndef NFTMART_TYPES_HPP
#define NFTMART_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>

namespace nftmart {

// =============================================================================
// Account Addresses (20-byte account identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Build an address whose low 8 bytes carry a numeric account id
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

// Recover the numeric id from the low 8 bytes
constexpr uint64_t to_id(const Address& addr) {
    uint64_t id = 0;
    for (size_t i = 12; i < 20; ++i) {
        id = (id << 8) | addr[i];
    }
    return id;
}

std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Amounts & Timestamps
// =============================================================================

using Amount = uint64_t;     // Fungible units (smallest denomination)
using Timestamp = uint64_t;  // Seconds

using U128 = unsigned __int128;

// =============================================================================
// Fixed-Point Arithmetic (FP32 = 32 fractional bits)
// =============================================================================

using FP32 = uint64_t;

constexpr FP32 FP32_ONE = FP32(1) << 32;

namespace fp32 {

// num/den rounded down; caller guarantees den != 0
inline FP32 from_rational(uint64_t num, uint64_t den) {
    U128 scaled = (static_cast<U128>(num) << 32) / den;
    return static_cast<FP32>(scaled);
}

// floor(value * fraction)
inline Amount mul(Amount value, FP32 fraction) {
    U128 product = static_cast<U128>(value) * fraction;
    return static_cast<Amount>(product >> 32);
}

inline bool is_proper(FP32 fraction) {
    return fraction < FP32_ONE;
}

} // namespace fp32

// Rational value as supplied at pool creation
struct Fraction {
    uint64_t numerator = 0;
    uint64_t denominator = 1;

    bool valid() const { return denominator != 0 && numerator < denominator; }
    FP32 to_fp32() const { return fp32::from_rational(numerator, denominator); }
};

// =============================================================================
// Currency Type (fungible asset kind)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Native chain coin (address(0))
inline const Currency NATIVE_COIN{};

// =============================================================================
// Token Identifier (non-fungible item)
// =============================================================================

struct TokenId {
    Address creator;             // Collection creator
    std::string collection;
    std::string name;
    uint64_t property_version = 0;

    bool operator==(const TokenId& other) const {
        return creator == other.creator && collection == other.collection &&
               name == other.name && property_version == other.property_version;
    }
    bool operator!=(const TokenId& other) const { return !(*this == other); }
    bool operator<(const TokenId& other) const {
        if (creator != other.creator) return creator < other.creator;
        if (collection != other.collection) return collection < other.collection;
        if (name != other.name) return name < other.name;
        return property_version < other.property_version;
    }
};

// =============================================================================
// Pool Mechanisms
// =============================================================================

enum class Mechanism : uint8_t {
    FIXED_PRICE = 0,
    BLIND_BOX = 1,
    ENGLISH_AUCTION = 2,
    DUTCH_AUCTION = 3,
    LOTTERY = 4
};

const char* mechanism_name(Mechanism mechanism);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Configuration
constexpr int32_t INVALID_PRICE = -1;
constexpr int32_t INVALID_FRACTION = -2;
constexpr int32_t INVALID_TIME_WINDOW = -3;
constexpr int32_t EMPTY_ASSETS = -4;
constexpr int32_t INVALID_PARAMETER = -5;

// Existence
constexpr int32_t REGISTRY_NOT_FOUND = -10;
constexpr int32_t POOL_NOT_FOUND = -11;
constexpr int32_t POOL_ALREADY_EXISTS = -12;
constexpr int32_t TOKEN_NOT_FOUND = -13;

// State
constexpr int32_t NOT_OPEN = -20;
constexpr int32_t CLOSED = -21;
constexpr int32_t CANCELED = -22;
constexpr int32_t ALREADY_SETTLED = -23;
constexpr int32_t NOT_CLOSED = -24;
constexpr int32_t NOT_EMPTY = -25;
constexpr int32_t ALREADY_ENTERED = -26;
constexpr int32_t ALREADY_CLAIMED = -27;
constexpr int32_t NOT_UNDERFILLED = -28;

// Amount
constexpr int32_t INSUFFICIENT_PAYMENT = -30;
constexpr int32_t INSUFFICIENT_ASSETS = -31;
constexpr int32_t INSUFFICIENT_BALANCE = -32;
constexpr int32_t BID_TOO_LOW = -33;
constexpr int32_t LOTTERY_FULL = -34;
constexpr int32_t INVALID_COUNT = -35;
constexpr int32_t ARITHMETIC_UNDERFLOW = -36;
constexpr int32_t CURRENCY_MISMATCH = -37;

// Authorization
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t NOT_ENTRANT = -41;

const char* message(int32_t code);

// Timing failures that may succeed later without caller changes
bool is_retryable(int32_t code);
} // namespace errors

} // namespace nftmart

#endif // NFTMART_TYPES_HPP
