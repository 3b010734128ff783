#ifndef NFTMART_WINNER_HPP
#define NFTMART_WINNER_HPP

#include <array>

#include "types.hpp"

namespace nftmart {

// =============================================================================
// Lottery Winner Selection
//
// A fixed multiplicative permutation of [0, m) picks which ranks fall into a
// contiguous window of width share_num starting at last_hash % m. The entropy
// is weak (clock + block height); not suitable against an adversary who can
// time their entry.
// =============================================================================

namespace winner_selection {

constexpr uint64_t MAX_PLAYERS = 65535;

// Bucket b holds a prime above 2^(b+1), so it never divides any m < 2^(b+1)
constexpr std::array<uint64_t, 16> PRIMES = {
    3, 5, 11, 17, 37, 67, 131, 257,
    521, 1031, 2053, 4099, 8209, 16411, 32771, 65537
};

// floor(log2(m)) for 1 <= m < 65536
inline uint32_t lo2(uint64_t m) {
    uint32_t bucket = 0;
    while (m > 1 && bucket < PRIMES.size() - 1) {
        m >>= 1;
        ++bucket;
    }
    return bucket;
}

// Permuted position of index within [0, m)
inline uint64_t calc_ret(uint64_t index, uint64_t m) {
    return (index * PRIMES[lo2(m)]) % m;
}

// Winning window [start, start + share_num) taken modulo player_count
inline bool in_window(uint64_t pos, uint64_t player_count, uint64_t share_num,
                      uint64_t last_hash) {
    uint64_t start = last_hash % player_count;
    uint64_t end = start + share_num;
    if (end <= player_count) {
        return pos >= start && pos < end;
    }
    // Window wraps past the last slot
    return pos >= start || pos < end - player_count;
}

// rank is the 1-based entry order
inline bool is_winner(uint64_t rank, uint64_t player_count, uint64_t share_num,
                      uint64_t last_hash) {
    if (player_count <= share_num) {
        return true;
    }
    uint64_t pos = calc_ret(rank - 1, player_count);
    return in_window(pos, player_count, share_num, last_hash);
}

} // namespace winner_selection

} // namespace nftmart

#endif // NFTMART_WINNER_HPP
