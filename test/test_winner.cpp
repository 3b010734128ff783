// nftmart - Lottery Winner Selection Tests

#include <catch2/catch_test_macros.hpp>
#include <nftmart/winner.hpp>
#include <vector>

using namespace nftmart;
using namespace nftmart::winner_selection;

namespace {

uint64_t count_winners(uint64_t players, uint64_t share_num, uint64_t hash) {
    uint64_t winners = 0;
    for (uint64_t rank = 1; rank <= players; ++rank) {
        if (is_winner(rank, players, share_num, hash)) ++winners;
    }
    return winners;
}

} // namespace

TEST_CASE("Prime bucket selection", "[winner]") {
    REQUIRE(lo2(1) == 0);
    REQUIRE(lo2(2) == 1);
    REQUIRE(lo2(3) == 1);
    REQUIRE(lo2(4) == 2);
    REQUIRE(lo2(1000) == 9);
    REQUIRE(lo2(65535) == 15);

    // The chosen prime always exceeds m
    for (uint64_t m : {1u, 2u, 3u, 7u, 8u, 100u, 4095u, 4096u, 65535u}) {
        REQUIRE(PRIMES[lo2(m)] > m);
    }
}

TEST_CASE("calc_ret is a permutation", "[winner]") {
    for (uint64_t m : {1u, 2u, 5u, 16u, 17u, 100u, 1023u, 2048u}) {
        std::vector<bool> seen(m, false);
        for (uint64_t i = 0; i < m; ++i) {
            uint64_t pos = calc_ret(i, m);
            REQUIRE(pos < m);
            REQUIRE_FALSE(seen[pos]);
            seen[pos] = true;
        }
    }
}

TEST_CASE("Winning window", "[winner]") {
    SECTION("Plain window") {
        REQUIRE(in_window(2, 10, 3, 2));
        REQUIRE(in_window(4, 10, 3, 2));
        REQUIRE_FALSE(in_window(5, 10, 3, 2));
        REQUIRE_FALSE(in_window(1, 10, 3, 2));
    }

    SECTION("Window wraps past the end") {
        // start = 18 % 10 = 8, window {8, 9, 0}
        REQUIRE(in_window(8, 10, 3, 18));
        REQUIRE(in_window(9, 10, 3, 18));
        REQUIRE(in_window(0, 10, 3, 18));
        REQUIRE_FALSE(in_window(1, 10, 3, 18));
        REQUIRE_FALSE(in_window(7, 10, 3, 18));
    }
}

TEST_CASE("Selection totality", "[winner]") {
    SECTION("Everyone wins when under-filled") {
        REQUIRE(count_winners(1, 2, 12345) == 1);
        REQUIRE(count_winners(2, 2, 99) == 2);
        REQUIRE(count_winners(3, 5, 0) == 3);
    }

    SECTION("Exactly share_num winners otherwise") {
        for (uint64_t hash : {0ull, 1ull, 7ull, 4242ull, 0xDEADBEEFCAFEull, ~0ull}) {
            REQUIRE(count_winners(5, 2, hash) == 2);
            REQUIRE(count_winners(10, 3, hash) == 3);
            REQUIRE(count_winners(97, 96, hash) == 96);
            REQUIRE(count_winners(1000, 1, hash) == 1);
        }
    }
}
