// nftmart - Core Type Tests

#include <catch2/catch_test_macros.hpp>
#include <nftmart/types.hpp>
#include <string>

using namespace nftmart;

TEST_CASE("Address helpers", "[types]") {
    SECTION("Id round trip") {
        Address a = addresses::from_id(0x1234);
        REQUIRE(addresses::to_id(a) == 0x1234);
        REQUIRE(a != Address{});
        REQUIRE(addresses::to_id(Address{}) == 0);
    }

    SECTION("Hex rendering") {
        std::string hex = addresses::to_hex(addresses::from_id(1));
        REQUIRE(hex.size() == 42);
        REQUIRE(hex.substr(0, 2) == "0x");
        REQUIRE(hex.substr(40) == "01");
    }
}

TEST_CASE("Fixed-point fractions", "[types]") {
    SECTION("Valid fractions") {
        REQUIRE(Fraction{0, 1}.valid());
        REQUIRE(Fraction{99, 100}.valid());
        REQUIRE_FALSE(Fraction{1, 1}.valid());
        REQUIRE_FALSE(Fraction{3, 2}.valid());
        REQUIRE_FALSE(Fraction{0, 0}.valid());
    }

    SECTION("Conversion") {
        REQUIRE(Fraction{1, 2}.to_fp32() == FP32_ONE / 2);
        REQUIRE(Fraction{0, 7}.to_fp32() == 0);
        REQUIRE(fp32::is_proper(Fraction{999999, 1000000}.to_fp32()));
    }

    SECTION("Multiplication rounds down") {
        FP32 third = fp32::from_rational(1, 3);
        REQUIRE(fp32::mul(100, third) == 33);
        REQUIRE(fp32::mul(2, third) == 0);
        REQUIRE(fp32::mul(1000, fp32::from_rational(1, 4)) == 250);
    }
}

TEST_CASE("TokenId ordering", "[types]") {
    TokenId a{addresses::from_id(1), "art", "a", 0};
    TokenId b{addresses::from_id(1), "art", "b", 0};
    TokenId a2{addresses::from_id(1), "art", "a", 1};

    REQUIRE(a == a);
    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE(a < a2);
    REQUIRE_FALSE(b < a);
}

TEST_CASE("Error codes", "[types][errors]") {
    SECTION("Messages are stable") {
        REQUIRE(std::string(errors::message(errors::OK)) == "ok");
        REQUIRE(std::string(errors::message(errors::POOL_NOT_FOUND)) == "pool not found");
        REQUIRE(std::string(errors::message(-999)) == "unknown error");
    }

    SECTION("Timing failures are retryable") {
        REQUIRE(errors::is_retryable(errors::NOT_OPEN));
        REQUIRE(errors::is_retryable(errors::NOT_CLOSED));
        REQUIRE_FALSE(errors::is_retryable(errors::CLOSED));
        REQUIRE_FALSE(errors::is_retryable(errors::INSUFFICIENT_PAYMENT));
        REQUIRE_FALSE(errors::is_retryable(errors::OK));
    }

    SECTION("Mechanism names") {
        REQUIRE(std::string(mechanism_name(Mechanism::LOTTERY)) == "lottery");
        REQUIRE(std::string(mechanism_name(Mechanism::DUTCH_AUCTION)) == "dutch_auction");
    }
}
