// nftmart - Configuration Tests

#include <catch2/catch_test_macros.hpp>
#include <nftmart/config.hpp>
#include <stdexcept>

using namespace nftmart;

TEST_CASE("MarketConfig defaults", "[config]") {
    MarketConfig config;

    REQUIRE(config.log_level == "info");
    REQUIRE(config.log_file.empty());
    REQUIRE(config.log_max_size == 5 * 1024 * 1024);
    REQUIRE(config.log_max_files == 3);
    REQUIRE(config.min_confirm_time == 300);
    REQUIRE(config.max_confirm_time == 86400);
    REQUIRE(config.max_lottery_players == 65535);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("MarketConfig from JSON", "[config]") {
    SECTION("Empty object keeps defaults") {
        MarketConfig config = MarketConfig::from_json("{}");
        REQUIRE(config.min_confirm_time == 300);
        REQUIRE(config.log_level == "info");
    }

    SECTION("Overrides and unknown keys") {
        MarketConfig config = MarketConfig::from_json(R"({
            "log_level": "debug",
            "log_file": "/tmp/nftmart.log",
            "min_confirm_time": 600,
            "max_confirm_time": 3600,
            "max_lottery_players": 100,
            "unused": true
        })");
        REQUIRE(config.log_level == "debug");
        REQUIRE(config.log_file == "/tmp/nftmart.log");
        REQUIRE(config.min_confirm_time == 600);
        REQUIRE(config.max_confirm_time == 3600);
        REQUIRE(config.max_lottery_players == 100);
    }

    SECTION("Malformed documents") {
        REQUIRE_THROWS_AS(MarketConfig::from_json("{not json"), std::runtime_error);
        REQUIRE_THROWS_AS(MarketConfig::from_json("[1, 2]"), std::runtime_error);
        REQUIRE_THROWS_AS(MarketConfig::from_json(R"({"min_confirm_time": "soon"})"),
                          std::runtime_error);
    }

    SECTION("Inconsistent bounds") {
        REQUIRE_THROWS_AS(
            MarketConfig::from_json(R"({"min_confirm_time": 900, "max_confirm_time": 600})"),
            std::invalid_argument);
        REQUIRE_THROWS_AS(MarketConfig::from_json(R"({"max_lottery_players": 0})"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(MarketConfig::from_json(R"({"max_lottery_players": 70000})"),
                          std::invalid_argument);
    }

    SECTION("Confirm window stays within 5 minutes and 24 hours") {
        REQUIRE_THROWS_AS(MarketConfig::from_json(R"({"min_confirm_time": 299})"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(MarketConfig::from_json(R"({"max_confirm_time": 86401})"),
                          std::invalid_argument);
        MarketConfig config =
            MarketConfig::from_json(R"({"min_confirm_time": 300, "max_confirm_time": 86400})");
        REQUIRE(config.min_confirm_time == CONFIRM_TIME_FLOOR);
        REQUIRE(config.max_confirm_time == CONFIRM_TIME_CEILING);
    }

    SECTION("Log level names") {
        REQUIRE_THROWS_AS(MarketConfig::from_json(R"({"log_level": "verbose"})"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(MarketConfig::from_json(R"({"log_level": "INFO"})"),
                          std::invalid_argument);
        REQUIRE(MarketConfig::from_json(R"({"log_level": "off"})").log_level == "off");
        REQUIRE(MarketConfig::from_json(R"({"log_level": "warn"})").log_level == "warn");
        REQUIRE(MarketConfig::from_json(R"({"log_level": "error"})").log_level == "error");
        REQUIRE(MarketConfig::from_json(R"({"log_level": "trace"})").log_level == "trace");
    }
}

TEST_CASE("MarketConfig from file", "[config]") {
    REQUIRE_THROWS_AS(MarketConfig::from_file("/nonexistent/nftmart.json"), std::runtime_error);
}

TEST_CASE("MarketConfig builders", "[config]") {
    MarketConfig config = MarketConfig()
        .with_log_level("warn")
        .with_confirm_window(600, 1200)
        .with_max_lottery_players(8);

    REQUIRE(config.log_level == "warn");
    REQUIRE(config.min_confirm_time == 600);
    REQUIRE(config.max_confirm_time == 1200);
    REQUIRE(config.max_lottery_players == 8);
    REQUIRE_NOTHROW(config.validate());

    config.with_confirm_window(0, 1200);
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

    config.with_confirm_window(600, 1200).with_log_level("chatty");
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
}
