#ifndef NFTMART_CONFIG_HPP
#define NFTMART_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace nftmart {

// =============================================================================
// Marketplace Configuration
// =============================================================================

// Hard limits for the English auction confirm window; a config may only narrow them
constexpr uint64_t CONFIRM_TIME_FLOOR = 300;      // 5 minutes
constexpr uint64_t CONFIRM_TIME_CEILING = 86400;  // 24 hours

struct MarketConfig {
    // Logging
    std::string log_level = "info";
    std::string log_file;                     // Empty = colored stdout
    size_t log_max_size = 5 * 1024 * 1024;
    size_t log_max_files = 3;

    // English auction anti-snipe window bounds (seconds)
    uint64_t min_confirm_time = CONFIRM_TIME_FLOOR;
    uint64_t max_confirm_time = CONFIRM_TIME_CEILING;

    // Lottery player cap; the winner permutation table covers m < 65536
    uint32_t max_lottery_players = 65535;

    // Load from JSON file
    static MarketConfig from_file(std::string_view path);

    // Load from JSON string
    static MarketConfig from_json(std::string_view content);

    // Throws std::invalid_argument on inconsistent bounds or an unknown log level
    void validate() const;

    // Builder methods
    MarketConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    MarketConfig& with_log_file(std::string_view path) {
        log_file = std::string(path);
        return *this;
    }

    MarketConfig& with_confirm_window(uint64_t min_seconds, uint64_t max_seconds) {
        min_confirm_time = min_seconds;
        max_confirm_time = max_seconds;
        return *this;
    }

    MarketConfig& with_max_lottery_players(uint32_t cap) {
        max_lottery_players = cap;
        return *this;
    }
};

} // namespace nftmart

#endif // NFTMART_CONFIG_HPP
