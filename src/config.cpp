// =============================================================================
// config.cpp - MarketConfig loading (JSON)
// =============================================================================

#include "nftmart/config.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nftmart {

using json = nlohmann::json;

MarketConfig MarketConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

MarketConfig MarketConfig::from_json(std::string_view content) {
    json doc;
    try {
        doc = json::parse(content.begin(), content.end());
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    MarketConfig config;
    try {
        config.log_level = doc.value("log_level", config.log_level);
        config.log_file = doc.value("log_file", config.log_file);
        config.log_max_size = doc.value("log_max_size", config.log_max_size);
        config.log_max_files = doc.value("log_max_files", config.log_max_files);
        config.min_confirm_time = doc.value("min_confirm_time", config.min_confirm_time);
        config.max_confirm_time = doc.value("max_confirm_time", config.max_confirm_time);
        config.max_lottery_players = doc.value("max_lottery_players", config.max_lottery_players);
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
}

void MarketConfig::validate() const {
    if (min_confirm_time < CONFIRM_TIME_FLOOR || max_confirm_time > CONFIRM_TIME_CEILING ||
        min_confirm_time > max_confirm_time) {
        throw std::invalid_argument("confirm window must satisfy 300 <= min <= max <= 86400");
    }
    if (max_lottery_players == 0 || max_lottery_players > 65535) {
        throw std::invalid_argument("max_lottery_players must be in [1, 65535]");
    }
    // from_str maps unknown names to off
    if (spdlog::level::from_str(log_level) == spdlog::level::off && log_level != "off") {
        throw std::invalid_argument("unknown log_level: " + log_level);
    }
    if (log_max_files == 0) {
        throw std::invalid_argument("log_max_files must be positive");
    }
}

} // namespace nftmart
