// =============================================================================
// log.cpp - spdlog logger setup
// =============================================================================

#include "nftmart/log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace nftmart {

namespace {

constexpr const char* LOGGER_NAME = "nftmart";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

} // namespace

spdlog::logger& market_log() {
    auto& logger = logger_slot();
    if (!logger) {
        logger = spdlog::get(LOGGER_NAME);
        if (!logger) {
            logger = spdlog::stdout_color_mt(LOGGER_NAME);
            logger->set_level(spdlog::level::info);
        }
    }
    return *logger;
}

void init_logging(const MarketConfig& config) {
    spdlog::drop(LOGGER_NAME);

    std::shared_ptr<spdlog::logger> logger;
    if (config.log_file.empty()) {
        logger = spdlog::stdout_color_mt(LOGGER_NAME);
    } else {
        logger = spdlog::rotating_logger_mt(LOGGER_NAME, config.log_file,
                                            config.log_max_size, config.log_max_files);
    }
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger_slot() = logger;
}

} // namespace nftmart
