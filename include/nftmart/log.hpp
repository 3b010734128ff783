#ifndef NFTMART_LOG_HPP
#define NFTMART_LOG_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "config.hpp"

namespace nftmart {

// Shared "nftmart" logger; created on first use with a stdout sink
spdlog::logger& market_log();

// Rebuild the logger from config (level, optional rotating file sink)
void init_logging(const MarketConfig& config);

} // namespace nftmart

#endif // NFTMART_LOG_HPP
