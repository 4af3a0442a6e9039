#ifndef ARBSCAN_LOG_HPP
#define ARBSCAN_LOG_HPP

#include <string_view>

#include <spdlog/spdlog.h>

#include "config.hpp"

namespace arbscan {

// "trace".."critical" or "off". Throws std::invalid_argument otherwise.
spdlog::level::level_enum parse_log_level(std::string_view level);

// Installs the default logger: colored stdout plus an optional file sink
void init_logging(const LoggingConfig& config);

} // namespace arbscan

#endif // ARBSCAN_LOG_HPP
