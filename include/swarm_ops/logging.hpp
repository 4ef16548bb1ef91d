#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

namespace swarm_ops {

/** @brief Number of formatted entries retained for the rolling operator log. */
inline constexpr std::size_t k_rolling_log_capacity{50};

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/** @brief Most recent timestamped, severity-tagged entries, oldest first. */
std::vector<std::string> recent_log_entries();

}  // namespace swarm_ops
