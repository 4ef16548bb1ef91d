#pragma once

#include "swarm_ops/logging.hpp"

#include <filesystem>
#include <memory>

namespace swarm_ops::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "swarm_ops_tests_logs";
        return swarm_ops::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

}  // namespace swarm_ops::test
