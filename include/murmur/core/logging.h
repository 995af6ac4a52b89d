#pragma once

#include <murmur/core/types.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace murmur::core {

struct LoggingConfig {
    std::string level = "info";  // trace|debug|info|warn|error|off
    std::filesystem::path file;  // empty = console only
    size_t max_file_bytes = 10 * 1024 * 1024;
    size_t max_files = 5;
};

/**
 * Install the default spdlog logger: a colored console sink, plus a rotating
 * file sink when LoggingConfig::file is set. Unknown levels are rejected with
 * ConfigurationError and leave the current logger untouched.
 */
Result<void> configureLogging(const LoggingConfig& config);

} // namespace murmur::core
