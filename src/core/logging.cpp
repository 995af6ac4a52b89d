#include <murmur/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <vector>

namespace murmur::core {

namespace {

// spdlog maps unknown names to `off`, so only an explicit "off" may yield it.
std::optional<spdlog::level::level_enum> parseLevel(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

Result<spdlog::sink_ptr> makeFileSink(const LoggingConfig& config) {
    if (const auto dir = config.file.parent_path(); !dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            return Error{ErrorCode::ConfigurationError,
                         "Cannot create log directory " + dir.string() + ": " + ec.message()};
        }
    }
    try {
        return spdlog::sink_ptr{std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file.string(), config.max_file_bytes, config.max_files)};
    } catch (const spdlog::spdlog_ex& e) {
        return Error{ErrorCode::ConfigurationError,
                     "Cannot open log file " + config.file.string() + ": " + e.what()};
    }
}

} // namespace

Result<void> configureLogging(const LoggingConfig& config) {
    auto level = parseLevel(config.level);
    if (!level) {
        return Error{ErrorCode::ConfigurationError, "Unknown log level: " + config.level};
    }

    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
    if (!config.file.empty()) {
        auto fileSink = makeFileSink(config);
        if (!fileSink) {
            return fileSink.error();
        }
        sinks.push_back(std::move(fileSink).value());
    }

    auto logger = std::make_shared<spdlog::logger>("murmur", sinks.begin(), sinks.end());
    logger->set_level(*level);
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    if (!config.file.empty()) {
        spdlog::debug("[Logging] Writing {} ({} files of {} bytes)", config.file.string(),
                      config.max_files, config.max_file_bytes);
    }
    return {};
}

} // namespace murmur::core
