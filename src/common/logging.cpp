/// @file logging.cpp
/// @brief spdlog setup

#include "logging.h"

#include <mutex>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "config.h"
#include "error.h"

namespace clintab {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_logger_once;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

void InitLogging(const LogConfig& config) {
    std::call_once(g_logger_once, [&config]() {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (config.file_path.has_value()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                *config.file_path, config.max_file_size, config.max_files));
        }

        auto logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        logger->set_level(ToSpdlog(config.level));
        logger->set_pattern(config.pattern);
        logger->flush_on(spdlog::level::warn);
        g_logger = std::move(logger);
    });
}

std::shared_ptr<spdlog::logger> GetLogger() {
    if (!g_logger) {
        InitLogging();
    }
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    GetLogger()->set_level(ToSpdlog(level));
}

absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name) {
    const std::string level = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (level == "trace") return LogLevel::kTrace;
    if (level == "debug") return LogLevel::kDebug;
    if (level == "info") return LogLevel::kInfo;
    if (level == "warn" || level == "warning") return LogLevel::kWarn;
    if (level == "error") return LogLevel::kError;
    if (level == "off") return LogLevel::kOff;
    return absl::InvalidArgumentError(absl::StrCat("Unknown log level: ", absl::string_view(name.data(), name.size())));
}

absl::StatusOr<LogConfig> LogConfigFromSettings(const Config& config) {
    LogConfig log_config;

    if (config.HasKey("logging.level")) {
        auto level = ParseLogLevel(config.GetString("logging.level"));
        if (!level.ok()) {
            return MakeError(ErrorCode::kConfigurationError, std::string_view(level.status().message().data(), level.status().message().size()));
        }
        log_config.level = *level;
    }
    if (config.HasKey("logging.file")) {
        log_config.file_path = config.GetString("logging.file");
    }

    const int64_t size_mb = config.GetInt("logging.max_file_size_mb", 5);
    const int64_t files = config.GetInt("logging.max_files", 3);
    if (size_mb <= 0 || files <= 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         "logging.max_file_size_mb and logging.max_files must be positive");
    }
    log_config.max_file_size = static_cast<size_t>(size_mb) * 1024 * 1024;
    log_config.max_files = static_cast<size_t>(files);
    return log_config;
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
}

}  // namespace clintab
