#pragma once

/// @file logging.h
/// @brief spdlog setup and logging macros

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>

namespace clintab {

class Config;

enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kOff = spdlog::level::off
};

struct LogConfig {
    std::string name = "clintab";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";

    /// Rotating log file next to console output; none if unset
    std::optional<std::string> file_path;
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/// @brief Install the process logger
///
/// Console output goes to stderr. Only the first call takes effect.
void InitLogging(const LogConfig& config = {});

/// @brief The process logger, installed with defaults on first use
std::shared_ptr<spdlog::logger> GetLogger();

void SetLogLevel(LogLevel level);

/// @brief "trace", "debug", "info", "warn"/"warning", "error" or "off",
/// any case
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

/// @brief Logger settings under the "logging" section
///
/// Reads logging.level, logging.file, logging.max_file_size_mb and
/// logging.max_files. An unknown level is a configuration error.
absl::StatusOr<LogConfig> LogConfigFromSettings(const Config& config);

void FlushLogs();

#define CLINTAB_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::clintab::GetLogger(), __VA_ARGS__)
#define CLINTAB_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::clintab::GetLogger(), __VA_ARGS__)
#define CLINTAB_LOG_INFO(...) SPDLOG_LOGGER_INFO(::clintab::GetLogger(), __VA_ARGS__)
#define CLINTAB_LOG_WARN(...) SPDLOG_LOGGER_WARN(::clintab::GetLogger(), __VA_ARGS__)
#define CLINTAB_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::clintab::GetLogger(), __VA_ARGS__)

}  // namespace clintab
