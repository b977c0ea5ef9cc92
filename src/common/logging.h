#pragma once

/// @file logging.h
/// @brief Process-wide spdlog logger for FlowGuard
///
/// Everything logged here is diagnostics for the operator and goes to
/// stderr (plus an optional rotating file). Stdout carries only command
/// output, so `flowguard scan | jq` keeps working at any level.
///
/// Guardian code logs counts, sizes and rule types. It never formats a
/// matched value or a line of the scanned text into a message: a debug log
/// that echoed what the sanitizer just redacted would leak it.

#include <memory>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <spdlog/spdlog.h>

namespace flowguard {

/// @brief Severity threshold; values are spdlog's so the two convert by cast
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Sink setup used when the logger is first built
struct LogConfig {
    std::string name = "flowguard";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

    // Optional rotating file next to the stderr sink
    bool enable_file = false;
    std::string file_path = "flowguard.log";
    size_t max_file_size = 5 * 1024 * 1024;
    size_t max_files = 3;
};

/// @brief Build the logger from `config`
///
/// The CLI calls this once after parsing `--log-level`. A second call is a
/// no-op until ShutdownLogging() drops the current logger.
void InitLogging(const LogConfig& config = {});

/// @brief Current logger; library code that runs before InitLogging()
///        gets a default stderr logger at info
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Change the threshold of the logger and all of its sinks
void SetLogLevel(LogLevel level);

/// @brief Map a `--log-level` / `logging.level` value to a LogLevel
/// @return InvalidArgument for a name spdlog does not know; "warning" is
///         accepted for warn and case is ignored
absl::StatusOr<LogLevel> ParseLogLevel(std::string_view name);

void FlushLogs();

/// @brief Flush and drop the logger; the next log line rebuilds a default one
void ShutdownLogging();

#define FLOWGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::flowguard::GetLogger(), __VA_ARGS__)
#define FLOWGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::flowguard::GetLogger(), __VA_ARGS__)
#define FLOWGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::flowguard::GetLogger(), __VA_ARGS__)
#define FLOWGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::flowguard::GetLogger(), __VA_ARGS__)
#define FLOWGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::flowguard::GetLogger(), __VA_ARGS__)
#define FLOWGUARD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::flowguard::GetLogger(), __VA_ARGS__)

}  // namespace flowguard
