#pragma once

/// @file include/rebal/logging.hpp
/// @brief Process-wide `rebal` spdlog logger.
///
/// `init()` is called once by the executable. Library code only uses
/// `get()` (directly or through the REBAL_LOG_* macros); if `init()` was never
/// called, `get()` lazily creates a stderr logger at `warn` level so tests
/// stay quiet.

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace rebal::log {

/// Name under which the logger is registered with spdlog.
inline constexpr const char* LOGGER_NAME = "rebal";

/// Configure the `rebal` logger: coloured stderr sink plus an optional file
/// sink. Replaces any previously configured logger.
///
/// # Throws
/// `spdlog::spdlog_ex` if the log file cannot be opened.
void init(spdlog::level::level_enum level,
          const std::optional<std::string>& file = std::nullopt);

/// The `rebal` logger. Never null.
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// Parse `trace|debug|info|warn|error|critical|off`.
[[nodiscard]] std::optional<spdlog::level::level_enum>
parse_level(const std::string& name) noexcept;

}  // namespace rebal::log

#define REBAL_LOG_TRACE(...) ::rebal::log::get()->trace(__VA_ARGS__)
#define REBAL_LOG_DEBUG(...) ::rebal::log::get()->debug(__VA_ARGS__)
#define REBAL_LOG_INFO(...)  ::rebal::log::get()->info(__VA_ARGS__)
#define REBAL_LOG_WARN(...)  ::rebal::log::get()->warn(__VA_ARGS__)
#define REBAL_LOG_ERROR(...) ::rebal::log::get()->error(__VA_ARGS__)
