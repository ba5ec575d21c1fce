#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>

namespace scape {

/// @brief Creates the process-wide logger. Later calls are ignored.
///
/// Console output always; a non-empty @p log_file adds a plain-text file sink. wlroots
/// messages reach the same logger through the bridge installed by the wlroots glue.
void initialize_logger(std::string_view app_name = "scape", std::string_view log_file = {});

/// @brief The process-wide logger, created with defaults on first use.
[[nodiscard]] auto get_logger() -> std::shared_ptr<spdlog::logger>;

void set_log_level(spdlog::level::level_enum level);

/// @brief Maps the `logging.level` / `--log-level` names ("trace" to "critical").
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

} // namespace scape

// SPDLOG_ACTIVE_LEVEL is TRACE, so every level compiles in and the runtime level filters

#define SCAPE_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::scape::get_logger(), __VA_ARGS__)

#define SCAPE_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::scape::get_logger(), __VA_ARGS__)

#define SCAPE_LOG_INFO(...) SPDLOG_LOGGER_INFO(::scape::get_logger(), __VA_ARGS__)

#define SCAPE_LOG_WARN(...) SPDLOG_LOGGER_WARN(::scape::get_logger(), __VA_ARGS__)

#define SCAPE_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::scape::get_logger(), __VA_ARGS__)

#define SCAPE_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::scape::get_logger(), __VA_ARGS__)
