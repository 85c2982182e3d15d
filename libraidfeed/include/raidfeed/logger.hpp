//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/config.hpp"
#include "raidfeed/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/fwd.hpp>

#include <string>

// RAIDFEED_INFO -> spdlog::info
// RAIDFEED_VERBOSE -> spdlog::debug
// RAIDFEED_DEBUG -> spdlog::trace
// RAIDFEED_TRACE -> spdlog::trace

#if RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif RAIDFEED_LOG_LEVEL == RAIDFEED_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include "raidfeed/detail/logger.hpp"
#include "raidfeed/detail/logger_formatters.hpp"

#if RAIDFEED_LOG_LEVEL >= RAIDFEED_LOG_LEVEL_TRACE

#  define RAIDFEED_TRACE(...)                                                  \
    SPDLOG_LOGGER_TRACE(::raidfeed::detail::logger(), __VA_ARGS__)

#else // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_TRACE

#  define RAIDFEED_TRACE(...) RAIDFEED_DISCARD_ARGS(__VA_ARGS__)

#endif // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_TRACE

#if RAIDFEED_LOG_LEVEL >= RAIDFEED_LOG_LEVEL_DEBUG

#  define RAIDFEED_DEBUG(...)                                                  \
    SPDLOG_LOGGER_TRACE(::raidfeed::detail::logger(), __VA_ARGS__)

#else // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_DEBUG

#  define RAIDFEED_DEBUG(...) RAIDFEED_DISCARD_ARGS(__VA_ARGS__)

#endif // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_DEBUG

#if RAIDFEED_LOG_LEVEL >= RAIDFEED_LOG_LEVEL_VERBOSE

#  define RAIDFEED_VERBOSE(...)                                                \
    SPDLOG_LOGGER_DEBUG(::raidfeed::detail::logger(), __VA_ARGS__)

#else // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_VERBOSE

#  define RAIDFEED_VERBOSE(...) RAIDFEED_DISCARD_ARGS(__VA_ARGS__)

#endif // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_VERBOSE

#if RAIDFEED_LOG_LEVEL >= RAIDFEED_LOG_LEVEL_INFO

#  define RAIDFEED_INFO(...)                                                   \
    SPDLOG_LOGGER_INFO(::raidfeed::detail::logger(), __VA_ARGS__)

#else // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_INFO

#  define RAIDFEED_INFO(...) RAIDFEED_DISCARD_ARGS(__VA_ARGS__)

#endif // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_INFO

#if RAIDFEED_LOG_LEVEL >= RAIDFEED_LOG_LEVEL_WARNING

#  define RAIDFEED_WARN(...)                                                   \
    SPDLOG_LOGGER_WARN(::raidfeed::detail::logger(), __VA_ARGS__)

#else // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_WARNING

#  define RAIDFEED_WARN(...) RAIDFEED_DISCARD_ARGS(__VA_ARGS__)

#endif // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_WARNING

#if RAIDFEED_LOG_LEVEL >= RAIDFEED_LOG_LEVEL_ERROR

#  define RAIDFEED_ERROR(...)                                                  \
    SPDLOG_LOGGER_ERROR(::raidfeed::detail::logger(), __VA_ARGS__)

#else // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_ERROR

#  define RAIDFEED_ERROR(...) RAIDFEED_DISCARD_ARGS(__VA_ARGS__)

#endif // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_ERROR

#if RAIDFEED_LOG_LEVEL >= RAIDFEED_LOG_LEVEL_CRITICAL

#  define RAIDFEED_CRITICAL(...)                                               \
    SPDLOG_LOGGER_CRITICAL(::raidfeed::detail::logger(), __VA_ARGS__)

#else // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_CRITICAL

#  define RAIDFEED_CRITICAL(...) RAIDFEED_DISCARD_ARGS(__VA_ARGS__)

#endif // RAIDFEED_LOG_LEVEL < RAIDFEED_LOG_LEVEL_CRITICAL

namespace raidfeed {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to make log level strings from config, like 'debug', to a log level int.
int loglevel_to_int(std::string c, int default_value = RAIDFEED_LOG_LEVEL_QUIET);

/// Sets up the global logger from the `raidfeed.*` options in `cfg`.
/// @returns A guard that flushes and tears down the logger when destroyed.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg);

} // namespace raidfeed
