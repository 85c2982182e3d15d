//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/logger.hpp"

#include "raidfeed/config.hpp"
#include "raidfeed/defaults.hpp"
#include "raidfeed/detail/assert.hpp"

#include <caf/settings.hpp>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace raidfeed {

caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg) {
  if (!raidfeed::detail::setup_spdlog(cfg))
    return caf::make_error(raidfeed::ec::invalid_configuration,
                           "failed to set up the logger");
  return {caf::detail::make_scope_guard(
    std::addressof(raidfeed::detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return RAIDFEED_LOG_LEVEL_QUIET;
  if (x == "critical")
    return RAIDFEED_LOG_LEVEL_CRITICAL;
  if (x == "error")
    return RAIDFEED_LOG_LEVEL_ERROR;
  if (x == "warning")
    return RAIDFEED_LOG_LEVEL_WARNING;
  if (x == "info")
    return RAIDFEED_LOG_LEVEL_INFO;
  if (x == "verbose")
    return RAIDFEED_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return RAIDFEED_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return RAIDFEED_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

/// Converts a raidfeed log level to spdlog level
spdlog::level::level_enum raidfeed_loglevel_to_spd(const int value) {
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case RAIDFEED_LOG_LEVEL_QUIET:
      break;
    case RAIDFEED_LOG_LEVEL_CRITICAL:
      level = spdlog::level::critical;
      break;
    case RAIDFEED_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case RAIDFEED_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case RAIDFEED_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case RAIDFEED_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case RAIDFEED_LOG_LEVEL_DEBUG:
      level = spdlog::level::trace;
      break;
    case RAIDFEED_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      RAIDFEED_ASSERT(false, "unhandled log level");
  }
  return level;
}

/// Reads a verbosity option and validates it.
std::optional<std::string>
get_verbosity(const caf::settings& cfg, std::string_view key,
              std::string fallback) {
  auto value = caf::get_if<std::string>(&cfg, key);
  if (!value)
    return fallback;
  if (loglevel_to_int(*value, -1) < 0) {
    fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
               *value);
    return std::nullopt;
  }
  return *value;
}

} // namespace

namespace detail {

bool setup_spdlog(const caf::settings& cfg) try {
  if (raidfeed::detail::logger()->name() != "/dev/null") {
    RAIDFEED_ERROR("Log already up");
    return false;
  }
  auto console_verbosity
    = get_verbosity(cfg, "raidfeed.console-verbosity",
                    raidfeed::defaults::logger::console_verbosity);
  auto file_verbosity
    = get_verbosity(cfg, "raidfeed.file-verbosity",
                    raidfeed::defaults::logger::file_verbosity);
  if (!console_verbosity || !file_verbosity)
    return false;
  auto raidfeed_file_verbosity = loglevel_to_int(*file_verbosity);
  auto raidfeed_console_verbosity = loglevel_to_int(*console_verbosity);
  auto raidfeed_verbosity
    = std::max(raidfeed_file_verbosity, raidfeed_console_verbosity);
  // Helper to set the color mode
  spdlog::color_mode log_color = [&]() -> spdlog::color_mode {
    auto config_value = caf::get_or(cfg, "raidfeed.console", "automatic");
    if (config_value == "automatic")
      return spdlog::color_mode::automatic;
    if (config_value == "always")
      return spdlog::color_mode::always;
    return spdlog::color_mode::never;
  }();
  auto log_file = caf::get_or(cfg, "raidfeed.log-file",
                              std::string{defaults::logger::log_file});
  auto queue_size = caf::get_or(cfg, "raidfeed.log-queue-size",
                                defaults::logger::queue_size);
  spdlog::init_thread_pool(queue_size, defaults::logger::logger_threads);
  std::vector<spdlog::sink_ptr> sinks;
  // Add console sink.
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(log_color);
  auto console_format
    = caf::get_or(cfg, "raidfeed.console-format",
                  std::string{defaults::logger::console_format});
  console_sink->set_pattern(console_format);
  console_sink->set_level(raidfeed_loglevel_to_spd(raidfeed_console_verbosity));
  sinks.push_back(console_sink);
  // Add file sink.
  if (raidfeed_file_verbosity != RAIDFEED_LOG_LEVEL_QUIET) {
    bool disable_rotation
      = caf::get_or(cfg, "raidfeed.disable-log-rotation",
                    defaults::logger::disable_log_rotation);
    spdlog::sink_ptr file_sink = nullptr;
    if (!disable_rotation) {
      auto threshold = caf::get_or(cfg, "raidfeed.log-rotation-threshold",
                                   defaults::logger::rotate_threshold);
      file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, threshold, defaults::logger::rotate_files);
    } else {
      file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    }
    file_sink->set_level(raidfeed_loglevel_to_spd(raidfeed_file_verbosity));
    auto file_format = caf::get_or(cfg, "raidfeed.file-format",
                                   std::string{defaults::logger::file_format});
    file_sink->set_pattern(file_format);
    sinks.push_back(file_sink);
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "raidfeed", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(raidfeed_loglevel_to_spd(raidfeed_verbosity));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  std::cerr << err.what() << "\n";
  return false;
}

void shutdown_spdlog() {
  RAIDFEED_DEBUG("shut down logging");
  spdlog::shutdown();
  logger() = std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> raidfeed_logger
    = spdlog::async_factory::template create<spdlog::sinks::null_sink_mt>(
      "/dev/null");
  return raidfeed_logger;
}

} // namespace detail
} // namespace raidfeed
