//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace raidfeed::defaults {

// -- constants for raid bosses ------------------------------------------------

namespace raid {

/// The level of a boss whose name does not carry one.
inline constexpr boss_level level = 0;

} // namespace raid

// -- constants for the aggregator ---------------------------------------------

namespace aggregator {

/// Number of recent sightings kept per boss.
inline constexpr size_t history_size = 20;

} // namespace aggregator

// -- constants for the raidfeed executable ------------------------------------

namespace feed {

/// Interval between two printed boss lists.
inline constexpr std::chrono::seconds list_interval = std::chrono::seconds{5};

/// Path for reading sightings or `-` for reading from STDIN.
inline constexpr std::string_view read = "-";

} // namespace feed

// -- constants for the logger -------------------------------------------------
namespace logger {

/// Log format for file output.
inline constexpr const char* file_format
  = "[%Y-%m-%dT%T.%e%z] [%n] [%l] [%s:%#] %v";

/// Log format for console output.
inline constexpr const char* console_format = "%^[%T.%e] %v%$";

/// Verbosity for writing to console.
inline constexpr const char* console_verbosity = "info";

/// Verbosity for writing to file.
inline constexpr const char* file_verbosity = "quiet";

/// Log filename.
inline constexpr const char* log_file = "raidfeed.log";

/// Maximum number of log messages in the logger queue.
inline constexpr size_t queue_size = 100;

/// Number of logger threads.
inline constexpr size_t logger_threads = 1;

/// Rotate log file if the file size exceeds threshold.
inline constexpr bool disable_log_rotation = false;

/// File size threshold for the `rotating_file_sink`.
inline constexpr size_t rotate_threshold = 10 * 1'024 * 1'024; // 10_Mi;

/// Maximum number of rotated log files that are kept.
inline constexpr size_t rotate_files = 3;

} // namespace logger

} // namespace raidfeed::defaults
