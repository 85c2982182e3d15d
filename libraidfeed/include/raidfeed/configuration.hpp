//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include <caf/actor_system_config.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace raidfeed {

/// @returns The config dirs of the application.
/// @param cfg The actor system config to introspect.
auto config_dirs(const caf::actor_system_config& cfg)
  -> std::vector<std::filesystem::path>;

/// Translates an environment variable such as `RAIDFEED_HISTORY_SIZE` into a
/// config key such as `history-size`. A `__` in the variable separates
/// categories.
/// @returns The key, or `std::nullopt` if `key` does not start with `prefix`.
auto to_config_key(std::string_view key, std::string_view prefix)
  -> std::optional<std::string>;

/// Parses a YAML document into settings. Nested YAML maps become nested
/// dictionaries, and null values are dropped.
auto parse_yaml_settings(std::string_view str) -> caf::expected<caf::settings>;

/// Bundles all configuration parameters of a raidfeed process.
class configuration : public caf::actor_system_config {
public:
  // -- constructors, destructors, and assignment operators --------------------

  configuration();

  // -- modifiers --------------------------------------------------------------

  /// Fills `content` from, in order of decreasing precedence, the command line,
  /// `RAIDFEED_*` environment variables, configuration files, and defaults.
  auto parse(int argc, char** argv) -> caf::error;

  // -- configuration options --------------------------------------------------

  /// The program command line, without the program name.
  std::vector<std::string> command_line = {};

  /// The configuration files that were loaded.
  std::vector<std::filesystem::path> config_files = {};

private:
  auto embed_config(const std::map<std::string, caf::config_value>& settings)
    -> caf::error;
};

} // namespace raidfeed
