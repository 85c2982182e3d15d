//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/configuration.hpp"

#include "raidfeed/defaults.hpp"
#include "raidfeed/detail/add_message_types.hpp"
#include "raidfeed/detail/assert.hpp"
#include "raidfeed/detail/env.hpp"
#include "raidfeed/error.hpp"
#include "raidfeed/logger.hpp"

#include <caf/config_option_adder.hpp>
#include <caf/config_value.hpp>
#include <caf/timespan.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

namespace raidfeed {

namespace {

using flat_settings = std::map<std::string, caf::config_value>;

/// Interprets a string the way CAF interprets option values on the command
/// line, falling back to a plain string.
auto to_config_value(std::string_view str) -> caf::config_value {
  if (auto x = caf::config_value::parse(str))
    return std::move(*x);
  return caf::config_value{std::string{str}};
}

auto convert(const YAML::Node& node) -> caf::config_value {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar:
      return to_config_value(node.as<std::string>());
    case YAML::NodeType::Sequence: {
      auto xs = caf::config_value::list{};
      xs.reserve(node.size());
      for (const auto& element : node)
        xs.push_back(convert(element));
      return caf::config_value{std::move(xs)};
    }
    case YAML::NodeType::Map: {
      auto xs = caf::config_value::dictionary{};
      for (const auto& pair : node) {
        auto value = convert(pair.second);
        // A config_value has no notion of null, so we drop such keys.
        if (caf::holds_alternative<caf::none_t>(value))
          continue;
        xs.emplace(pair.first.as<std::string>(), std::move(value));
      }
      return caf::config_value{std::move(xs)};
    }
  }
  panic("unhandled YAML node type in switch statement");
}

void flatten(const caf::settings& xs, const std::string& prefix,
             flat_settings& result) {
  for (const auto& [key, value] : xs) {
    auto name = prefix.empty() ? key : fmt::format("{}.{}", prefix, key);
    if (const auto* dict = caf::get_if<caf::config_value::dictionary>(&value))
      flatten(*dict, name, result);
    else
      result[name] = value;
  }
}

auto load_contents(const std::filesystem::path& path)
  -> caf::expected<std::string> {
  auto in = std::ifstream{path};
  if (!in)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open {}", path.string()));
  auto buffer = std::ostringstream{};
  buffer << in.rdbuf();
  return std::move(buffer).str();
}

auto find_config_file(const std::filesystem::path& dir)
  -> caf::expected<std::optional<std::filesystem::path>> {
  auto err = std::error_code{};
  const auto path_yaml = dir / "raidfeed.yaml";
  const auto yaml_exists = std::filesystem::exists(path_yaml, err);
  if (err)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to check if {} exists: {}",
                                       path_yaml.string(), err.message()));
  const auto path_yml = dir / "raidfeed.yml";
  const auto yml_exists = std::filesystem::exists(path_yml, err);
  if (err)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to check if {} exists: {}",
                                       path_yml.string(), err.message()));
  if (yaml_exists and yml_exists)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("both {} and {} exist",
                                       path_yaml.string(), path_yml.string()));
  if (yaml_exists)
    return path_yaml;
  if (yml_exists)
    return path_yml;
  return std::nullopt;
}

auto config_dirs(bool bare_mode) -> std::vector<std::filesystem::path> {
  if (bare_mode)
    return {};
  auto result = std::vector<std::filesystem::path>{};
  if (auto xdg_config_home = detail::getenv("XDG_CONFIG_HOME"))
    result.push_back(std::filesystem::path{*xdg_config_home} / "raidfeed");
  else if (auto home = detail::getenv("HOME"))
    result.push_back(std::filesystem::path{*home} / ".config" / "raidfeed");
  return result;
}

/// Merges raidfeed environment variables into a configuration.
void merge_environment(flat_settings& config) {
  for (const auto& [key, value] : detail::environment()) {
    if (value.empty())
      continue;
    auto config_key = to_config_key(key, "RAIDFEED");
    if (!config_key)
      continue;
    if (!config_key->starts_with("caf."))
      config_key->insert(0, "raidfeed.");
    // These environment variables have been manually checked already.
    if (*config_key == "raidfeed.bare-mode" || *config_key == "raidfeed.config")
      continue;
    config[*config_key] = to_config_value(value);
  }
}

} // namespace

auto config_dirs(const caf::actor_system_config& cfg)
  -> std::vector<std::filesystem::path> {
  return config_dirs(caf::get_or(cfg.content, "raidfeed.bare-mode", false));
}

/// Translates an environment variable to a config key. All keys follow the
/// pattern by PREFIX_SUFFIX, where PREFIX is the application-spefic prefix
/// that gets stripped. Thereafter, SUFFIX adheres to the following
/// substitution rules:
/// 1. A '_' translates into '-'
/// 2. A "__" translates into the record separator '.'
/// @pre `!prefix.empty()`
auto to_config_key(std::string_view key, std::string_view prefix)
  -> std::optional<std::string> {
  RAIDFEED_ASSERT(!prefix.empty());
  // PREFIX_X is the shortest allowed key.
  if (prefix.size() + 2 > key.size())
    return std::nullopt;
  if (!key.starts_with(prefix) || key[prefix.size()] != '_')
    return std::nullopt;
  auto suffix = key.substr(prefix.size() + 1);
  auto result = std::string{};
  result.reserve(suffix.size());
  for (size_t i = 0; i < suffix.size(); ++i) {
    if (suffix[i] == '_') {
      if (i + 1 < suffix.size() && suffix[i + 1] == '_') {
        result += '.';
        ++i;
      } else {
        result += '-';
      }
    } else {
      result += static_cast<char>(
        std::tolower(static_cast<unsigned char>(suffix[i])));
    }
  }
  return result;
}

auto parse_yaml_settings(std::string_view str) -> caf::expected<caf::settings> {
  try {
    auto node = YAML::Load(std::string{str});
    if (node.IsNull())
      return caf::settings{};
    if (!node.IsMap())
      return caf::make_error(ec::parse_error,
                             "not a map of key-value pairs");
    auto value = convert(node);
    return std::move(caf::get<caf::config_value::dictionary>(value));
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse YAML at line {} column "
                                       "{}: {}",
                                       e.mark.line + 1, e.mark.column + 1,
                                       e.msg));
  }
}

configuration::configuration() {
  detail::add_message_types();
  opt_group{custom_options_, "?raidfeed"}
    .add<size_t>("history-size", "number of recent sightings kept per boss")
    .add<caf::timespan>("list-interval", "time between two boss lists")
    .add<std::string>("read,r", "path to read sightings from, or - for STDIN")
    .add<std::string>("console-verbosity", "verbosity of console output")
    .add<std::string>("console-format", "format string for console output")
    .add<std::string>("console", "color mode: automatic, always, or never")
    .add<std::string>("file-verbosity", "verbosity of the log file")
    .add<std::string>("file-format", "format string for the log file")
    .add<std::string>("log-file", "path to the log file")
    .add<bool>("disable-log-rotation", "write a single, unbounded log file")
    .add<size_t>("log-rotation-threshold", "log file size that triggers "
                                           "rotation")
    .add<size_t>("log-queue-size", "capacity of the log message queue")
    .add<std::string>("config", "path to an additional configuration file")
    .add<bool>("bare-mode", "ignore configuration files in the default "
                            "locations");
}

auto configuration::parse(int argc, char** argv) -> caf::error {
  // Parsing precedence, from highest to lowest:
  //
  // 1. CLI arguments
  // 2. Environment variables
  // 3. Config files
  // 4. Defaults
  RAIDFEED_ASSERT(argc > 0);
  RAIDFEED_ASSERT(argv != nullptr);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  command_line.assign(argv + 1, argv + argc);
  // Translate -qqq to -vvv to the corresponding log levels.
  const auto replacements = std::vector<std::pair<std::string, std::string>>{
    {"-qqq", "--console-verbosity=quiet"},
    {"-qq", "--console-verbosity=error"},
    {"-q", "--console-verbosity=warning"},
    {"-v", "--console-verbosity=verbose"},
    {"-vv", "--console-verbosity=debug"},
    {"-vvv", "--console-verbosity=trace"},
  };
  for (auto& option : command_line) {
    for (const auto& [old, new_] : replacements) {
      if (option == old)
        option = new_;
    }
  }
  // Do not use builtin config directories in "bare mode". We're checking this
  // here because config_dirs() relies on it already being there.
  auto falsy_env_values = std::set<std::string_view>{"", "0", "false", "FALSE"};
  if (std::find(command_line.begin(), command_line.end(), "--bare-mode")
      != command_line.end()) {
    caf::put(content, "raidfeed.bare-mode", true);
  } else if (auto bare_mode = detail::getenv("RAIDFEED_BARE_MODE")) {
    caf::put(content, "raidfeed.bare-mode",
             not falsy_env_values.contains(*bare_mode));
  }
  // Gather all to-be-considered configuration files.
  config_files.clear();
  for (const auto& dir : config_dirs(*this)) {
    auto file = find_config_file(dir);
    if (!file)
      return file.error();
    if (*file)
      config_files.push_back(std::move(**file));
  }
  auto cli_configs = std::vector<std::string>{};
  for (const auto& arg : command_line) {
    if (arg.starts_with("--config="))
      cli_configs.push_back(arg.substr(9));
  }
  if (cli_configs.empty()) {
    if (auto file = detail::getenv("RAIDFEED_CONFIG"))
      cli_configs.emplace_back(*file);
  }
  for (auto& file : cli_configs)
    config_files.emplace_back(std::move(file));
  // Parse and merge all configuration files.
  auto config = flat_settings{};
  for (const auto& path : config_files) {
    auto contents = load_contents(path);
    if (!contents)
      return add_context(contents.error(), "failed to read config file {}",
                         path.string());
    auto settings = parse_yaml_settings(*contents);
    if (!settings)
      return add_context(settings.error(), "failed to read config file {}",
                         path.string());
    flatten(*settings, "", config);
    RAIDFEED_DEBUG("loaded config file {}", path.string());
  }
  merge_environment(config);
  if (auto err = embed_config(config))
    return err;
  // Now parse all options from the command line. Prior to doing so, we clear
  // the config_file_path first so it does not use caf-application.conf as
  // fallback during actor_system_config::parse().
  config_file_path.clear();
  return actor_system_config::parse(command_line);
}

auto configuration::embed_config(
  const std::map<std::string, caf::config_value>& settings) -> caf::error {
  for (const auto& [key, value] : settings) {
    // The member custom_options_ (a config_option_set) is the only place that
    // contains the valid type information. The passed in config (file and
    // environment) must abide to it.
    if (const auto* option = custom_options_.qualified_name_lookup(key)) {
      auto val = value;
      if (auto err = option->sync(val))
        return add_context(err, "invalid value for option {}", key);
      caf::put(content, key, std::move(val));
    } else {
      // If the option is not relevant to CAF's custom options, we just store
      // the value directly in the content.
      caf::put(content, key, value);
    }
  }
  return caf::none;
}

} // namespace raidfeed
