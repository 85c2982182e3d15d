//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/configuration.hpp"
#include "raidfeed/logger.hpp"
#include "raidfeed/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <caf/test/runner.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end)
    return {};
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  std::string raidfeed_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(raidfeed_loglevel, "raidfeed-verbosity",
                          "console verbosity for libraidfeed")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
  }
  caf::settings log_settings;
  put(log_settings, "raidfeed.console-verbosity", raidfeed_loglevel);
  put(log_settings, "raidfeed.console-format", "%^[%s:%#] %v%$");
  auto log_context = raidfeed::create_log_context(log_settings);
  if (!log_context) {
    std::cerr << "failed to create log context\n";
    return EXIT_FAILURE;
  }
  // Registers all message types with CAF.
  [[maybe_unused]] auto config = raidfeed::configuration{};
  // Run the unit tests. The runner only sees the arguments before '--'.
  auto runner_argc = static_cast<int>(
    std::find(argv + 1, argv + argc, std::string_view{"--"}) - argv);
  auto runner = caf::test::runner{};
  return runner.run(runner_argc, argv);
}
