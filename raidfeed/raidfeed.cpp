//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/configuration.hpp"
#include "raidfeed/defaults.hpp"
#include "raidfeed/error.hpp"
#include "raidfeed/logger.hpp"
#include "raidfeed/raid.hpp"
#include "raidfeed/raid_aggregator.hpp"
#include "raidfeed/raid_client.hpp"
#include "raidfeed/sighting_format.hpp"

#include <caf/actor_system.hpp>
#include <caf/async/blocking_producer.hpp>
#include <caf/async/spsc_buffer.hpp>
#include <caf/scoped_actor.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <vector>

using namespace raidfeed;

namespace {

/// Pushes every line of `in` into the aggregator's source and closes it at the
/// end of the input. Lines that fail to parse become read errors.
void feed(std::istream& in, raid_sink sink) {
  auto producer = caf::async::make_blocking_producer(std::move(sink));
  if (!producer) {
    RAIDFEED_ERROR("failed to open the raid source");
    return;
  }
  auto line = std::string{};
  auto line_number = size_t{0};
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line.starts_with('#'))
      continue;
    auto sighting = parse_sighting(line);
    if (!sighting)
      sighting = caf::expected<raid_info>{
        add_context(sighting.error(), "in line {}", line_number)};
    if (!producer->push(std::move(sighting))) {
      RAIDFEED_WARN("raid aggregator stopped reading at line {}",
                    line_number);
      return;
    }
  }
  RAIDFEED_VERBOSE("read {} lines", line_number);
  producer->close();
}

void print_bosses(std::vector<raid_boss> bosses) {
  std::sort(bosses.begin(), bosses.end(), [](const auto& x, const auto& y) {
    return std::tie(x.level, x.name) < std::tie(y.level, y.name);
  });
  for (const auto& boss : bosses)
    fmt::print("{}\n", boss);
  fmt::print("\n");
  std::fflush(stdout);
}

} // namespace

int main(int argc, char** argv) {
  auto cfg = configuration{};
  if (auto err = cfg.parse(argc, argv)) {
    fmt::print(stderr, "failed to parse configuration: {}\n", err);
    return EXIT_FAILURE;
  }
  if (caf::get_or(cfg.content, "help", false))
    return EXIT_SUCCESS;
  auto log_context = create_log_context(cfg.content);
  if (!log_context)
    return EXIT_FAILURE;
  auto history_size = caf::get_or(cfg.content, "raidfeed.history-size",
                                  defaults::aggregator::history_size);
  auto list_interval
    = caf::get_or(cfg.content, "raidfeed.list-interval",
                  caf::timespan{defaults::feed::list_interval});
  auto path = caf::get_or(cfg.content, "raidfeed.read",
                          std::string{defaults::feed::read});
  auto file = std::ifstream{};
  if (path != "-") {
    file.open(path);
    if (!file) {
      RAIDFEED_ERROR("failed to open {}", path);
      return EXIT_FAILURE;
    }
  }
  auto& in = path == "-" ? std::cin : static_cast<std::istream&>(file);
  auto sys = caf::actor_system{cfg};
  auto [source, sink]
    = caf::async::make_spsc_buffer_resource<caf::expected<raid_info>>();
  auto client
    = raid_client{spawn_raid_aggregator(sys, std::move(source), history_size)};
  RAIDFEED_INFO("aggregating raids with a history size of {}", history_size);
  auto done = std::promise<void>{};
  auto finished = done.get_future();
  auto reader = std::thread{[&in, sink = std::move(sink), &done]() mutable {
    feed(in, std::move(sink));
    done.set_value();
  }};
  auto self = caf::scoped_actor{sys};
  auto list = [&] {
    auto bosses = client.bosses(self);
    if (!bosses) {
      RAIDFEED_ERROR("failed to list bosses: {}", bosses.error());
      return false;
    }
    print_bosses(std::move(*bosses));
    return true;
  };
  while (finished.wait_for(list_interval) == std::future_status::timeout) {
    if (!list())
      break;
  }
  reader.join();
  auto status = client.drain(self);
  if (!status) {
    RAIDFEED_ERROR("failed to query the raid aggregator: {}", status.error());
    return EXIT_FAILURE;
  }
  RAIDFEED_INFO("saw {} raids of {} bosses, skipped {} unreadable lines",
                status->raids, status->bosses, status->read_errors);
  return list() ? EXIT_SUCCESS : EXIT_FAILURE;
}
