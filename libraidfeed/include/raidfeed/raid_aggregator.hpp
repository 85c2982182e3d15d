//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include "raidfeed/actors.hpp"
#include "raidfeed/defaults.hpp"
#include "raidfeed/raid.hpp"
#include "raidfeed/raid_boss_table.hpp"

#include <caf/async/spsc_buffer.hpp>
#include <caf/expected.hpp>
#include <caf/typed_response_promise.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace raidfeed {

/// The upstream end of an aggregator. Errors in the stream are read failures
/// that the aggregator skips.
using raid_source = caf::async::consumer_resource<caf::expected<raid_info>>;

/// The producer end matching a `raid_source`.
using raid_sink = caf::async::producer_resource<caf::expected<raid_info>>;

/// Counters that describe the state of an aggregator.
struct raid_aggregator_status {
  size_t bosses = 0;
  uint64_t raids = 0;
  uint64_t read_errors = 0;
  size_t history_size = 0;
  bool source_exhausted = false;

  friend auto
  operator==(const raid_aggregator_status&, const raid_aggregator_status&)
    -> bool
    = default;

  template <class Inspector>
  friend auto inspect(Inspector& f, raid_aggregator_status& x) {
    return f.object(x)
      .pretty_name("raidfeed.raid_aggregator_status")
      .fields(f.field("bosses", x.bosses), f.field("raids", x.raids),
              f.field("read_errors", x.read_errors),
              f.field("history_size", x.history_size),
              f.field("source_exhausted", x.source_exhausted));
  }
};

/// The state of the RAID AGGREGATOR actor. It owns the boss table and is the
/// only place that ever modifies it.
///
/// Sightings arrive either from the raid source or through the mailbox. Both
/// inputs run on the actor's execution context, so every event is fully
/// applied before the next one starts.
///
/// The aggregator terminates once its raid source is done and no handle to it
/// remains, or when it receives an exit message.
class raid_aggregator {
public:
  [[maybe_unused]] static constexpr auto name = "raidfeed.raid-aggregator";

  raid_aggregator(raid_aggregator_actor::pointer self, raid_source source,
                  size_t history_size);

  auto make_behavior() -> raid_aggregator_actor::behavior_type;

private:
  void handle(raid_info info);

  void handle_read_error(const caf::error& err);

  auto status() const -> raid_aggregator_status;

  /// Marks the raid source as done and answers all pending drain requests.
  void finish_source();

  raid_aggregator_actor::pointer self_ = {};
  raid_source source_ = {};
  raid_boss_table table_;
  uint64_t raids_ = 0;
  uint64_t read_errors_ = 0;
  bool source_exhausted_ = false;
  std::vector<caf::typed_response_promise<raid_aggregator_status>>
    drain_requests_ = {};
};

/// Spawns an aggregator that drains `source`.
/// @param sys The actor system whose scheduler drives the aggregator.
/// @param source The stream of sightings.
/// @param history_size The number of recent sightings to keep per boss.
auto spawn_raid_aggregator(caf::actor_system& sys, raid_source source,
                           size_t history_size
                           = defaults::aggregator::history_size)
  -> raid_aggregator_actor;

} // namespace raidfeed
