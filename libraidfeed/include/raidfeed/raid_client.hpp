//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include "raidfeed/actors.hpp"
#include "raidfeed/raid.hpp"
#include "raidfeed/raid_aggregator.hpp"

#include <caf/expected.hpp>
#include <caf/fwd.hpp>
#include <caf/timespan.hpp>

#include <string>
#include <vector>

namespace raidfeed {

/// The front door to an aggregator. Copies are cheap and all of them talk to
/// the same mailbox, so any number of threads and actors may submit sightings
/// and queries concurrently.
///
/// Every query yields exactly one reply. If the aggregator is gone, the reply
/// is an error that satisfies `is_closed`; the blocking functions normalize it
/// to `ec::closed`.
class raid_client {
public:
  raid_client() = default;

  explicit raid_client(raid_aggregator_actor handle);

  /// Enqueues a sighting. Never blocks.
  void push(raid_info info) const;

  // -- asynchronous queries ---------------------------------------------------

  /// Requests the list of known bosses on behalf of an actor. Attach handlers
  /// with `.then(...)` or `.await(...)`; dropping the returned handle discards
  /// the reply.
  template <class Self>
  auto bosses(Self* self) const {
    return self->mail(atom::get_v, atom::boss_v)
      .request(handle_, caf::infinite);
  }

  /// Requests the recent sightings of a boss on behalf of an actor.
  template <class Self>
  auto backlog(Self* self, std::string boss_name) const {
    return self->mail(atom::get_v, atom::backlog_v, std::move(boss_name))
      .request(handle_, caf::infinite);
  }

  // -- blocking queries -------------------------------------------------------

  /// @returns All known bosses in no particular order.
  auto bosses(caf::scoped_actor& self) const
    -> caf::expected<std::vector<raid_boss>>;

  /// @returns The recent sightings of `boss_name`, or an empty list if the
  /// aggregator never saw that boss.
  auto backlog(caf::scoped_actor& self, std::string boss_name) const
    -> caf::expected<std::vector<raid_tweet_ptr>>;

  auto status(caf::scoped_actor& self) const
    -> caf::expected<raid_aggregator_status>;

  /// Blocks until the aggregator consumed its whole raid source.
  /// @returns The counters at that point.
  auto drain(caf::scoped_actor& self) const
    -> caf::expected<raid_aggregator_status>;

  // -- properties -------------------------------------------------------------

  const raid_aggregator_actor& handle() const noexcept {
    return handle_;
  }

  explicit operator bool() const noexcept {
    return static_cast<bool>(handle_);
  }

private:
  raid_aggregator_actor handle_ = {};
};

} // namespace raidfeed
