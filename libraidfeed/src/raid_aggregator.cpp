//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/raid_aggregator.hpp"

#include "raidfeed/logger.hpp"

#include <caf/actor_from_state.hpp>
#include <caf/actor_system.hpp>
#include <caf/scheduled_actor/flow.hpp>
#include <caf/typed_event_based_actor.hpp>

namespace raidfeed {

raid_aggregator::raid_aggregator(raid_aggregator_actor::pointer self,
                                 raid_source source, size_t history_size)
  : self_{self}, source_{std::move(source)}, table_{history_size} {
}

auto raid_aggregator::make_behavior() -> raid_aggregator_actor::behavior_type {
  RAIDFEED_DEBUG("{} starts with a history size of {}", name,
                 table_.history_size());
  if (source_) {
    self_->make_observable()
      .from_resource(std::move(source_))
      .do_on_error([this](const caf::error& err) {
        RAIDFEED_WARN("{} lost its raid source: {}", name, err);
        finish_source();
      })
      .do_on_complete([this] {
        RAIDFEED_VERBOSE("{} reached the end of its raid source", name);
        finish_source();
      })
      .for_each([this](const caf::expected<raid_info>& item) {
        if (!item) {
          handle_read_error(item.error());
          return;
        }
        handle(*item);
      });
  } else {
    source_exhausted_ = true;
  }
  self_->attach_functor([](const caf::error& reason) {
    RAIDFEED_DEBUG("{} terminates: {}", name, reason);
  });
  return {
    [this](atom::put, raid_info info) -> caf::result<void> {
      handle(std::move(info));
      return {};
    },
    [this](atom::get, atom::boss) -> caf::result<std::vector<raid_boss>> {
      return table_.bosses();
    },
    [this](atom::get, atom::backlog, const std::string& boss_name)
      -> caf::result<std::vector<raid_tweet_ptr>> {
      return table_.backlog(boss_name);
    },
    [this](atom::status) -> caf::result<raid_aggregator_status> {
      return status();
    },
    [this](atom::drain) -> caf::result<raid_aggregator_status> {
      if (source_exhausted_)
        return status();
      auto rp = self_->make_response_promise<raid_aggregator_status>();
      drain_requests_.push_back(rp);
      return rp;
    },
  };
}

void raid_aggregator::handle(raid_info info) {
  RAIDFEED_TRACE("{} got a sighting of {}", name, info.tweet.boss_name);
  table_.handle(std::move(info));
  ++raids_;
}

void raid_aggregator::handle_read_error(const caf::error& err) {
  // A single bad read must not take down the aggregator.
  RAIDFEED_WARN("{} skips an unreadable sighting: {}", name, err);
  ++read_errors_;
}

auto raid_aggregator::status() const -> raid_aggregator_status {
  return {
    .bosses = table_.size(),
    .raids = raids_,
    .read_errors = read_errors_,
    .history_size = table_.history_size(),
    .source_exhausted = source_exhausted_,
  };
}

void raid_aggregator::finish_source() {
  source_exhausted_ = true;
  for (auto& rp : drain_requests_)
    rp.deliver(status());
  drain_requests_.clear();
}

auto spawn_raid_aggregator(caf::actor_system& sys, raid_source source,
                           size_t history_size) -> raid_aggregator_actor {
  return sys.spawn(caf::actor_from_state<raid_aggregator>, std::move(source),
                   history_size);
}

} // namespace raidfeed
