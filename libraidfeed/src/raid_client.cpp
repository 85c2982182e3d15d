//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/raid_client.hpp"

#include "raidfeed/error.hpp"
#include "raidfeed/logger.hpp"

#include <caf/anon_mail.hpp>
#include <caf/scoped_actor.hpp>

namespace raidfeed {

namespace {

auto closed_error() -> caf::error {
  return caf::make_error(ec::closed, "the raid aggregator is gone");
}

/// Maps the ways in which CAF reports a missing receiver to `ec::closed`.
auto normalize(caf::error err) -> caf::error {
  if (err == ec::closed || not is_closed(err))
    return err;
  return closed_error();
}

template <class T, class... Ts>
auto blocking_request(caf::scoped_actor& self,
                      const raid_aggregator_actor& handle, Ts&&... xs)
  -> caf::expected<T> {
  if (!handle)
    return closed_error();
  auto result = caf::expected<T>{caf::make_error(ec::unspecified)};
  self->mail(std::forward<Ts>(xs)...)
    .request(handle, caf::infinite)
    .receive(
      [&](T& x) {
        result = std::move(x);
      },
      [&](caf::error& err) {
        result = normalize(std::move(err));
      });
  return result;
}

} // namespace

raid_client::raid_client(raid_aggregator_actor handle)
  : handle_{std::move(handle)} {
}

void raid_client::push(raid_info info) const {
  if (!handle_) {
    RAIDFEED_WARN("dropping a sighting of {}: the raid aggregator is gone",
                  info.tweet.boss_name);
    return;
  }
  caf::anon_mail(atom::put_v, std::move(info)).send(handle_);
}

auto raid_client::bosses(caf::scoped_actor& self) const
  -> caf::expected<std::vector<raid_boss>> {
  return blocking_request<std::vector<raid_boss>>(self, handle_, atom::get_v,
                                                  atom::boss_v);
}

auto raid_client::backlog(caf::scoped_actor& self, std::string boss_name) const
  -> caf::expected<std::vector<raid_tweet_ptr>> {
  return blocking_request<std::vector<raid_tweet_ptr>>(
    self, handle_, atom::get_v, atom::backlog_v, std::move(boss_name));
}

auto raid_client::status(caf::scoped_actor& self) const
  -> caf::expected<raid_aggregator_status> {
  return blocking_request<raid_aggregator_status>(self, handle_,
                                                  atom::status_v);
}

auto raid_client::drain(caf::scoped_actor& self) const
  -> caf::expected<raid_aggregator_status> {
  return blocking_request<raid_aggregator_status>(self, handle_,
                                                  atom::drain_v);
}

} // namespace raidfeed
