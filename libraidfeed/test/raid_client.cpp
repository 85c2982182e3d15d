//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/raid_client.hpp"

#include "raidfeed/error.hpp"
#include "raidfeed/raid_aggregator.hpp"
#include "raidfeed/test/fixtures/actor_system.hpp"
#include "raidfeed/test/test.hpp"

#include <caf/after.hpp>
#include <caf/async/blocking_producer.hpp>
#include <caf/async/spsc_buffer.hpp>
#include <caf/exit_reason.hpp>
#include <caf/scoped_actor.hpp>

#include <chrono>
#include <thread>

using namespace raidfeed;
using fixtures::make_sighting;

WITH_FIXTURE(fixtures::actor_system) {

TEST("a default-constructed client is closed") {
  auto client = raid_client{};
  CHECK(!client);
  client.push(make_sighting("Lv60 Ozorotter", 1, 1));
  auto bosses = client.bosses(self);
  REQUIRE(!bosses);
  CHECK_EQUAL(bosses.error(), ec::closed);
  auto status = client.status(self);
  REQUIRE(!status);
  CHECK_EQUAL(status.error(), ec::closed);
}

TEST("copies of a client share the aggregator") {
  auto client = raid_client{spawn_raid_aggregator(sys, {}, 5)};
  auto copy = client;
  REQUIRE(copy);
  CHECK(copy.handle() == client.handle());
  copy.push(make_sighting("Lv60 Ozorotter", 1, 1));
  client.push(make_sighting("Lv60 Ozorotter", 2, 2));
  CHECK_EQUAL(unbox(client.backlog(self, "Lv60 Ozorotter")).size(), 2u);
  CHECK_EQUAL(unbox(copy.status(self)).raids, 2u);
}

TEST("asynchronous queries") {
  auto client = raid_client{spawn_raid_aggregator(sys, {}, 5)};
  client.push(make_sighting("Lvl 100 Tiamat", 1, 1, "tiamat.png"));
  auto bosses = std::vector<raid_boss>{};
  client.bosses(self.ptr())
    .receive(
      [&](std::vector<raid_boss>& xs) {
        bosses = std::move(xs);
      },
      [&](caf::error& err) {
        FAIL("unexpected error: {}", err);
      });
  REQUIRE_EQUAL(bosses.size(), 1u);
  CHECK_EQUAL(bosses[0].name, "Lvl 100 Tiamat");
  CHECK_EQUAL(bosses[0].image, std::optional<std::string>{"tiamat.png"});
  auto backlog = std::vector<raid_tweet_ptr>{};
  client.backlog(self.ptr(), "Lvl 100 Tiamat")
    .receive(
      [&](std::vector<raid_tweet_ptr>& xs) {
        backlog = std::move(xs);
      },
      [&](caf::error& err) {
        FAIL("unexpected error: {}", err);
      });
  REQUIRE_EQUAL(backlog.size(), 1u);
  CHECK_EQUAL(backlog[0]->tweet_id, 1u);
}

TEST("backlog queries share the stored sightings") {
  auto client = raid_client{spawn_raid_aggregator(sys, {}, 5)};
  client.push(make_sighting("Lv60 Ozorotter", 1, 1, std::nullopt,
                            language::japanese));
  auto first = unbox(client.backlog(self, "Lv60 Ozorotter"));
  auto second = unbox(client.backlog(self, "Lv60 Ozorotter"));
  REQUIRE_EQUAL(first.size(), 1u);
  REQUIRE_EQUAL(second.size(), 1u);
  CHECK(first[0].get() == second[0].get());
  // The table and both replies refer to the same record.
  CHECK(first[0].use_count() > 2);
}

TEST("dropping a pending reply does not cancel the request") {
  auto client = raid_client{spawn_raid_aggregator(sys, {}, 5)};
  {
    auto other = caf::scoped_actor{sys};
    [[maybe_unused]] auto pending = client.bosses(other.ptr());
  }
  client.push(make_sighting("Lvl 100 Tiamat", 1, 1));
  auto status = unbox(client.status(self));
  CHECK_EQUAL(status.raids, 1u);
  CHECK_EQUAL(status.bosses, 1u);
}

TEST("queries fail after the aggregator exits") {
  auto client = raid_client{spawn_raid_aggregator(sys, {}, 5)};
  client.push(make_sighting("Lv60 Ozorotter", 1, 1));
  REQUIRE_EQUAL(unbox(client.status(self)).raids, 1u);
  self->send_exit(client.handle(), caf::exit_reason::user_shutdown);
  self->wait_for(client.handle());
  auto bosses = client.bosses(self);
  REQUIRE(!bosses);
  CHECK_EQUAL(bosses.error(), ec::closed);
  auto backlog = client.backlog(self, "Lv60 Ozorotter");
  REQUIRE(!backlog);
  CHECK_EQUAL(backlog.error(), ec::closed);
  // Pushing into a terminated aggregator drops the sighting silently.
  client.push(make_sighting("Lv60 Ozorotter", 2, 2));
}

TEST("the aggregator terminates once its source is done and unreferenced") {
  auto [source, sink]
    = caf::async::make_spsc_buffer_resource<caf::expected<raid_info>>();
  auto producer = caf::async::make_blocking_producer(std::move(sink));
  REQUIRE(producer.has_value());
  {
    auto client
      = raid_client{spawn_raid_aggregator(sys, std::move(source), 5)};
    self->monitor(client.handle());
    auto item = caf::expected<raid_info>{make_sighting("X", 1, 1)};
    CHECK(producer->push(item));
    // Wait until the sighting went through before dropping the last handle.
    for (auto i = 0; i < 1000; ++i) {
      if (unbox(client.status(self)).raids == 1)
        break;
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
  }
  producer->close();
  auto terminated = false;
  self->receive(
    [&](const caf::down_msg&) {
      terminated = true;
    },
    caf::after(std::chrono::seconds{10}) >> [&] {
      FAIL("the aggregator did not terminate");
    });
  CHECK(terminated);
}

} // WITH_FIXTURE(fixtures::actor_system)
