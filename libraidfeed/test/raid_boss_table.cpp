//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/raid_boss_table.hpp"

#include "raidfeed/test/fixtures/actor_system.hpp"
#include "raidfeed/test/test.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace raidfeed;
using fixtures::make_sighting;

namespace {

auto tweet_ids(const std::vector<raid_tweet_ptr>& xs) {
  auto result = std::vector<uint64_t>{};
  for (const auto& x : xs)
    result.push_back(x->tweet_id);
  std::sort(result.begin(), result.end());
  return result;
}

} // namespace

TEST("the first sighting creates a boss") {
  auto table = raid_boss_table{5};
  CHECK_EQUAL(table.size(), 0u);
  const auto& entry = table.handle(
    make_sighting("Lv60 Ozorotter", 1, 100, "ozorotter.png"));
  CHECK_EQUAL(entry.boss.name, "Lv60 Ozorotter");
  CHECK_EQUAL(entry.boss.level, boss_level{60});
  CHECK_EQUAL(entry.boss.image, std::optional<std::string>{"ozorotter.png"});
  CHECK_EQUAL(entry.boss.lang, language::english);
  CHECK_EQUAL(entry.last_seen, time{std::chrono::seconds{100}});
  CHECK_EQUAL(entry.backlog.size(), 1u);
  CHECK_EQUAL(table.size(), 1u);
}

TEST("bosses without a level in their name have level zero") {
  auto table = raid_boss_table{5};
  table.handle(make_sighting("Grand Order", 1, 100, std::nullopt,
                             language::japanese));
  const auto* entry = table.find("Grand Order");
  REQUIRE(entry != nullptr);
  CHECK_EQUAL(entry->boss.level, boss_level{0});
  CHECK_EQUAL(entry->boss.lang, language::japanese);
  CHECK(!entry->boss.image);
}

TEST("later sightings update the existing boss") {
  auto table = raid_boss_table{5};
  table.handle(make_sighting("Lv60 Ozorotter", 1, 100));
  table.handle(make_sighting("Lv60 Ozorotter", 2, 130));
  table.handle(make_sighting("Lv60 Ozorotter", 3, 160));
  REQUIRE_EQUAL(table.size(), 1u);
  const auto* entry = table.find("Lv60 Ozorotter");
  REQUIRE(entry != nullptr);
  CHECK_EQUAL(entry->last_seen, time{std::chrono::seconds{160}});
  CHECK_EQUAL(tweet_ids(table.backlog("Lv60 Ozorotter")),
              (std::vector<uint64_t>{1, 2, 3}));
}

TEST("repeated sightings are applied again") {
  auto table = raid_boss_table{5};
  auto sighting = make_sighting("Lv60 Ozorotter", 1, 100);
  table.handle(sighting);
  sighting.tweet.created_at = time{std::chrono::seconds{150}};
  table.handle(sighting);
  CHECK_EQUAL(table.size(), 1u);
  CHECK_EQUAL(tweet_ids(table.backlog("Lv60 Ozorotter")),
              (std::vector<uint64_t>{1, 1}));
  CHECK_EQUAL(table.find("Lv60 Ozorotter")->last_seen,
              time{std::chrono::seconds{150}});
}

TEST("the first image of a boss sticks") {
  auto table = raid_boss_table{5};
  table.handle(make_sighting("Lv75 Celeste Omega", 1, 100));
  CHECK(!table.find("Lv75 Celeste Omega")->boss.image);
  table.handle(make_sighting("Lv75 Celeste Omega", 2, 110, "first.png"));
  CHECK_EQUAL(table.find("Lv75 Celeste Omega")->boss.image,
              std::optional<std::string>{"first.png"});
  table.handle(make_sighting("Lv75 Celeste Omega", 3, 120, "second.png"));
  table.handle(make_sighting("Lv75 Celeste Omega", 4, 130));
  CHECK_EQUAL(table.find("Lv75 Celeste Omega")->boss.image,
              std::optional<std::string>{"first.png"});
}

TEST("the backlog keeps the most recent sightings") {
  auto table = raid_boss_table{2};
  table.handle(make_sighting("X", 1, 100));
  table.handle(make_sighting("X", 2, 101));
  table.handle(make_sighting("X", 3, 102));
  CHECK_EQUAL(tweet_ids(table.backlog("X")), (std::vector<uint64_t>{2, 3}));
}

TEST("a history size of zero keeps no sightings") {
  auto table = raid_boss_table{0};
  table.handle(make_sighting("X", 1, 100, "x.png"));
  CHECK_EQUAL(table.size(), 1u);
  CHECK(table.backlog("X").empty());
  CHECK_EQUAL(table.find("X")->boss.image, std::optional<std::string>{"x.png"});
}

TEST("unknown bosses have an empty backlog") {
  auto table = raid_boss_table{5};
  table.handle(make_sighting("X", 1, 100));
  CHECK(table.backlog("Y").empty());
  CHECK(table.find("Y") == nullptr);
}

TEST("one entry per distinct boss") {
  auto table = raid_boss_table{3};
  auto names = std::vector<std::string>{"Lv60 Ozorotter", "Lvl 100 Tiamat",
                                        "Grand Order", "Lv75 Celeste Omega"};
  auto id = uint64_t{0};
  for (auto round = 0; round < 4; ++round)
    for (const auto& name : names) {
      ++id;
      table.handle(make_sighting(name, id, static_cast<int64_t>(id)));
    }
  CHECK_EQUAL(table.size(), names.size());
  auto bosses = table.bosses();
  auto seen = std::vector<std::string>{};
  for (const auto& boss : bosses)
    seen.push_back(boss.name);
  std::sort(seen.begin(), seen.end());
  std::sort(names.begin(), names.end());
  CHECK_EQUAL(seen, names);
  for (const auto& name : names)
    CHECK_EQUAL(table.backlog(name).size(), 3u);
}
