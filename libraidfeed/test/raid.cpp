//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/raid.hpp"

#include "raidfeed/test/test.hpp"

#include <fmt/format.h>

using namespace raidfeed;

TEST("boss levels") {
  CHECK_EQUAL(parse_level("Lv60 Ozorotter"), boss_level{60});
  CHECK_EQUAL(parse_level("Lvl 100 Grand Order"), boss_level{100});
  CHECK_EQUAL(parse_level("Lv75 Celeste Omega"), boss_level{75});
  CHECK_EQUAL(parse_level("Lvl120 Nataku"), boss_level{120});
  CHECK_EQUAL(parse_level("Lv60"), boss_level{60});
}

TEST("boss names without a level") {
  CHECK(!parse_level("Grand Order"));
  CHECK(!parse_level(""));
  CHECK(!parse_level("Lv"));
  CHECK(!parse_level("Lvx Tiamat"));
  CHECK(!parse_level("Lv60Ozorotter"));
  CHECK(!parse_level("lv60 Ozorotter"));
}

TEST("language names") {
  CHECK_EQUAL(to_string(language::english), "english");
  CHECK_EQUAL(to_string(language::japanese), "japanese");
  auto x = language{};
  REQUIRE(from_string("japanese", x));
  CHECK_EQUAL(x, language::japanese);
  CHECK(!from_string("klingon", x));
  CHECK_EQUAL(x, language::japanese);
}

TEST("boss formatting") {
  auto boss = raid_boss{
    .name = "Lv60 Ozorotter",
    .level = 60,
    .lang = language::english,
  };
  CHECK_EQUAL(fmt::format("{}", boss), "60  | Lv60 Ozorotter (english)");
  boss.image = "ozorotter.png";
  CHECK_EQUAL(fmt::format("{}", boss),
              "60  | Lv60 Ozorotter (english) ozorotter.png");
}
