//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/sighting_format.hpp"

#include "raidfeed/error.hpp"
#include "raidfeed/test/test.hpp"

#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <string>

using namespace raidfeed;

TEST("sighting lines with all fields") {
  auto x = unbox(parse_sighting("Lv60 Ozorotter\t42\tgran\t1500000000\tenglish"
                                "\tozorotter.png\tI need backup!"));
  CHECK_EQUAL(x.tweet.boss_name, "Lv60 Ozorotter");
  CHECK_EQUAL(x.tweet.tweet_id, 42u);
  CHECK_EQUAL(x.tweet.user, "gran");
  CHECK_EQUAL(x.tweet.created_at,
              time{std::chrono::seconds{1'500'000'000}});
  CHECK_EQUAL(x.tweet.lang, language::english);
  CHECK_EQUAL(x.image, std::optional<std::string>{"ozorotter.png"});
  CHECK_EQUAL(x.tweet.text, std::optional<std::string>{"I need backup!"});
}

TEST("sighting lines without optional fields") {
  auto x = unbox(parse_sighting("Grand Order\t7\tdjeeta\t0\tjapanese"));
  CHECK_EQUAL(x.tweet.lang, language::japanese);
  CHECK(!x.image);
  CHECK(!x.tweet.text);
  auto y = unbox(parse_sighting("Grand Order\t8\tdjeeta\t0\tjapanese\t\tok"));
  CHECK(!y.image);
  CHECK_EQUAL(y.tweet.text, std::optional<std::string>{"ok"});
}

TEST("malformed sighting lines") {
  for (auto line : {
         "Lv60 Ozorotter\t42\tgran\t1500000000",
         "\t42\tgran\t1500000000\tenglish",
         "Lv60 Ozorotter\tx42\tgran\t1500000000\tenglish",
         "Lv60 Ozorotter\t42\tgran\tnoon\tenglish",
         "Lv60 Ozorotter\t42\tgran\t1500000000\tklingon",
         "a\t1\tb\t2\tenglish\tc\td\te",
       }) {
    auto x = parse_sighting(line);
    REQUIRE(!x);
    CHECK_EQUAL(x.error(), ec::parse_error);
  }
}

TEST("sighting timestamps beyond the representable range") {
  auto limit = std::chrono::duration_cast<std::chrono::seconds>(
                 duration::max())
                 .count();
  auto last = fmt::format("X\t1\tu\t{}\tenglish", limit);
  CHECK(parse_sighting(last).has_value());
  for (auto seconds : {limit + 1, -limit - 1, int64_t{9'300'000'000}}) {
    auto x = parse_sighting(fmt::format("X\t1\tu\t{}\tenglish", seconds));
    REQUIRE(!x);
    CHECK_EQUAL(x.error(), ec::parse_error);
  }
}
