//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include <caf/default_enum_inspect.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace raidfeed {

/// The language a raid was announced in.
enum class language : uint8_t {
  english,
  japanese,
};

/// @relates language
auto to_string(language x) -> std::string;

/// @relates language
auto from_string(std::string_view str, language& x) -> bool;

/// @relates language
auto from_integer(std::underlying_type_t<language> value, language& x) -> bool;

template <class Inspector>
auto inspect(Inspector& f, language& x) {
  return caf::default_enum_inspect(f, x);
}

/// A single raid sighting as it appeared in the upstream feed.
struct raid_tweet {
  uint64_t tweet_id = 0;
  std::string user;
  std::optional<std::string> user_image = {};
  std::string boss_name;
  std::optional<std::string> text = {};
  time created_at = {};
  language lang = language::english;

  friend auto operator==(const raid_tweet&, const raid_tweet&) -> bool
    = default;

  template <class Inspector>
  friend auto inspect(Inspector& f, raid_tweet& x) {
    return f.object(x)
      .pretty_name("raidfeed.raid_tweet")
      .fields(f.field("tweet_id", x.tweet_id), f.field("user", x.user),
              f.field("user_image", x.user_image),
              f.field("boss_name", x.boss_name), f.field("text", x.text),
              f.field("created_at", x.created_at),
              f.field("language", x.lang));
  }
};

/// A sighting together with the boss image that the parser extracted from it.
struct raid_info {
  raid_tweet tweet;
  std::optional<std::string> image = {};

  friend auto operator==(const raid_info&, const raid_info&) -> bool = default;

  template <class Inspector>
  friend auto inspect(Inspector& f, raid_info& x) {
    return f.object(x)
      .pretty_name("raidfeed.raid_info")
      .fields(f.field("tweet", x.tweet), f.field("image", x.image));
  }
};

/// The metadata of a raid boss, derived from its sightings.
struct raid_boss {
  std::string name;
  boss_level level = 0;
  std::optional<std::string> image = {};
  language lang = language::english;

  friend auto operator==(const raid_boss&, const raid_boss&) -> bool = default;

  template <class Inspector>
  friend auto inspect(Inspector& f, raid_boss& x) {
    return f.object(x)
      .pretty_name("raidfeed.raid_boss")
      .fields(f.field("name", x.name), f.field("level", x.level),
              f.field("image", x.image), f.field("language", x.lang));
  }
};

/// Extracts the level from a boss name such as `Lv60 Ozorotter` or
/// `Lvl 100 Grand Order`.
/// @returns The level, or `std::nullopt` if the name does not start with one.
auto parse_level(std::string_view boss_name) -> std::optional<boss_level>;

/// Wraps a sighting for sharing between backlogs and query results.
auto make_raid_tweet_ptr(raid_tweet tweet) -> raid_tweet_ptr;

} // namespace raidfeed

template <>
struct fmt::formatter<raidfeed::language> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(raidfeed::language x, FormatContext& ctx) const {
    auto str = to_string(x);
    return fmt::formatter<std::string_view>::format(str, ctx);
  }
};

template <>
struct fmt::formatter<raidfeed::raid_boss> {
  template <class ParseContext>
  constexpr auto parse(ParseContext& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const raidfeed::raid_boss& x, FormatContext& ctx) const {
    auto out = fmt::format_to(ctx.out(), "{:<3} | {} ({})", x.level, x.name,
                              x.lang);
    if (x.image)
      out = fmt::format_to(out, " {}", *x.image);
    return out;
  }
};
