//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/raid.hpp"

#include <charconv>
#include <iterator>
#include <memory>

namespace raidfeed {

namespace {

constexpr std::string_view language_names[] = {
  "english",
  "japanese",
};

} // namespace

auto to_string(language x) -> std::string {
  return std::string{language_names[static_cast<size_t>(x)]};
}

auto from_string(std::string_view str, language& x) -> bool {
  for (size_t i = 0; i < std::size(language_names); ++i) {
    if (str == language_names[i]) {
      x = static_cast<language>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<language> value, language& x)
  -> bool {
  if (value >= std::size(language_names))
    return false;
  x = static_cast<language>(value);
  return true;
}

auto parse_level(std::string_view boss_name) -> std::optional<boss_level> {
  if (boss_name.starts_with("Lvl"))
    boss_name.remove_prefix(3);
  else if (boss_name.starts_with("Lv"))
    boss_name.remove_prefix(2);
  else
    return std::nullopt;
  while (boss_name.starts_with(' '))
    boss_name.remove_prefix(1);
  auto result = boss_level{0};
  const auto* first = boss_name.data();
  const auto* last = first + boss_name.size();
  auto [ptr, err] = std::from_chars(first, last, result);
  if (err != std::errc{})
    return std::nullopt;
  // The number must be a word of its own, as in `Lv60 ...`.
  if (ptr != last && *ptr != ' ')
    return std::nullopt;
  return result;
}

auto make_raid_tweet_ptr(raid_tweet tweet) -> raid_tweet_ptr {
  return std::make_shared<const raid_tweet>(std::move(tweet));
}

} // namespace raidfeed
