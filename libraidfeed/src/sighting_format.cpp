//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/sighting_format.hpp"

#include "raidfeed/error.hpp"

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace raidfeed {

namespace {

auto split(std::string_view str, char sep) -> std::vector<std::string_view> {
  auto result = std::vector<std::string_view>{};
  auto begin = size_t{0};
  while (true) {
    auto end = str.find(sep, begin);
    if (end == std::string_view::npos) {
      result.push_back(str.substr(begin));
      return result;
    }
    result.push_back(str.substr(begin, end - begin));
    begin = end + 1;
  }
}

auto to_optional(std::string_view str) -> std::optional<std::string> {
  if (str.empty())
    return std::nullopt;
  return std::string{str};
}

template <class T>
auto to_number(std::string_view str, T& x) -> bool {
  const auto* last = str.data() + str.size();
  auto [ptr, err] = std::from_chars(str.data(), last, x);
  return err == std::errc{} && ptr == last;
}

/// Converts UNIX seconds into a timestamp, unless the result does not fit.
auto to_time(int64_t seconds) -> std::optional<time> {
  constexpr auto limit
    = std::chrono::duration_cast<std::chrono::seconds>(duration::max()).count();
  if (seconds > limit || seconds < -limit)
    return std::nullopt;
  return time{std::chrono::seconds{seconds}};
}

} // namespace

auto parse_sighting(std::string_view line) -> caf::expected<raid_info> {
  auto fields = split(line, '\t');
  if (fields.size() < 5 || fields.size() > 7)
    return caf::make_error(ec::parse_error,
                           fmt::format("expected 5 to 7 tab-separated fields, "
                                       "got {}",
                                       fields.size()));
  if (fields[0].empty())
    return caf::make_error(ec::parse_error, "empty boss name");
  auto tweet_id = uint64_t{0};
  if (!to_number(fields[1], tweet_id))
    return caf::make_error(ec::parse_error,
                           fmt::format("invalid tweet id '{}'", fields[1]));
  auto seconds = int64_t{0};
  if (!to_number(fields[3], seconds))
    return caf::make_error(ec::parse_error,
                           fmt::format("invalid timestamp '{}'", fields[3]));
  auto created_at = to_time(seconds);
  if (!created_at)
    return caf::make_error(ec::parse_error,
                           fmt::format("timestamp '{}' is out of range",
                                       fields[3]));
  auto lang = language{};
  if (!from_string(fields[4], lang))
    return caf::make_error(ec::parse_error,
                           fmt::format("invalid language '{}'", fields[4]));
  auto result = raid_info{
    .tweet = {
      .tweet_id = tweet_id,
      .user = std::string{fields[2]},
      .boss_name = std::string{fields[0]},
      .created_at = *created_at,
      .lang = lang,
    },
  };
  if (fields.size() > 5)
    result.image = to_optional(fields[5]);
  if (fields.size() > 6)
    result.tweet.text = to_optional(fields[6]);
  return result;
}

} // namespace raidfeed
