//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include "raidfeed/detail/ring_buffer.hpp"
#include "raidfeed/raid.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace raidfeed {

/// Everything known about one boss.
struct raid_boss_entry {
  raid_boss boss;
  time last_seen;
  detail::ring_buffer<raid_tweet_ptr> backlog;
};

/// Maps boss names to their entries. Entries are created on the first sighting
/// of a boss and live as long as the table.
class raid_boss_table {
public:
  /// Constructs an empty table.
  /// @param history_size The backlog capacity of every boss.
  explicit raid_boss_table(size_t history_size);

  /// Applies a sighting to the entry of its boss, creating the entry if
  /// necessary. Once a boss has an image, later sightings never replace it.
  /// @returns The updated entry.
  const raid_boss_entry& handle(raid_info info);

  /// @returns A copy of every known boss, in no particular order.
  std::vector<raid_boss> bosses() const;

  /// @returns The recent sightings of a boss in no particular order, or an
  /// empty list if the boss is unknown.
  std::vector<raid_tweet_ptr> backlog(std::string_view boss_name) const;

  /// @returns The entry for `boss_name`, or `nullptr` if the boss is unknown.
  const raid_boss_entry* find(std::string_view boss_name) const;

  size_t size() const noexcept;

  size_t history_size() const noexcept;

private:
  size_t history_size_;
  std::unordered_map<std::string, raid_boss_entry> entries_;
};

} // namespace raidfeed
