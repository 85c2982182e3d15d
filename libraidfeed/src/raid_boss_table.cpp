//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/raid_boss_table.hpp"

#include "raidfeed/defaults.hpp"
#include "raidfeed/detail/assert.hpp"
#include "raidfeed/logger.hpp"

namespace raidfeed {

raid_boss_table::raid_boss_table(size_t history_size)
  : history_size_{history_size} {
}

const raid_boss_entry& raid_boss_table::handle(raid_info info) {
  auto created_at = info.tweet.created_at;
  auto lang = info.tweet.lang;
  auto tweet = make_raid_tweet_ptr(std::move(info.tweet));
  if (auto it = entries_.find(tweet->boss_name); it != entries_.end()) {
    auto& entry = it->second;
    entry.last_seen = created_at;
    entry.backlog.push(std::move(tweet));
    if (!entry.boss.image && info.image) {
      RAIDFEED_DEBUG("attaching image {} to boss {}", *info.image,
                     entry.boss.name);
      entry.boss.image = std::move(info.image);
    }
    return entry;
  }
  auto name = tweet->boss_name;
  auto level = parse_level(name).value_or(defaults::raid::level);
  RAIDFEED_VERBOSE("discovered boss {} at level {}", name, level);
  auto entry = raid_boss_entry{
    .boss = {
      .name = name,
      .level = level,
      .image = std::move(info.image),
      .lang = lang,
    },
    .last_seen = created_at,
    .backlog = detail::ring_buffer<raid_tweet_ptr>{history_size_},
  };
  entry.backlog.push(std::move(tweet));
  auto [it, inserted] = entries_.emplace(std::move(name), std::move(entry));
  RAIDFEED_ASSERT(inserted);
  return it->second;
}

std::vector<raid_boss> raid_boss_table::bosses() const {
  auto result = std::vector<raid_boss>{};
  result.reserve(entries_.size());
  for (const auto& [_, entry] : entries_)
    result.push_back(entry.boss);
  return result;
}

std::vector<raid_tweet_ptr>
raid_boss_table::backlog(std::string_view boss_name) const {
  if (const auto* entry = find(boss_name))
    return entry->backlog.snapshot();
  return {};
}

const raid_boss_entry* raid_boss_table::find(std::string_view boss_name) const {
  auto it = entries_.find(std::string{boss_name});
  if (it == entries_.end())
    return nullptr;
  return &it->second;
}

size_t raid_boss_table::size() const noexcept {
  return entries_.size();
}

size_t raid_boss_table::history_size() const noexcept {
  return history_size_;
}

} // namespace raidfeed
