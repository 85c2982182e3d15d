//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/config.hpp" // IWYU pragma: export

#include <caf/allowed_unsafe_message_type.hpp>
#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/timespan.hpp>
#include <caf/timestamp.hpp>
#include <caf/type_id.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#define RAIDFEED_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(raidfeed_types, type)

namespace raidfeed {

// -- aliases ------------------------------------------------------------------

using duration = caf::timespan;
using time = caf::timestamp;

/// The numeric level of a raid boss.
using boss_level = uint32_t;

// -- enums --------------------------------------------------------------------

enum class ec : uint8_t;
enum class language : uint8_t;

// -- classes ------------------------------------------------------------------

class configuration;
class raid_aggregator;
class raid_boss_table;
class raid_client;

// -- structs ------------------------------------------------------------------

struct raid_aggregator_status;
struct raid_boss;
struct raid_boss_entry;
struct raid_info;
struct raid_tweet;

// -- smart pointers -----------------------------------------------------------

/// A sighting shared between the backlogs and all query results.
using raid_tweet_ptr = std::shared_ptr<const raid_tweet>;

namespace detail {

template <class T>
class ring_buffer;

void add_message_types();

} // namespace detail

} // namespace raidfeed

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_raidfeed_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(raidfeed_types, first_raidfeed_type_id)

  RAIDFEED_ADD_TYPE_ID((raidfeed::ec))
  RAIDFEED_ADD_TYPE_ID((raidfeed::language))
  RAIDFEED_ADD_TYPE_ID((raidfeed::raid_aggregator_status))
  RAIDFEED_ADD_TYPE_ID((raidfeed::raid_boss))
  RAIDFEED_ADD_TYPE_ID((raidfeed::raid_info))
  RAIDFEED_ADD_TYPE_ID((raidfeed::raid_tweet))
  RAIDFEED_ADD_TYPE_ID((raidfeed::raid_tweet_ptr))

  RAIDFEED_ADD_TYPE_ID((std::vector<raidfeed::raid_boss>))
  RAIDFEED_ADD_TYPE_ID((std::vector<raidfeed::raid_tweet_ptr>))

CAF_END_TYPE_ID_BLOCK(raidfeed_types)

// Sightings travel by reference between actors of the same process. There is
// no meaningful `inspect()` for a shared pointer, so we promise CAF that these
// never leave the process.
CAF_ALLOW_UNSAFE_MESSAGE_TYPE(raidfeed::raid_tweet_ptr)
CAF_ALLOW_UNSAFE_MESSAGE_TYPE(std::vector<raidfeed::raid_tweet_ptr>)

#undef RAIDFEED_ADD_TYPE_ID
