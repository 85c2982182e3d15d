//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include "raidfeed/atoms.hpp"

#include <caf/result.hpp>
#include <caf/type_list.hpp>
#include <caf/typed_actor.hpp>

#include <string>
#include <vector>

#define RAIDFEED_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(raidfeed_actors, type)

namespace raidfeed {

struct raid_aggregator_actor_traits {
  using signatures = caf::type_list<
    // Applies a sighting to the boss table.
    auto(atom::put, raid_info)->caf::result<void>,
    // Lists all known bosses.
    auto(atom::get, atom::boss)->caf::result<std::vector<raid_boss>>,
    // Returns the recent sightings of a boss.
    auto(atom::get, atom::backlog, std::string)
      ->caf::result<std::vector<raid_tweet_ptr>>,
    // Reports the counters of the aggregator.
    auto(atom::status)->caf::result<raid_aggregator_status>,
    // Reports the counters once the raid source is exhausted.
    auto(atom::drain)->caf::result<raid_aggregator_status>>;
};

/// The RAID AGGREGATOR actor interface.
using raid_aggregator_actor = caf::typed_actor<raid_aggregator_actor_traits>;

} // namespace raidfeed

// -- type announcements -------------------------------------------------------

CAF_BEGIN_TYPE_ID_BLOCK(raidfeed_actors, caf::id_block::raidfeed_atoms::end)

  RAIDFEED_ADD_TYPE_ID((raidfeed::raid_aggregator_actor))

CAF_END_TYPE_ID_BLOCK(raidfeed_actors)

#undef RAIDFEED_ADD_TYPE_ID
