//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/detail/add_message_types.hpp"

#include "raidfeed/actors.hpp"
#include "raidfeed/atoms.hpp"
#include "raidfeed/error.hpp"
#include "raidfeed/raid.hpp"
#include "raidfeed/raid_aggregator.hpp"

#include <caf/init_global_meta_objects.hpp>

#include <mutex>

namespace raidfeed::detail {

void add_message_types() {
  static auto once = std::once_flag{};
  std::call_once(once, [] {
    caf::core::init_global_meta_objects();
    caf::init_global_meta_objects<caf::id_block::raidfeed_types>();
    caf::init_global_meta_objects<caf::id_block::raidfeed_atoms>();
    caf::init_global_meta_objects<caf::id_block::raidfeed_actors>();
  });
}

} // namespace raidfeed::detail
