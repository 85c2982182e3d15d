//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include "raidfeed/raid.hpp"

#include <caf/expected.hpp>

#include <string_view>

namespace raidfeed {

/// Parses one line of the tab-separated sighting format that the `raidfeed`
/// executable reads. The fields are, in order: boss name, tweet id, user,
/// creation time in UNIX seconds, language, and optionally the boss image and
/// the tweet text. Empty optional fields mean absent values.
/// @returns The sighting, or an `ec::parse_error`.
auto parse_sighting(std::string_view line) -> caf::expected<raid_info>;

} // namespace raidfeed
