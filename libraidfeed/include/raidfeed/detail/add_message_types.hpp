//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace raidfeed::detail {

/// Registers the meta objects of all raidfeed message types with CAF. Safe to
/// call more than once.
void add_message_types();

} // namespace raidfeed::detail
