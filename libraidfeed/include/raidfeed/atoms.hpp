//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include <caf/type_id.hpp>

#define RAIDFEED_CAF_ATOM_ALIAS(name)                                          \
  using name = caf::name##_atom;                                               \
  [[maybe_unused]] constexpr inline auto name##_v = caf::name##_atom_v;

#define RAIDFEED_ADD_ATOM(name, text)                                          \
  CAF_ADD_ATOM(raidfeed_atoms, raidfeed::atom, name, text)

// -- raidfeed::atom -----------------------------------------------------------

namespace raidfeed::atom {

// Inherited from CAF.
RAIDFEED_CAF_ATOM_ALIAS(get)
RAIDFEED_CAF_ATOM_ALIAS(put)

} // namespace raidfeed::atom

CAF_BEGIN_TYPE_ID_BLOCK(raidfeed_atoms, caf::id_block::raidfeed_types::end)

  RAIDFEED_ADD_ATOM(backlog, "backlog")
  RAIDFEED_ADD_ATOM(boss, "boss")
  RAIDFEED_ADD_ATOM(drain, "drain")
  RAIDFEED_ADD_ATOM(status, "status")

CAF_END_TYPE_ID_BLOCK(raidfeed_atoms)

#undef RAIDFEED_CAF_ATOM_ALIAS
#undef RAIDFEED_ADD_ATOM
