//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/panic.hpp"

#include <source_location>
#include <string>
#include <string_view>

namespace raidfeed::detail {

inline auto assertion_note() -> std::string {
  return {};
}

inline auto assertion_note(std::string_view note) -> std::string {
  return fmt::format(": {}", note);
}

} // namespace raidfeed::detail

/// Panics if `expr` does not hold. An optional second argument is appended to
/// the panic message.
#define RAIDFEED_ASSERT(expr, ...)                                             \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::raidfeed::panic_at(std::source_location::current(),                    \
                           "assertion `{}` failed{}", #expr,                   \
                           ::raidfeed::detail::assertion_note(__VA_ARGS__));   \
    }                                                                          \
  } while (false)
