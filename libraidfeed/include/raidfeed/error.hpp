//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/fwd.hpp"

#include <caf/default_enum_inspect.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <type_traits>

namespace raidfeed {

/// raidfeed's error codes.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// The aggregator is gone and can no longer deliver a reply.
  closed,
  /// Failure during parsing.
  parse_error,
  /// A command failed because its configuration was invalid.
  invalid_configuration,
  /// Exhausted the input.
  end_of_input,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// An error from interacting with the operating system.
  system_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> std::string;

/// @relates ec
auto from_string(std::string_view str, ec& x) -> bool;

/// @relates ec
auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool;

template <class Inspector>
auto inspect(Inspector& f, ec& x) {
  return caf::default_enum_inspect(f, x);
}

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

/// Checks whether `err` signals that the aggregator can no longer reply.
auto is_closed(const caf::error& err) -> bool;

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

} // namespace raidfeed

CAF_ERROR_CODE_ENUM(raidfeed::ec)
