//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/deep_to_string.hpp>
#include <caf/detail/source_location.hpp>
#include <caf/expected.hpp>
#include <caf/test/test.hpp>
#include <fmt/format.h>

#include <string>
#include <type_traits>

namespace raidfeed::test::detail {

template <class T>
auto stringify(const T& value) {
  if constexpr (std::is_convertible_v<T, std::string>) {
    return std::string{value};
  } else {
    return caf::deep_to_string(value);
  }
}

template <class T0, class T1>
bool check_eq(const T0& lhs, const T1& rhs,
              caf::detail::source_location location
              = caf::detail::source_location::current()) {
  // Adapted from CAF, but without safety checks.
  if (lhs == rhs) {
    caf::test::reporter::instance().pass(location);
    return true;
  }
  caf::test::reporter::instance().fail(
    caf::test::binary_predicate::eq, stringify(lhs), stringify(rhs), location);
  return false;
}

} // namespace raidfeed::test::detail

// -- macros for checking results ----------------------------------------------

// Checks that abort the current test on failure
#define REQUIRE(x)                                                             \
  ::caf::test::runnable::current().require(static_cast<bool>(x))
#define REQUIRE_EQUAL(x, y)                                                    \
  ::caf::test::runnable::current().require_eq((x), (y))
#define FAIL ::caf::test::runnable::current().fail
// Checks that continue with the current test on failure
#define CHECK(x) ::caf::test::runnable::current().check(static_cast<bool>(x))
#define CHECK_EQUAL(x, y) ::raidfeed::test::detail::check_eq((x), (y))
#define CHECK_NOT_EQUAL(x, y)                                                  \
  ::caf::test::runnable::current().check_ne((x), (y))
#define CHECK_LESS_EQUAL(x, y)                                                 \
  ::caf::test::runnable::current().check_le((x), (y))

namespace raidfeed::test {

/// Extracts the value of `x` or fails the current test.
template <class T>
T unbox(caf::expected<T> x) {
  if (! x) {
    FAIL("expected<T> contains an error: {}", x.error());
  }
  return std::move(*x);
}

} // namespace raidfeed::test

namespace raidfeed {

using test::unbox;

} // namespace raidfeed
