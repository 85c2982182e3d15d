//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/config.hpp"

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>

#include <exception>
#include <source_location>
#include <string>

namespace raidfeed {

/// Thrown when the program reaches a state that it must never be in.
struct panic_exception final : std::exception {
  panic_exception(std::string message, std::source_location location,
                  boost::stacktrace::stacktrace stacktrace)
    : message{std::move(message)},
      location{location},
      stacktrace{std::move(stacktrace)} {
  }

  auto what() const noexcept -> const char* override {
    if (what_.empty()) {
      what_ = fmt::format("{} (at {}:{})", message, location.file_name(),
                          location.line());
    }
    return what_.c_str();
  }

  std::string message;
  std::source_location location;
  boost::stacktrace::stacktrace stacktrace;
  mutable std::string what_;
};

template <size_t Skip = 0, class... Ts>
[[noreturn]] RAIDFEED_NO_INLINE void
panic_at(std::source_location location, fmt::format_string<Ts...> string,
         Ts&&... xs) {
  auto st = boost::stacktrace::stacktrace{Skip + 1, 1000};
  throw panic_exception{fmt::format(std::move(string), std::forward<Ts>(xs)...),
                        location, std::move(st)};
}

template <size_t Skip = 0, class T>
[[noreturn]] RAIDFEED_NO_INLINE void
panic(T&& message, std::source_location location
                   = std::source_location::current()) {
  panic_at<Skip + 1>(location, "{}", std::forward<T>(message));
}

} // namespace raidfeed
