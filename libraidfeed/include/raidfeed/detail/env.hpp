//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/error.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace raidfeed::detail {

/// A thread-safe wrapper around `::getenv`.
/// @param var The environment variable.
/// @returns The copy of the environment variable or `std::nullopt` if *var* is
/// not set.
std::optional<std::string_view> getenv(std::string_view var);

/// A thread-safe wrapper around `::setenv`.
caf::error setenv(std::string_view key, std::string_view value,
                  int overwrite = 1);

/// A thread-safe wrapper around `::unsetenv`.
caf::error unsetenv(std::string_view var);

/// Retrieves all environment variables as list of key-value pairs.
std::vector<std::pair<std::string_view, std::string_view>> environment();

} // namespace raidfeed::detail
