//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "raidfeed/error.hpp"

#include <caf/error.hpp>
#include <fmt/format.h>

#include <string_view>

template <>
struct fmt::formatter<caf::error> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(const caf::error& x, FormatContext& ctx) const {
    auto str = raidfeed::render(x);
    return fmt::formatter<std::string_view>::format(str, ctx);
  }
};

template <>
struct fmt::formatter<raidfeed::ec> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(raidfeed::ec x, FormatContext& ctx) const {
    auto str = to_string(x);
    return fmt::formatter<std::string_view>::format(str, ctx);
  }
};
