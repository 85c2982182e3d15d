//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

// Must be included after SPDLOG_ACTIVE_LEVEL is set; see raidfeed/logger.hpp.
#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace raidfeed::detail {

/// Swallows the arguments of log statements that were compiled out.
template <class... Ts>
constexpr void discard_args(Ts&&...) noexcept {
}

/// Installs the sinks described by `cfg` into the global logger.
/// @returns `false` if the configuration is invalid or a logger already exists.
bool setup_spdlog(const caf::settings& cfg);

void shutdown_spdlog();

/// The global logger. Until `setup_spdlog` ran it discards all messages.
std::shared_ptr<spdlog::logger>& logger();

} // namespace raidfeed::detail

#define RAIDFEED_DISCARD_ARGS(...) ::raidfeed::detail::discard_args(__VA_ARGS__)
