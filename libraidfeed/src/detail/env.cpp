//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/detail/env.hpp"

#include "raidfeed/detail/assert.hpp"
#include "raidfeed/error.hpp"

#include <fmt/format.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>

extern char** environ;

namespace raidfeed::detail {

namespace {

// A mutex for locking calls to functions that mutate `environ`. Global to this
// translation unit.
auto env_mutex = std::mutex{};

} // namespace

std::optional<std::string_view> getenv(std::string_view var) {
  auto lock = std::scoped_lock{env_mutex};
  auto str = std::string{var};
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (const char* result = ::getenv(str.c_str()))
    return std::string_view{result};
  return {};
}

caf::error setenv(std::string_view key, std::string_view value, int overwrite) {
  auto lock = std::scoped_lock{env_mutex};
  auto k = std::string{key};
  auto v = std::string{value};
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (::setenv(k.c_str(), v.c_str(), overwrite) == 0)
    return {};
  return caf::make_error( //
    ec::system_error,
    fmt::format("failed in setenv(3): {}", ::strerror(errno)));
}

caf::error unsetenv(std::string_view var) {
  auto lock = std::scoped_lock{env_mutex};
  auto str = std::string{var};
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (::unsetenv(str.c_str()) == 0)
    return {};
  return caf::make_error( //
    ec::system_error,
    fmt::format("failed in unsetenv(3): {}", ::strerror(errno)));
}

std::vector<std::pair<std::string_view, std::string_view>> environment() {
  auto lock = std::scoped_lock{env_mutex};
  auto result = std::vector<std::pair<std::string_view, std::string_view>>{};
  // Envrionment variables come as "key=value" pair strings.
  for (auto env = environ; *env != nullptr; ++env) {
    auto str = std::string_view{*env};
    auto i = str.find('=');
    RAIDFEED_ASSERT(i != std::string_view::npos);
    result.emplace_back(str.substr(0, i), str.substr(i + 1));
  }
  return result;
}

} // namespace raidfeed::detail
