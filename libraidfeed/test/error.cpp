//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/error.hpp"

#include "raidfeed/detail/logger_formatters.hpp"
#include "raidfeed/test/test.hpp"

#include <caf/sec.hpp>
#include <fmt/format.h>

#include <set>
#include <string>

using namespace raidfeed;

TEST("error code names") {
  CHECK_EQUAL(to_string(ec::closed), "closed");
  CHECK_EQUAL(to_string(ec::parse_error), "parse_error");
  auto x = ec{};
  REQUIRE(from_string("invalid_configuration", x));
  CHECK_EQUAL(x, ec::invalid_configuration);
  CHECK(!from_string("no_such_error", x));
  CHECK(!from_integer(static_cast<uint8_t>(ec::ec_count), x));
}

TEST("every error code has a unique name") {
  auto names = std::set<std::string>{};
  for (auto i = uint8_t{0}; i < static_cast<uint8_t>(ec::ec_count); ++i) {
    auto code = ec{};
    REQUIRE(from_integer(i, code));
    auto name = to_string(code);
    auto parsed = ec{};
    REQUIRE(from_string(name, parsed));
    CHECK_EQUAL(parsed, code);
    names.insert(std::move(name));
  }
  CHECK_EQUAL(names.size(), static_cast<size_t>(ec::ec_count));
  auto x = ec{};
  CHECK(!from_string("invalid_argument", x));
}

TEST("rendering errors") {
  CHECK_EQUAL(render(caf::error{}), "");
  CHECK_EQUAL(render(caf::make_error(ec::closed)), "!! closed");
  CHECK_EQUAL(render(caf::make_error(ec::parse_error, "bad line")),
              "!! parse_error: bad line");
  CHECK_EQUAL(fmt::format("{}", caf::make_error(ec::parse_error, "bad line")),
              "!! parse_error: bad line");
}

TEST("adding context to errors") {
  auto err = add_context(caf::make_error(ec::parse_error, "bad tweet id"),
                         "in line {}", 3);
  CHECK_EQUAL(err, ec::parse_error);
  CHECK_EQUAL(render(err), "!! parse_error: bad tweet id in line 3");
  CHECK_EQUAL(add_context(caf::error{}, "ignored {}", 1), caf::error{});
}

TEST("closed aggregators") {
  CHECK(is_closed(caf::make_error(ec::closed)));
  CHECK(is_closed(caf::make_error(caf::sec::request_receiver_down)));
  CHECK(is_closed(caf::make_error(caf::sec::broken_promise)));
  CHECK(!is_closed(caf::make_error(ec::parse_error)));
  CHECK(!is_closed(caf::error{}));
}
