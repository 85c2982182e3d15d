//    raidfeed                  Live raid boss
//                              aggregation
//
// SPDX-FileCopyrightText: (c) 2026 The raidfeed Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "raidfeed/error.hpp"

#include "raidfeed/detail/assert.hpp"

#include <caf/exit_reason.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <iterator>
#include <sstream>
#include <string>

namespace raidfeed {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "closed",
  "parse_error",
  "invalid_configuration",
  "end_of_input",
  "filesystem_error",
  "system_error",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i))
        oss << ctx.get_as<std::string>(i);
      else
        oss << to_string(ctx);
    }
  }
}

} // namespace

auto to_string(ec x) -> std::string {
  auto index = static_cast<size_t>(x);
  RAIDFEED_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto from_string(std::string_view str, ec& x) -> bool {
  for (size_t i = 0; i < std::size(descriptions); ++i) {
    if (str == descriptions[i]) {
      x = static_cast<ec>(i);
      return true;
    }
  }
  return false;
}

auto from_integer(std::underlying_type_t<ec> value, ec& x) -> bool {
  if (value >= static_cast<std::underlying_type_t<ec>>(ec::ec_count))
    return false;
  x = static_cast<ec>(value);
  return true;
}

auto render(const caf::error& err) -> std::string {
  if (!err)
    return "";
  std::ostringstream oss;
  oss << "!! ";
  switch (err.category()) {
    default:
      oss << "Unknown";
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<raidfeed::ec>:
      oss << to_string(static_cast<raidfeed::ec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<caf::pec>:
      oss << to_string(static_cast<caf::pec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<caf::sec>:
      oss << to_string(static_cast<caf::sec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<caf::exit_reason>:
      oss << to_string(static_cast<caf::exit_reason>(err.code()));
      render_default_ctx(oss, err.context());
      break;
  }
  return oss.str();
}

auto is_closed(const caf::error& err) -> bool {
  return err == ec::closed || err == caf::sec::request_receiver_down
         || err == caf::sec::broken_promise;
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (!error)
    return error;
  if (!error.context()) {
    return caf::error{
      error.code(),
      error.category(),
      caf::make_message(std::move(str)),
    };
  }
  return caf::error{
    error.code(),
    error.category(),
    caf::message::concat(error.context(), caf::make_message(std::move(str))),
  };
}

} // namespace raidfeed
