//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/error.hpp"

#include <caf/deep_to_string.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <iterator>
#include <string>

namespace ingest {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "no_such_file",
  "filesystem_error",
  "type_clash",
  "parse_error",
  "format_error",
  "end_of_input",
  "syntax_error",
  "lookup_error",
  "logic_error",
  "invalid_argument",
  "invalid_configuration",
  "unrecognized_option",
  "unimplemented",
  "system_error",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

auto render_ctx(const caf::message& ctx) -> std::string {
  auto result = std::string{};
  for (size_t i = 0; i < ctx.size(); ++i) {
    if (not result.empty()) {
      result += ' ';
    }
    if (ctx.match_element<std::string>(i)) {
      result += ctx.get_as<std::string>(i);
    } else {
      result += caf::deep_to_string(ctx);
    }
  }
  return result;
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  if (index >= std::size(descriptions)) {
    return "unknown";
  }
  return descriptions[index];
}

auto render(const caf::error& err) -> std::string {
  if (not err) {
    return "";
  }
  auto result = std::string{"!! "};
  switch (err.category()) {
    default:
      result += "unknown";
      break;
    case caf::type_id_v<ingest::ec>:
      result += to_string(static_cast<ingest::ec>(err.code()));
      break;
    case caf::type_id_v<caf::pec>:
      result += to_string(static_cast<caf::pec>(err.code()));
      break;
    case caf::type_id_v<caf::sec>:
      result += to_string(static_cast<caf::sec>(err.code()));
      break;
  }
  auto ctx = render_ctx(err.context());
  if (not ctx.empty()) {
    result += ": ";
    result += ctx;
  }
  return result;
}

auto message(const caf::error& err) -> std::string {
  if (not err) {
    return "";
  }
  auto ctx = render_ctx(err.context());
  if (ctx.empty() and err.category() == caf::type_id_v<ingest::ec>) {
    return to_string(static_cast<ingest::ec>(err.code()));
  }
  return ctx;
}

auto add_context_impl(const caf::error& error, std::string str)
  -> caf::error {
  if (not error) {
    return error;
  }
  auto ctx = render_ctx(error.context());
  if (not ctx.empty()) {
    str = fmt::format("{}: {}", str, ctx);
  }
  return caf::error{error.code(), error.category(),
                    caf::make_message(std::move(str))};
}

} // namespace ingest
