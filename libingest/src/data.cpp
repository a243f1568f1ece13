//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/data.hpp"

#include "ingest/detail/overload.hpp"
#include "ingest/detail/string.hpp"

#include <fmt/format.h>

#include <cmath>

namespace ingest {

auto to_json(const data& x) -> std::string {
  return std::visit(detail::overload{
                      [](caf::none_t) -> std::string {
                        return "null";
                      },
                      [](bool value) -> std::string {
                        return value ? "true" : "false";
                      },
                      [](int64_t value) -> std::string {
                        return fmt::to_string(value);
                      },
                      [](double value) -> std::string {
                        if (not std::isfinite(value)) {
                          return "null";
                        }
                        return fmt::to_string(value);
                      },
                      [](const std::string& value) -> std::string {
                        return fmt::format("\"{}\"", detail::json_escape(value));
                      },
                    },
                    x.get_data());
}

auto kind_name(const data& x) -> std::string_view {
  return std::visit(detail::overload{
                      [](caf::none_t) -> std::string_view {
                        return "null";
                      },
                      [](bool) -> std::string_view {
                        return "bool";
                      },
                      [](int64_t) -> std::string_view {
                        return "int64";
                      },
                      [](double) -> std::string_view {
                        return "double";
                      },
                      [](const std::string&) -> std::string_view {
                        return "string";
                      },
                    },
                    x.get_data());
}

} // namespace ingest
