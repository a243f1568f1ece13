//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/parsed_row.hpp"

#include "ingest/detail/string.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace ingest {

record::record(std::initializer_list<value_type> xs) {
  for (const auto& [key, value] : xs) {
    insert_or_assign(key, value);
  }
}

auto record::insert_or_assign(std::string key, data value) -> bool {
  auto it = std::find_if(xs_.begin(), xs_.end(), [&](const auto& x) {
    return x.first == key;
  });
  if (it != xs_.end()) {
    it->second = std::move(value);
    return false;
  }
  xs_.emplace_back(std::move(key), std::move(value));
  return true;
}

auto record::find(std::string_view key) const -> const data* {
  auto it = std::find_if(xs_.begin(), xs_.end(), [&](const auto& x) {
    return x.first == key;
  });
  return it != xs_.end() ? &it->second : nullptr;
}

auto to_json(const record& xs) -> std::string {
  auto result = std::string{"{"};
  auto out = std::back_inserter(result);
  auto first = true;
  for (const auto& [key, value] : xs) {
    if (not first) {
      result += ',';
    }
    first = false;
    fmt::format_to(out, "\"{}\":{}", detail::json_escape(key), to_json(value));
  }
  result += '}';
  return result;
}

auto parsed_row::make(int64_t line_number, record columns) -> parsed_row {
  return {
    .line_number = line_number,
    .columns = std::move(columns),
  };
}

auto parsed_row::make_error(int64_t line_number, std::string message)
  -> parsed_row {
  return {
    .line_number = line_number,
    .parse_error = std::move(message),
  };
}

auto to_json(const parsed_row& row) -> std::string {
  if (row.parse_error) {
    return fmt::format("{{\"line\":{},\"error\":\"{}\"}}", row.line_number,
                       detail::json_escape(*row.parse_error));
  }
  return fmt::format("{{\"line\":{},\"columns\":{}}}", row.line_number,
                     to_json(row.columns));
}

} // namespace ingest
