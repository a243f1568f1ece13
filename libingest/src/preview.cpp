//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/preview.hpp"

#include "ingest/detail/string.hpp"
#include "ingest/import_parser.hpp"
#include "ingest/logger.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace ingest {

auto preview(const import_parser& parser, std::istream& input,
             const format_config& config, size_t max_rows,
             std::stop_token stop) -> preview_result {
  auto result = preview_result{};
  for (auto&& row : parser.parse(input, config, std::move(stop))) {
    ++result.total_rows_parsed;
    if (row.is_error()) {
      result.warnings.push_back(
        fmt::format("Row {}: {}", row.line_number, *row.parse_error));
    } else if (not row.is_skipped) {
      for (const auto& [name, _] : row.columns) {
        auto known = std::any_of(result.columns.begin(), result.columns.end(),
                                 [&](const std::string& column) {
                                   return detail::iequals(column, name);
                                 });
        if (not known) {
          result.columns.push_back(name);
        }
      }
      if (result.rows.size() < max_rows) {
        result.rows.push_back(std::move(row));
      }
    }
    if (result.rows.size() >= max_rows
        and result.total_rows_parsed > static_cast<int64_t>(max_rows)) {
      break;
    }
  }
  INGEST_DEBUG("{} preview retained {} of {} parsed rows", parser.name(),
               result.rows.size(), result.total_rows_parsed);
  return result;
}

} // namespace ingest
