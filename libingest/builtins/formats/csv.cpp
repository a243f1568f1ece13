//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/detail/string.hpp"
#include "ingest/error.hpp"
#include "ingest/formats.hpp"
#include "ingest/logger.hpp"
#include "ingest/text_reader.hpp"

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <simdjson.h>

namespace ingest {

namespace {

/// Splits a single line into fields. A quote character at the start of a
/// field opens a quoted section in which the delimiter is literal and a
/// doubled quote stands for one quote. An unterminated quoted section extends
/// to the end of the line.
auto split_line(std::string_view line, char delimiter, char quote, bool trim)
  -> std::vector<std::string> {
  auto fields = std::vector<std::string>{};
  auto current = std::string{};
  auto in_quotes = false;
  auto finish_field = [&] {
    fields.emplace_back(trim ? std::string{detail::trim(current)} : current);
    current.clear();
  };
  for (size_t i = 0; i < line.size(); ++i) {
    auto c = line[i];
    if (in_quotes) {
      if (c == quote) {
        if (i + 1 < line.size() and line[i + 1] == quote) {
          current += quote;
          ++i;
          continue;
        }
        in_quotes = false;
        continue;
      }
      current += c;
      continue;
    }
    if (c == quote and current.empty()) {
      in_quotes = true;
      continue;
    }
    if (c == delimiter) {
      finish_field();
      continue;
    }
    current += c;
  }
  finish_field();
  return fields;
}

auto make_column_names(size_t count) -> std::vector<std::string> {
  auto result = std::vector<std::string>{};
  result.reserve(count);
  for (size_t i = 1; i <= count; ++i) {
    result.push_back(fmt::format("Col{}", i));
  }
  return result;
}

} // namespace

auto csv_parser::name() const -> std::string {
  return "CSV";
}

auto csv_parser::parse(std::istream& input, format_config config,
                       std::stop_token stop) const -> generator<parsed_row> {
  auto reader = text_reader{input, resolve_encoding(config.encoding)};
  const auto delimiter = config.separator();
  const auto quote = config.quote();
  for (auto i = int64_t{0}; i < config.skip_rows; ++i) {
    if (not reader.read_line()) {
      co_return;
    }
  }
  // Line numbers are physical and include the skipped lines.
  auto line_number = config.skip_rows;
  auto header = std::optional<std::vector<std::string>>{};
  while (true) {
    if (stop.stop_requested()) {
      throw operation_cancelled{};
    }
    auto line = reader.read_line();
    if (not line) {
      break;
    }
    ++line_number;
    auto text = std::string_view{*line};
    if (config.trim_whitespace) {
      text = detail::trim(text);
    }
    if (text.empty()) {
      continue;
    }
    if (not simdjson::validate_utf8(text.data(), text.size())) {
      co_yield parsed_row::make_error(
        line_number, fmt::format("Failed to parse line {}: invalid {} byte "
                                 "sequence",
                                 line_number, to_string(reader.encoding())));
      continue;
    }
    auto fields = split_line(text, delimiter, quote, config.trim_whitespace);
    if (not header) {
      if (config.has_header) {
        INGEST_DEBUG("csv parser read header with {} columns", fields.size());
        header = std::move(fields);
        continue;
      }
      header = make_column_names(fields.size());
    }
    auto columns = record{};
    for (size_t i = 0; i < header->size(); ++i) {
      auto value = i < fields.size() ? std::move(fields[i]) : std::string{};
      if (config.null_value and value == *config.null_value) {
        columns.insert_or_assign((*header)[i], caf::none);
      } else {
        columns.insert_or_assign((*header)[i], std::move(value));
      }
    }
    co_yield parsed_row::make(line_number, std::move(columns));
  }
  INGEST_DEBUG("csv parser finished after {} lines", line_number);
}

} // namespace ingest
