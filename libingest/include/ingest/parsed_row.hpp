//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include "ingest/data.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ingest {

/// An ordered mapping from column names to values. Iteration follows
/// insertion order; assigning an existing column keeps its position.
class record {
public:
  using value_type = std::pair<std::string, data>;
  using vector_type = std::vector<value_type>;
  using iterator = vector_type::iterator;
  using const_iterator = vector_type::const_iterator;

  record() = default;

  record(std::initializer_list<value_type> xs);

  /// Inserts a column or replaces the value of an existing one.
  /// @returns `true` if the column was newly inserted.
  auto insert_or_assign(std::string key, data value) -> bool;

  /// Looks up a column by its exact name.
  [[nodiscard]] auto find(std::string_view key) const -> const data*;

  [[nodiscard]] auto contains(std::string_view key) const -> bool {
    return find(key) != nullptr;
  }

  [[nodiscard]] auto size() const -> size_t {
    return xs_.size();
  }

  [[nodiscard]] auto empty() const -> bool {
    return xs_.empty();
  }

  auto begin() const -> const_iterator {
    return xs_.begin();
  }

  auto end() const -> const_iterator {
    return xs_.end();
  }

  void clear() {
    xs_.clear();
  }

  friend auto operator==(const record& lhs, const record& rhs) -> bool
    = default;

private:
  vector_type xs_;
};

/// Renders a record as a JSON object.
/// @relates record
auto to_json(const record& xs) -> std::string;

/// A single unit of parser output: either a data row or an error row.
struct parsed_row {
  /// Creates a data row.
  static auto make(int64_t line_number, record columns) -> parsed_row;

  /// Creates an error row that carries no columns.
  static auto make_error(int64_t line_number, std::string message)
    -> parsed_row;

  /// Checks whether this is an error row.
  [[nodiscard]] auto is_error() const -> bool {
    return parse_error.has_value();
  }

  friend auto operator==(const parsed_row& lhs, const parsed_row& rhs) -> bool
    = default;

  /// The 1-based position of the record in the input. Document-level errors
  /// use 0.
  int64_t line_number = 0;

  /// The column values of a data row; empty for error rows.
  record columns = {};

  /// A human-readable message if the record failed to parse.
  std::optional<std::string> parse_error = {};

  /// Marks rows that a consumer decided to skip. Parsers never set this.
  bool is_skipped = false;
};

/// Renders a row as a JSON object with the keys `line` and either `columns`
/// or `error`.
/// @relates parsed_row
auto to_json(const parsed_row& row) -> std::string;

} // namespace ingest

template <>
struct fmt::formatter<ingest::record> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const ingest::record& x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", ingest::to_json(x));
  }
};

template <>
struct fmt::formatter<ingest::parsed_row> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const ingest::parsed_row& x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", ingest::to_json(x));
  }
};
