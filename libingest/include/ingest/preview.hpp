//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include "ingest/defaults.hpp"
#include "ingest/format_config.hpp"
#include "ingest/parsed_row.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <stop_token>
#include <string>
#include <vector>

namespace ingest {

/// The first rows of an input together with what was seen on the way.
struct preview_result {
  /// The retained data rows.
  std::vector<parsed_row> rows = {};

  /// All column names in the order they first appeared. Names that differ
  /// only in case are listed once.
  std::vector<std::string> columns = {};

  /// The number of rows consumed from the parser, including error rows.
  int64_t total_rows_parsed = 0;

  /// One entry per error row.
  std::vector<std::string> warnings = {};
};

/// Parses the beginning of an input to show what an import would produce.
/// Stops after `max_rows` rows have been retained and one more row was seen.
/// @throws operation_cancelled if `stop` is triggered.
auto preview(const import_parser& parser, std::istream& input,
             const format_config& config,
             size_t max_rows = defaults::preview::max_rows,
             std::stop_token stop = {}) -> preview_result;

} // namespace ingest
