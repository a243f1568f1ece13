//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/preview.hpp"

#include "ingest/formats.hpp"
#include "ingest/test/test.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace std::string_literals;
using namespace ingest;

namespace {

auto numbers(int n) -> std::string {
  auto result = "n\n"s;
  for (auto i = 1; i <= n; ++i) {
    result += std::to_string(i) + "\n";
  }
  return result;
}

} // namespace

TEST("preview caps retained rows") {
  auto input = std::istringstream{numbers(50)};
  auto result = preview(csv_parser{}, input, format_config{}, 5);
  REQUIRE_EQUAL(result.rows.size(), 5u);
  CHECK_EQUAL(result.total_rows_parsed, 6);
  CHECK_EQUAL(unbox(result.rows[4].columns.find("n")), data{"5"});
  auto columns = std::vector<std::string>{"n"};
  CHECK_EQUAL(result.columns, columns);
  CHECK(result.warnings.empty());
}

TEST("preview of short inputs") {
  auto input = std::istringstream{numbers(3)};
  auto result = preview(csv_parser{}, input, format_config{});
  CHECK_EQUAL(result.rows.size(), 3u);
  CHECK_EQUAL(result.total_rows_parsed, 3);
}

TEST("preview collects warnings and columns") {
  auto cfg = format_config{};
  cfg.is_json_lines = true;
  auto input = std::istringstream{
    "{\"id\": 1, \"Name\": \"a\"}\nnot json\n{\"ID\": 2, \"extra\": true}\n"};
  auto result = preview(json_parser{}, input, cfg);
  REQUIRE_EQUAL(result.rows.size(), 2u);
  CHECK_EQUAL(result.total_rows_parsed, 3);
  REQUIRE_EQUAL(result.warnings.size(), 1u);
  CHECK(result.warnings[0].starts_with("Row 2: Line 2: "));
  auto columns = std::vector<std::string>{"id", "Name", "extra"};
  CHECK_EQUAL(result.columns, columns);
}

TEST("preview of a document error") {
  auto input = std::istringstream{"<broken"};
  auto result = preview(xml_parser{}, input, format_config{});
  CHECK(result.rows.empty());
  CHECK_EQUAL(result.total_rows_parsed, 1);
  REQUIRE_EQUAL(result.warnings.size(), 1u);
  CHECK(result.warnings[0].starts_with("Row 0: XML parse error: "));
}
