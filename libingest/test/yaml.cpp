//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/error.hpp"
#include "ingest/formats.hpp"
#include "ingest/test/test.hpp"

#include <optional>
#include <sstream>
#include <stop_token>
#include <string>
#include <vector>

using namespace std::string_literals;
using namespace ingest;

namespace {

auto parse(std::string text, std::optional<std::string> path = {})
  -> std::vector<parsed_row> {
  auto cfg = format_config{};
  cfg.data_root_path = std::move(path);
  auto input = std::istringstream{std::move(text)};
  auto parser = yaml_parser{};
  auto result = std::vector<parsed_row>{};
  for (auto&& row : parser.parse(input, std::move(cfg))) {
    result.push_back(std::move(row));
  }
  return result;
}

} // namespace

TEST("yaml list of maps") {
  auto rows = parse(R"(
- name: alice
  age: 30
- name: bob
  age: 25
)");
  REQUIRE_EQUAL(rows.size(), 2u);
  auto alice = record{{"name", "alice"}, {"age", "30"}};
  auto bob = record{{"name", "bob"}, {"age", "25"}};
  CHECK_EQUAL(rows[0].columns, alice);
  CHECK_EQUAL(rows[1].columns, bob);
  CHECK_EQUAL(rows[0].line_number, 1);
  CHECK_EQUAL(rows[1].line_number, 2);
}

TEST("yaml single map") {
  auto rows = parse("host: example.org\nport: 8080\n");
  REQUIRE_EQUAL(rows.size(), 1u);
  auto expected = record{{"host", "example.org"}, {"port", "8080"}};
  CHECK_EQUAL(rows[0].columns, expected);
  CHECK_EQUAL(rows[0].line_number, 1);
}

TEST("yaml nulls") {
  auto rows = parse("a: ~\nb: null\nc:\nd: 'null'\n");
  REQUIRE_EQUAL(rows.size(), 1u);
  const auto& columns = rows[0].columns;
  CHECK(unbox(columns.find("a")).is_null());
  CHECK(unbox(columns.find("b")).is_null());
  CHECK(unbox(columns.find("c")).is_null());
  CHECK_EQUAL(unbox(columns.find("d")), data{"null"});
}

TEST("yaml nested values become json text") {
  auto rows = parse(R"(
- name: ann
  address:
    city: Paris
    zip: 75001
  tags: [a, "b \"quoted\""]
)");
  REQUIRE_EQUAL(rows.size(), 1u);
  const auto& columns = rows[0].columns;
  CHECK_EQUAL(unbox(columns.find("address")),
              data{R"({"city":"Paris","zip":"75001"})"});
  CHECK_EQUAL(unbox(columns.find("tags")), data{R"(["a","b \"quoted\""])"});
}

TEST("yaml scalar list elements") {
  auto rows = parse("- one\n- [1, 2]\n- ~\n");
  REQUIRE_EQUAL(rows.size(), 3u);
  CHECK_EQUAL(unbox(rows[0].columns.find("value")), data{"one"});
  CHECK_EQUAL(unbox(rows[1].columns.find("value")), data{R"(["1","2"])"});
  CHECK(unbox(rows[2].columns.find("value")).is_null());
}

TEST("yaml data root path") {
  auto text = R"(
meta:
  version: 2
data:
  items:
    - id: 1
    - id: 2
)"s;
  for (auto path : {"data.items", "$.data.items", "$data..items"}) {
    auto rows = parse(text, path);
    REQUIRE_EQUAL(rows.size(), 2u);
    CHECK_EQUAL(unbox(rows[1].columns.find("id")), data{"2"});
  }
  auto rows = parse(text, "meta");
  REQUIRE_EQUAL(rows.size(), 1u);
  CHECK_EQUAL(unbox(rows[0].columns.find("version")), data{"2"});
}

TEST("yaml structure errors") {
  auto text = "data:\n  items:\n    - id: 1\n"s;
  auto rows = parse(text, "data.missing");
  REQUIRE_EQUAL(rows.size(), 1u);
  CHECK_EQUAL(rows[0].line_number, 0);
  CHECK_EQUAL(unbox(rows[0].parse_error),
              "YAML structure error: Key 'missing' not found in YAML object");
  rows = parse(text, "data.items.id");
  REQUIRE_EQUAL(rows.size(), 1u);
  CHECK_EQUAL(unbox(rows[0].parse_error),
              "YAML structure error: Cannot navigate into list at segment "
              "'id'");
  rows = parse("just a string\n");
  REQUIRE_EQUAL(rows.size(), 1u);
  CHECK_EQUAL(unbox(rows[0].parse_error),
              "YAML structure error: Expected a list or object, got scalar");
}

TEST("yaml parse errors") {
  auto rows = parse("key: [unclosed\n");
  REQUIRE_EQUAL(rows.size(), 1u);
  CHECK_EQUAL(rows[0].line_number, 0);
  CHECK(unbox(rows[0].parse_error).starts_with("YAML parse error: "));
}

TEST("yaml empty documents") {
  CHECK(parse("").empty());
  CHECK(parse("# only a comment\n").empty());
  CHECK(parse("~\n").empty());
  CHECK(parse("[]\n").empty());
}

TEST("yaml cancellation") {
  auto input = std::istringstream{"- a: 1\n- a: 2\n"};
  auto source = std::stop_source{};
  auto parser = yaml_parser{};
  auto rows = parser.parse(input, format_config{}, source.get_token());
  auto it = rows.begin();
  REQUIRE(it != rows.end());
  source.request_stop();
  auto cancelled = false;
  try {
    ++it;
  } catch (const operation_cancelled&) {
    cancelled = true;
  }
  CHECK(cancelled);
}
