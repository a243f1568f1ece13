//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/parser_factory.hpp"

#include "ingest/error.hpp"
#include "ingest/test/test.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace std::string_literals;
using namespace ingest;

TEST("parser factory is case-insensitive") {
  auto name = [](std::string_view format) {
    return unbox(make_parser(format))->name();
  };
  CHECK_EQUAL(name("csv"), "CSV");
  CHECK_EQUAL(name("Csv"), "CSV");
  CHECK_EQUAL(name("TSV"), "CSV");
  CHECK_EQUAL(name("json"), "JSON");
  CHECK_EQUAL(name("JsonL"), "JSON");
  CHECK_EQUAL(name("xml"), "XML");
  CHECK_EQUAL(name("YAML"), "YAML");
  CHECK_EQUAL(name("yml"), "YAML");
}

TEST("parser factory rejects unknown formats") {
  auto parser = make_parser("INI");
  REQUIRE(not parser);
  CHECK_EQUAL(parser.error(), ec::invalid_configuration);
  CHECK_EQUAL(message(parser.error()),
              "Import format 'INI' is not supported. Supported: CSV, TSV, "
              "JSON, JSONL, XML, YAML");
  CHECK(not make_parser(""));
  CHECK(not make_parser("csv "));
}

TEST("supported formats") {
  auto formats = supported_formats();
  REQUIRE_EQUAL(formats.size(), 6u);
  for (auto format : formats) {
    CHECK(make_parser(format));
  }
}

TEST("parsers from the factory parse") {
  auto parser = unbox(make_parser("tsv"));
  auto cfg = format_config{};
  cfg.delimiter = "\t";
  auto input = std::istringstream{"a\tb\n1\t2\n"};
  auto rows = std::vector<parsed_row>{};
  for (auto&& row : parser->parse(input, cfg)) {
    rows.push_back(std::move(row));
  }
  REQUIRE_EQUAL(rows.size(), 1u);
  auto expected = record{{"a", "1"}, {"b", "2"}};
  CHECK_EQUAL(rows[0].columns, expected);
}
