//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/format_config.hpp"

#include "ingest/error.hpp"
#include "ingest/test/test.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace std::string_literals;
using namespace ingest;

TEST("format config defaults") {
  auto cfg = format_config{};
  CHECK_EQUAL(cfg.delimiter, ",");
  CHECK_EQUAL(cfg.quote_char, "\"");
  CHECK_EQUAL(cfg.encoding, "UTF-8");
  CHECK(cfg.has_header);
  CHECK_EQUAL(cfg.skip_rows, 0);
  CHECK(cfg.trim_whitespace);
  CHECK(not cfg.null_value);
  CHECK(not cfg.is_json_lines);
  CHECK(not cfg.data_root_path);
  CHECK(not cfg.record_element);
  CHECK(not cfg.xml_namespace);
  CHECK_EQUAL(cfg.separator(), ',');
  CHECK_EQUAL(cfg.quote(), '"');
  cfg.delimiter = "";
  cfg.quote_char = "'x";
  CHECK_EQUAL(cfg.separator(), ',');
  CHECK_EQUAL(cfg.quote(), '\'');
}

TEST("format config from yaml") {
  auto cfg = unbox(parse_format_config(R"(
delimiter: ";"
quoteChar: "'"
HasHeader: false
skip_rows: 2
trim-whitespace: false
nullValue: "N/A"
recordElement: //item
xmlNamespace: urn:x
)"));
  CHECK_EQUAL(cfg.separator(), ';');
  CHECK_EQUAL(cfg.quote(), '\'');
  CHECK(not cfg.has_header);
  CHECK_EQUAL(cfg.skip_rows, 2);
  CHECK(not cfg.trim_whitespace);
  CHECK_EQUAL(unbox(cfg.null_value), "N/A");
  CHECK_EQUAL(unbox(cfg.record_element), "//item");
  CHECK_EQUAL(unbox(cfg.xml_namespace), "urn:x");
  CHECK_EQUAL(cfg.encoding, "UTF-8");
}

TEST("format config from json") {
  auto cfg = unbox(parse_format_config(
    R"({"isJsonLines": true, "dataRootPath": "$.data", "encoding": "UTF-16"})"));
  CHECK(cfg.is_json_lines);
  CHECK_EQUAL(unbox(cfg.data_root_path), "$.data");
  CHECK_EQUAL(cfg.encoding, "UTF-16");
}

TEST("format config empty and null values") {
  CHECK_EQUAL(unbox(parse_format_config("")), format_config{});
  CHECK_EQUAL(unbox(parse_format_config("  \n")), format_config{});
  auto cfg = unbox(parse_format_config("delimiter: ~\nnullValue: ~\n"));
  CHECK_EQUAL(cfg, format_config{});
}

TEST("format config keeps unset options of the base") {
  auto base = format_config{};
  base.delimiter = "\t";
  base.is_json_lines = true;
  CHECK_EQUAL(unbox(parse_format_config("", base)), base);
  auto cfg = unbox(parse_format_config("hasHeader: false\n", base));
  CHECK_EQUAL(cfg.separator(), '\t');
  CHECK(cfg.is_json_lines);
  CHECK(not cfg.has_header);
  cfg = unbox(parse_format_config("delimiter: \",\"\nisJsonLines: false\n",
                                  base));
  CHECK_EQUAL(cfg.separator(), ',');
  CHECK(not cfg.is_json_lines);
}

TEST("format config ignores unknown keys") {
  auto cfg = unbox(parse_format_config("sheetName: Data\nhasHeader: no\n"));
  CHECK(not cfg.has_header);
}

TEST("format config errors") {
  auto err = [](std::string_view text) {
    auto result = parse_format_config(text);
    REQUIRE(not result);
    return result.error();
  };
  CHECK_EQUAL(err("hasHeader: maybe"), ec::invalid_configuration);
  CHECK_EQUAL(message(err("hasHeader: maybe")),
              "option 'hasHeader' must be a boolean");
  CHECK_EQUAL(err("skipRows: -1"), ec::invalid_configuration);
  CHECK_EQUAL(err("skipRows: two"), ec::invalid_configuration);
  CHECK_EQUAL(err("delimiter: [a, b]"), ec::invalid_configuration);
  CHECK_EQUAL(err("- a\n- b\n"), ec::invalid_configuration);
  CHECK_EQUAL(err("delimiter: [unclosed"), ec::parse_error);
}

TEST("format config files") {
  auto path = std::filesystem::temp_directory_path() / "ingest-format.yaml";
  {
    auto out = std::ofstream{path};
    out << "delimiter: \"|\"\n";
  }
  auto cfg = unbox(load_format_config(path));
  CHECK_EQUAL(cfg.separator(), '|');
  auto lines = format_config{};
  lines.is_json_lines = true;
  cfg = unbox(load_format_config(path, lines));
  CHECK_EQUAL(cfg.separator(), '|');
  CHECK(cfg.is_json_lines);
  {
    auto out = std::ofstream{path};
    out << "skipRows: -3\n";
  }
  auto invalid = load_format_config(path);
  REQUIRE(not invalid);
  CHECK_EQUAL(invalid.error(), ec::invalid_configuration);
  std::filesystem::remove(path);
  auto missing = load_format_config(path);
  REQUIRE(not missing);
  CHECK_EQUAL(missing.error(), ec::no_such_file);
}
