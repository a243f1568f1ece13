//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/parsed_row.hpp"

#include "ingest/data.hpp"
#include "ingest/test/test.hpp"

#include <cmath>
#include <limits>
#include <string>

using namespace std::string_literals;
using namespace ingest;

TEST("data kinds") {
  CHECK(data{}.is_null());
  CHECK(data{caf::none}.is_null());
  CHECK(is<bool>(data{true}));
  CHECK(is<int64_t>(data{42}));
  CHECK(is<double>(data{4.2}));
  CHECK(is<std::string>(data{"foo"}));
  CHECK(is<std::string>(data{"foo"s}));
  CHECK_EQUAL(kind_name(data{}), "null");
  CHECK_EQUAL(kind_name(data{int64_t{1}}), "int64");
  CHECK_EQUAL(unbox(try_as<int64_t>(data{7})), 7);
  CHECK(try_as<double>(data{7}) == nullptr);
}

TEST("data to json") {
  CHECK_EQUAL(to_json(data{}), "null");
  CHECK_EQUAL(to_json(data{false}), "false");
  CHECK_EQUAL(to_json(data{-5}), "-5");
  CHECK_EQUAL(to_json(data{0.5}), "0.5");
  CHECK_EQUAL(to_json(data{std::numeric_limits<double>::infinity()}),
              "null");
  CHECK_EQUAL(to_json(data{"a\"b\n"}), R"("a\"b\n")");
  CHECK_EQUAL(fmt::format("{}", data{"x"}), R"("x")");
}

TEST("record keeps insertion order") {
  auto xs = record{};
  CHECK(xs.empty());
  CHECK(xs.insert_or_assign("b", 1));
  CHECK(xs.insert_or_assign("a", 2));
  CHECK(not xs.insert_or_assign("b", 3));
  REQUIRE_EQUAL(xs.size(), 2u);
  CHECK_EQUAL(xs.begin()->first, "b");
  CHECK_EQUAL(unbox(xs.find("b")), data{3});
  CHECK(xs.contains("a"));
  CHECK(not xs.contains("A"));
  CHECK(xs.find("c") == nullptr);
  CHECK_EQUAL(to_json(xs), R"({"b":3,"a":2})");
  xs.clear();
  CHECK(xs.empty());
}

TEST("parsed rows") {
  auto row = parsed_row::make(3, record{{"a", "x"}, {"b", caf::none}});
  CHECK(not row.is_error());
  CHECK(not row.is_skipped);
  CHECK_EQUAL(row.line_number, 3);
  CHECK_EQUAL(to_json(row), R"({"line":3,"columns":{"a":"x","b":null}})");
  auto error = parsed_row::make_error(0, "broken \"input\"");
  CHECK(error.is_error());
  CHECK(error.columns.empty());
  CHECK_EQUAL(to_json(error), R"({"line":0,"error":"broken \"input\""})");
  CHECK(row != error);
}
