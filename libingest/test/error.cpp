//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/error.hpp"

#include "ingest/test/test.hpp"

#include <caf/pec.hpp>
#include <caf/sec.hpp>

using namespace std::string_literals;
using namespace ingest;

TEST("error to_string") {
  auto str = [](auto x) {
    return to_string(x);
  };
  CHECK_EQUAL(str(ec::no_error), "no_error"s);
  CHECK_EQUAL(str(ec::unspecified), "unspecified"s);
  CHECK_EQUAL(str(ec::no_such_file), "no_such_file"s);
  CHECK_EQUAL(str(ec::filesystem_error), "filesystem_error"s);
  CHECK_EQUAL(str(ec::type_clash), "type_clash"s);
  CHECK_EQUAL(str(ec::parse_error), "parse_error"s);
  CHECK_EQUAL(str(ec::format_error), "format_error"s);
  CHECK_EQUAL(str(ec::end_of_input), "end_of_input"s);
  CHECK_EQUAL(str(ec::syntax_error), "syntax_error"s);
  CHECK_EQUAL(str(ec::lookup_error), "lookup_error"s);
  CHECK_EQUAL(str(ec::logic_error), "logic_error"s);
  CHECK_EQUAL(str(ec::invalid_argument), "invalid_argument"s);
  CHECK_EQUAL(str(ec::invalid_configuration), "invalid_configuration"s);
  CHECK_EQUAL(str(ec::unrecognized_option), "unrecognized_option"s);
  CHECK_EQUAL(str(ec::unimplemented), "unimplemented"s);
  CHECK_EQUAL(str(ec::system_error), "system_error"s);
}

TEST("render") {
  CHECK_EQUAL(render(caf::make_error(ec::unspecified)), "!! unspecified");
  CHECK_EQUAL(render(caf::make_error(ec::syntax_error, "msg")),
              "!! syntax_error: msg");
  CHECK_EQUAL(render(caf::make_error(ec::syntax_error, "test with", "multiple",
                                     "messages")),
              "!! syntax_error: test with multiple messages");
  CHECK_EQUAL(render(caf::make_error(caf::pec::type_mismatch, "ttt")),
              "!! type_mismatch: ttt");
  CHECK_EQUAL(render(caf::make_error(caf::sec::unexpected_message, "msg")),
              "!! unexpected_message: msg");
  CHECK_EQUAL(render(caf::error{}), "");
}

TEST("message") {
  CHECK_EQUAL(message(caf::make_error(ec::lookup_error, "not found")),
              "not found");
  CHECK_EQUAL(message(caf::make_error(ec::lookup_error)), "lookup_error");
}

TEST("add context") {
  auto err = caf::make_error(ec::parse_error, "bad token");
  auto with_context = add_context(err, "file {}", "a.yaml");
  CHECK_EQUAL(with_context, ec::parse_error);
  CHECK_EQUAL(message(with_context), "file a.yaml: bad token");
}

TEST("operation cancelled") {
  auto e = operation_cancelled{};
  CHECK_EQUAL(std::string{e.what()}, "the operation was cancelled");
}
