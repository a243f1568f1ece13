//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/defaults.hpp"
#include "ingest/detail/add_message_types.hpp"
#include "ingest/error.hpp"
#include "ingest/logger.hpp"
#include "ingest/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  // Parse everything after after '--'.
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end)
    return {};
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  ingest::detail::add_message_types();
  std::string ingest_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(ingest_loglevel, "ingest-verbosity",
                          "console verbosity for libingest")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
  }
  auto log_context
    = ingest::create_log_context(ingest_loglevel, "%^[%s:%#] %v%$");
  if (not log_context) {
    std::cerr << ingest::render(log_context.error()) << std::endl;
    return 1;
  }
  // Run the unit tests.
  auto result = caf::test::main(argc, argv);
  return result;
}
