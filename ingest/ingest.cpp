//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/defaults.hpp"
#include "ingest/detail/add_message_types.hpp"
#include "ingest/detail/string.hpp"
#include "ingest/error.hpp"
#include "ingest/format_config.hpp"
#include "ingest/logger.hpp"
#include "ingest/parser_factory.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr auto usage = "usage: ingest [options] [<file>|-]";

/// Splits the command line into options and positional arguments. A single
/// dash names standard input and counts as positional.
auto partition_args(int argc, char** argv)
  -> std::pair<std::vector<std::string>, std::vector<std::string>> {
  auto options = std::vector<std::string>{};
  auto positional = std::vector<std::string>{};
  for (auto i = 1; i < argc; ++i) {
    auto arg = std::string{argv[i]};
    if (arg.size() > 1 and arg.front() == '-') {
      options.push_back(std::move(arg));
    } else {
      positional.push_back(std::move(arg));
    }
  }
  return {std::move(options), std::move(positional)};
}

} // namespace

int main(int argc, char** argv) {
  ingest::detail::add_message_types();
  auto format = std::string{"csv"};
  auto config_file = std::string{};
  auto limit = int64_t{0};
  auto verbosity = std::string{ingest::defaults::logger::console_verbosity};
  auto options
    = caf::config_option_set{}
        .add(format, "format,f",
             "input format: csv, tsv, json, jsonl, xml, yaml, or yml")
        .add(config_file, "config,c", "path to a format configuration file")
        .add(limit, "limit,n", "stop after this many rows (0 for no limit)")
        .add(verbosity, "verbosity,v",
             "console verbosity: quiet, error, warning, info, verbose, debug, "
             "or trace")
        .add<bool>("help,h", "print this help text");
  auto [option_args, positional] = partition_args(argc, argv);
  auto cfg = caf::settings{};
  auto res = options.parse(cfg, option_args);
  if (res.first != caf::pec::success) {
    std::cerr << "error while parsing argument \"" << *res.second
              << "\": " << to_string(res.first) << "\n\n";
    std::cerr << usage << "\n\n" << options.help_text() << std::endl;
    return EXIT_FAILURE;
  }
  if (caf::get_or(cfg, "help", false)) {
    std::cout << usage << "\n\n" << options.help_text() << std::endl;
    return EXIT_SUCCESS;
  }
  if (positional.size() > 1) {
    std::cerr << usage << std::endl;
    return EXIT_FAILURE;
  }
  auto log_context = ingest::create_log_context(
    verbosity, std::string{ingest::defaults::logger::console_format});
  if (not log_context) {
    std::cerr << ingest::render(log_context.error()) << std::endl;
    return EXIT_FAILURE;
  }
  auto parser = ingest::make_parser(format);
  if (not parser) {
    INGEST_ERROR("{}", ingest::render(parser.error()));
    return EXIT_FAILURE;
  }
  // The format name implies some options; a configuration file overrides
  // them.
  auto format_cfg = ingest::format_config{};
  if (ingest::detail::iequals(format, "tsv")) {
    format_cfg.delimiter = "\t";
  }
  if (ingest::detail::iequals(format, "jsonl")) {
    format_cfg.is_json_lines = true;
  }
  if (not config_file.empty()) {
    auto loaded = ingest::load_format_config(config_file, format_cfg);
    if (not loaded) {
      INGEST_ERROR("{}", ingest::render(loaded.error()));
      return EXIT_FAILURE;
    }
    format_cfg = std::move(*loaded);
  }
  auto file = std::ifstream{};
  auto* input = &std::cin;
  if (not positional.empty() and positional.front() != "-") {
    file.open(positional.front(), std::ios::binary);
    if (not file) {
      INGEST_ERROR("{}", ingest::render(caf::make_error(
                           ingest::ec::no_such_file,
                           fmt::format("failed to open '{}'",
                                       positional.front()))));
      return EXIT_FAILURE;
    }
    input = &file;
  }
  auto rows = int64_t{0};
  auto errors = int64_t{0};
  for (auto&& row : (*parser)->parse(*input, format_cfg)) {
    if (row.is_error()) {
      ++errors;
      INGEST_WARN("line {}: {}", row.line_number, *row.parse_error);
    }
    fmt::print("{}\n", to_json(row));
    if (limit > 0 and ++rows >= limit) {
      break;
    }
  }
  std::fflush(stdout);
  if (input == &file and file.bad()) {
    INGEST_ERROR("failed to read '{}'", positional.front());
    return EXIT_FAILURE;
  }
  INGEST_VERBOSE("ingest finished with {} error rows", errors);
  return EXIT_SUCCESS;
}
