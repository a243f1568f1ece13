//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/parser_factory.hpp"

#include "ingest/detail/string.hpp"
#include "ingest/error.hpp"
#include "ingest/formats.hpp"
#include "ingest/logger.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <iterator>

namespace ingest {

namespace {

template <class Parser>
auto make() -> std::unique_ptr<import_parser> {
  return std::make_unique<Parser>();
}

struct factory_entry {
  std::string_view name;
  std::unique_ptr<import_parser> (*make)();
};

constexpr factory_entry factories[] = {
  {"csv", make<csv_parser>},   {"tsv", make<csv_parser>},
  {"json", make<json_parser>}, {"jsonl", make<json_parser>},
  {"xml", make<xml_parser>},   {"yaml", make<yaml_parser>},
  {"yml", make<yaml_parser>},
};

constexpr auto canonical_formats = std::array<std::string_view, 6>{
  "CSV", "TSV", "JSON", "JSONL", "XML", "YAML",
};

} // namespace

auto make_parser(std::string_view format)
  -> caf::expected<std::unique_ptr<import_parser>> {
  const auto* it = std::find_if(std::begin(factories), std::end(factories),
                                [&](const factory_entry& entry) {
                                  return detail::iequals(entry.name, format);
                                });
  if (it == std::end(factories)) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("Import format '{}' is not supported. "
                                       "Supported: {}",
                                       format,
                                       fmt::join(canonical_formats, ", ")));
  }
  auto result = it->make();
  INGEST_DEBUG("selected {} parser for format '{}'", result->name(), format);
  return result;
}

auto supported_formats() -> std::span<const std::string_view> {
  return canonical_formats;
}

} // namespace ingest
