//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include "ingest/import_parser.hpp"

#include <caf/expected.hpp>

#include <memory>
#include <span>
#include <string_view>

namespace ingest {

/// Creates the parser for a format identifier. Identifiers are matched
/// case-insensitively; `TSV` and `JSONL` select the CSV and JSON parsers, whose
/// behavior is then controlled by the format configuration.
/// @param format The format identifier, e.g., `csv` or `JSONL`.
/// @returns The parser, or `ec::invalid_configuration` for unknown formats.
auto make_parser(std::string_view format)
  -> caf::expected<std::unique_ptr<import_parser>>;

/// Lists the canonical format identifiers.
auto supported_formats() -> std::span<const std::string_view>;

} // namespace ingest
