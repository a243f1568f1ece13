//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/import_parser.hpp"

namespace ingest {

/// Delimited text such as CSV and TSV. Quoted fields must not span lines.
class csv_parser final : public import_parser {
public:
  auto name() const -> std::string override;

  auto parse(std::istream& input, format_config config,
             std::stop_token stop = {}) const
    -> generator<parsed_row> override;
};

/// A single JSON document, or one document per line with `is_json_lines`.
class json_parser final : public import_parser {
public:
  auto name() const -> std::string override;

  auto parse(std::istream& input, format_config config,
             std::stop_token stop = {}) const
    -> generator<parsed_row> override;
};

/// An XML document whose records are selected by a path expression.
class xml_parser final : public import_parser {
public:
  auto name() const -> std::string override;

  auto parse(std::istream& input, format_config config,
             std::stop_token stop = {}) const
    -> generator<parsed_row> override;
};

/// A YAML document with a list of maps or a single map.
class yaml_parser final : public import_parser {
public:
  auto name() const -> std::string override;

  auto parse(std::istream& input, format_config config,
             std::stop_token stop = {}) const
    -> generator<parsed_row> override;
};

} // namespace ingest
