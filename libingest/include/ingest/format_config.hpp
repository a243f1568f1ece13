//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include "ingest/defaults.hpp"

#include <caf/expected.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ingest {

/// Format-specific options for a single parse. Options that do not apply to
/// the selected format are ignored.
struct format_config {
  /// The field separator of delimited text. Only the first character counts.
  std::string delimiter = std::string{defaults::format::delimiter};

  /// The quote character of delimited text. Only the first character counts.
  std::string quote_char = std::string{defaults::format::quote_char};

  /// The name of the character encoding of the input.
  std::string encoding = std::string{defaults::format::encoding};

  /// Whether the first delimited line names the columns.
  bool has_header = defaults::format::has_header;

  /// Number of physical lines to discard before the header.
  int64_t skip_rows = defaults::format::skip_rows;

  /// Whether to trim delimited lines and fields.
  bool trim_whitespace = defaults::format::trim_whitespace;

  /// A delimited field equal to this literal becomes null.
  std::optional<std::string> null_value = {};

  /// Whether JSON input contains one document per line.
  bool is_json_lines = defaults::format::is_json_lines;

  /// A dot-separated path to the record collection of a JSON or YAML
  /// document, e.g., `$.data.items`.
  std::optional<std::string> data_root_path = {};

  /// The path expression selecting the record elements of an XML document.
  std::optional<std::string> record_element = {};

  /// The namespace URI bound to the prefix `ns` in `record_element`.
  std::optional<std::string> xml_namespace = {};

  /// Returns the effective field separator.
  [[nodiscard]] auto separator() const -> char {
    return delimiter.empty() ? defaults::format::delimiter : delimiter.front();
  }

  /// Returns the effective quote character.
  [[nodiscard]] auto quote() const -> char {
    return quote_char.empty() ? defaults::format::quote_char
                              : quote_char.front();
  }

  friend auto operator==(const format_config& lhs, const format_config& rhs)
    -> bool = default;

  template <class Inspector>
  friend auto inspect(Inspector& f, format_config& x) {
    return f.object(x)
      .pretty_name("ingest.format_config")
      .fields(f.field("delimiter", x.delimiter),
              f.field("quote-char", x.quote_char),
              f.field("encoding", x.encoding),
              f.field("has-header", x.has_header),
              f.field("skip-rows", x.skip_rows),
              f.field("trim-whitespace", x.trim_whitespace),
              f.field("null-value", x.null_value),
              f.field("is-json-lines", x.is_json_lines),
              f.field("data-root-path", x.data_root_path),
              f.field("record-element", x.record_element),
              f.field("xml-namespace", x.xml_namespace));
  }
};

/// Parses a format configuration from a JSON or YAML mapping. Keys match
/// case-insensitively and may use camelCase or snake_case spelling; unknown
/// keys are ignored with a warning. Options that the document does not set
/// keep their value from `base`, so an empty document yields `base`.
auto parse_format_config(std::string_view text, format_config base = {})
  -> caf::expected<format_config>;

/// Reads a file and parses its contents with `parse_format_config`.
auto load_format_config(const std::filesystem::path& path,
                        format_config base = {})
  -> caf::expected<format_config>;

} // namespace ingest
