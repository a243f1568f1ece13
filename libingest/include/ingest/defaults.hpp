//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ingest::defaults {

// -- global constants ---------------------------------------------------------

/// Maximum nesting depth when rendering nested values as text.
/// Note: the value must be > 0.
inline constexpr size_t max_recursion = 100;

/// Number of bytes requested from an input stream at once.
inline constexpr size_t read_chunk_size = 64 * 1024;

// -- format configuration -----------------------------------------------------

namespace format {

/// The field separator for delimited text.
inline constexpr char delimiter = ',';

/// The quote character for delimited text.
inline constexpr char quote_char = '"';

/// The character encoding of the input.
inline constexpr std::string_view encoding = "UTF-8";

/// Whether the first delimited line names the columns.
inline constexpr bool has_header = true;

/// Whether to trim lines and fields of delimited text.
inline constexpr bool trim_whitespace = true;

/// Number of physical lines to discard before the header.
inline constexpr int64_t skip_rows = 0;

/// Whether JSON input contains one document per line.
inline constexpr bool is_json_lines = false;

/// The prefix bound to `format_config::xml_namespace` in record paths.
inline constexpr std::string_view xml_namespace_prefix = "ns";

/// Maximum element nesting depth of XML documents.
inline constexpr size_t xml_max_depth = 1000;

} // namespace format

// -- preview ------------------------------------------------------------------

namespace preview {

/// Maximum number of rows a preview retains.
inline constexpr size_t max_rows = 10;

} // namespace preview

// -- logger -------------------------------------------------------------------

namespace logger {

/// The default verbosity of console output.
inline constexpr std::string_view console_verbosity = "warning";

/// The default format of console output.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

} // namespace logger

} // namespace ingest::defaults
