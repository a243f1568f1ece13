//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ingest::detail {

/// Checks whether a character is ASCII whitespace.
constexpr auto is_space(char c) -> bool {
  return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v'
         or c == '\f';
}

/// Removes leading and trailing whitespace.
auto trim(std::string_view str) -> std::string_view;

/// Checks whether a string consists only of whitespace.
auto is_blank(std::string_view str) -> bool;

/// Returns an ASCII-lowercased copy of a string.
auto to_lower(std::string_view str) -> std::string;

/// Compares two strings ASCII-case-insensitively.
auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

/// Splits a string at every occurrence of a separator.
/// @param str The string to split.
/// @param sep The separator.
/// @param skip_empty Whether to drop empty parts.
auto split(std::string_view str, std::string_view sep, bool skip_empty = false)
  -> std::vector<std::string_view>;

/// Escapes a string so that it can be embedded in a JSON string literal. The
/// surrounding quotes are not added.
auto json_escape(std::string_view str) -> std::string;

/// Escapes the XML markup characters of text or attribute content.
auto xml_escape(std::string_view str, bool attribute = false) -> std::string;

/// Appends the UTF-8 encoding of a code point.
void append_utf8(std::string& out, char32_t code_point);

} // namespace ingest::detail
