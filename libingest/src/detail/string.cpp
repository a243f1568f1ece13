//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/detail/string.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace ingest {
namespace detail {

auto trim(std::string_view str) -> std::string_view {
  while (not str.empty() and is_space(str.front())) {
    str.remove_prefix(1);
  }
  while (not str.empty() and is_space(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

auto is_blank(std::string_view str) -> bool {
  return std::all_of(str.begin(), str.end(), is_space);
}

auto to_lower(std::string_view str) -> std::string {
  auto result = std::string{};
  result.reserve(str.size());
  for (auto c : str) {
    result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
  return lhs.size() == rhs.size()
         and std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                        [](char x, char y) {
                          return std::tolower(static_cast<unsigned char>(x))
                                 == std::tolower(static_cast<unsigned char>(y));
                        });
}

auto split(std::string_view str, std::string_view sep, bool skip_empty)
  -> std::vector<std::string_view> {
  auto result = std::vector<std::string_view>{};
  if (sep.empty()) {
    if (not str.empty() or not skip_empty) {
      result.push_back(str);
    }
    return result;
  }
  while (true) {
    auto pos = str.find(sep);
    auto part = str.substr(0, pos);
    if (not part.empty() or not skip_empty) {
      result.push_back(part);
    }
    if (pos == std::string_view::npos) {
      break;
    }
    str.remove_prefix(pos + sep.size());
  }
  return result;
}

auto json_escape(std::string_view str) -> std::string {
  auto result = std::string{};
  result.reserve(str.size());
  auto out = std::back_inserter(result);
  for (auto c : str) {
    switch (c) {
      case '"':
        result += "\\\"";
        break;
      case '\\':
        result += "\\\\";
        break;
      case '\b':
        result += "\\b";
        break;
      case '\f':
        result += "\\f";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          fmt::format_to(out, "\\u{:04x}", static_cast<unsigned char>(c));
        } else {
          result += c;
        }
    }
  }
  return result;
}

auto xml_escape(std::string_view str, bool attribute) -> std::string {
  auto result = std::string{};
  result.reserve(str.size());
  for (auto c : str) {
    switch (c) {
      case '&':
        result += "&amp;";
        break;
      case '<':
        result += "&lt;";
        break;
      case '>':
        result += "&gt;";
        break;
      case '"':
        result += attribute ? "&quot;" : "\"";
        break;
      default:
        result += c;
    }
  }
  return result;
}

void append_utf8(std::string& out, char32_t code_point) {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

} // namespace detail
} // namespace ingest
