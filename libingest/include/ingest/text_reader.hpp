//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace ingest {

/// The character encodings an input stream may use.
enum class text_encoding : uint8_t {
  utf8,
  utf16le,
  utf16be,
  ascii,
  latin1,
};

/// @relates text_encoding
auto to_string(text_encoding x) -> std::string_view;

/// Looks up an encoding by one of its case-insensitive names.
/// @relates text_encoding
auto parse_encoding(std::string_view name) -> std::optional<text_encoding>;

/// Like `parse_encoding`, but falls back to UTF-8 for unknown names.
/// @relates text_encoding
auto resolve_encoding(std::string_view name) -> text_encoding;

/// Reads UTF-8 text from a byte stream in some source encoding. A byte order
/// mark at the beginning of the stream overrides the configured encoding and
/// is not part of the text. The reader never owns or closes the stream.
class text_reader {
public:
  text_reader(std::istream& input, text_encoding encoding);

  /// Returns the encoding in effect, which may differ from the configured one
  /// after byte order mark detection.
  [[nodiscard]] auto encoding() const -> text_encoding {
    return encoding_;
  }

  /// Reads the next line without its terminator. Lines end at `\n`, `\r\n`,
  /// or `\r`. A final line without terminator is returned as well.
  /// @returns the line or `std::nullopt` at the end of the input.
  auto read_line() -> std::optional<std::string>;

  /// Reads all remaining text.
  auto read_to_end() -> std::string;

private:
  /// Reads and decodes the next chunk of the stream.
  /// @returns `false` if the stream was exhausted.
  auto fill() -> bool;

  void detect_byte_order_mark();

  void decode(std::string_view bytes);

  void decode_utf16(std::string_view bytes, bool little_endian);

  std::istream& input_;
  text_encoding encoding_;
  bool bom_checked_ = false;
  bool exhausted_ = false;
  std::string raw_;
  std::string pending_;
  std::string buffer_;
  size_t pos_ = 0;
  char32_t high_surrogate_ = 0;
};

} // namespace ingest
