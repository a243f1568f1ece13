//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/text_reader.hpp"

#include "ingest/defaults.hpp"
#include "ingest/detail/string.hpp"
#include "ingest/logger.hpp"

namespace ingest {

namespace {

constexpr auto replacement_character = char32_t{0xFFFD};

struct encoding_name {
  std::string_view name;
  text_encoding encoding;
};

constexpr encoding_name encoding_names[] = {
  {"utf-8", text_encoding::utf8},       {"utf8", text_encoding::utf8},
  {"utf-16", text_encoding::utf16le},   {"utf16", text_encoding::utf16le},
  {"unicode", text_encoding::utf16le},  {"utf-16le", text_encoding::utf16le},
  {"utf-16be", text_encoding::utf16be}, {"utf16be", text_encoding::utf16be},
  {"ascii", text_encoding::ascii},      {"us-ascii", text_encoding::ascii},
  {"iso-8859-1", text_encoding::latin1}, {"latin1", text_encoding::latin1},
};

} // namespace

auto to_string(text_encoding x) -> std::string_view {
  switch (x) {
    case text_encoding::utf8:
      return "UTF-8";
    case text_encoding::utf16le:
      return "UTF-16LE";
    case text_encoding::utf16be:
      return "UTF-16BE";
    case text_encoding::ascii:
      return "ASCII";
    case text_encoding::latin1:
      return "ISO-8859-1";
  }
  return "unknown";
}

auto parse_encoding(std::string_view name) -> std::optional<text_encoding> {
  auto normalized = detail::to_lower(detail::trim(name));
  for (const auto& [candidate, encoding] : encoding_names) {
    if (candidate == normalized) {
      return encoding;
    }
  }
  return std::nullopt;
}

auto resolve_encoding(std::string_view name) -> text_encoding {
  if (detail::is_blank(name)) {
    return text_encoding::utf8;
  }
  if (auto result = parse_encoding(name)) {
    return *result;
  }
  INGEST_WARN("unsupported encoding '{}', falling back to UTF-8", name);
  return text_encoding::utf8;
}

text_reader::text_reader(std::istream& input, text_encoding encoding)
  : input_{input}, encoding_{encoding} {
  // nop
}

auto text_reader::read_line() -> std::optional<std::string> {
  while (true) {
    auto i = buffer_.find_first_of("\r\n", pos_);
    if (i != std::string::npos) {
      // A trailing carriage return may be the first half of a CRLF pair that
      // straddles two chunks.
      if (buffer_[i] == '\r' and i + 1 == buffer_.size() and not exhausted_) {
        if (fill()) {
          continue;
        }
      }
      auto line = buffer_.substr(pos_, i - pos_);
      pos_ = i + 1;
      if (buffer_[i] == '\r' and pos_ < buffer_.size()
          and buffer_[pos_] == '\n') {
        ++pos_;
      }
      if (pos_ > buffer_.size() / 2) {
        buffer_.erase(0, pos_);
        pos_ = 0;
      }
      return line;
    }
    if (not fill()) {
      if (pos_ < buffer_.size()) {
        auto line = buffer_.substr(pos_);
        buffer_.clear();
        pos_ = 0;
        return line;
      }
      return std::nullopt;
    }
  }
}

auto text_reader::read_to_end() -> std::string {
  while (fill()) {
    // nop
  }
  auto result = buffer_.substr(pos_);
  buffer_.clear();
  pos_ = 0;
  return result;
}

auto text_reader::fill() -> bool {
  if (exhausted_) {
    return false;
  }
  raw_.resize(defaults::read_chunk_size);
  input_.read(raw_.data(), static_cast<std::streamsize>(raw_.size()));
  raw_.resize(static_cast<size_t>(input_.gcount()));
  if (not input_) {
    exhausted_ = true;
  }
  auto bytes = std::string_view{raw_};
  if (not bom_checked_) {
    pending_.append(bytes);
    // Wait for enough bytes to recognize the longest byte order mark.
    if (pending_.size() < 3 and not exhausted_) {
      return true;
    }
    raw_ = std::exchange(pending_, {});
    bytes = raw_;
    detect_byte_order_mark();
    switch (encoding_) {
      case text_encoding::utf8:
        if (bytes.starts_with("\xEF\xBB\xBF")) {
          bytes.remove_prefix(3);
        }
        break;
      case text_encoding::utf16le:
        if (bytes.starts_with("\xFF\xFE")) {
          bytes.remove_prefix(2);
        }
        break;
      case text_encoding::utf16be:
        if (bytes.starts_with("\xFE\xFF")) {
          bytes.remove_prefix(2);
        }
        break;
      case text_encoding::ascii:
      case text_encoding::latin1:
        break;
    }
  }
  decode(bytes);
  if (exhausted_ and (not pending_.empty() or high_surrogate_ != 0)) {
    // Truncated code unit at the end of the input.
    detail::append_utf8(buffer_, replacement_character);
    pending_.clear();
    high_surrogate_ = 0;
  }
  return not bytes.empty() or not exhausted_;
}

void text_reader::detect_byte_order_mark() {
  bom_checked_ = true;
  auto configured = encoding_;
  auto bytes = std::string_view{raw_};
  if (bytes.starts_with("\xEF\xBB\xBF")) {
    encoding_ = text_encoding::utf8;
  } else if (bytes.starts_with("\xFF\xFE")) {
    encoding_ = text_encoding::utf16le;
  } else if (bytes.starts_with("\xFE\xFF")) {
    encoding_ = text_encoding::utf16be;
  }
  if (encoding_ != configured) {
    INGEST_VERBOSE("byte order mark overrides encoding {} with {}",
                   to_string(configured), to_string(encoding_));
  }
}

void text_reader::decode(std::string_view bytes) {
  switch (encoding_) {
    case text_encoding::utf8:
      buffer_.append(bytes);
      return;
    case text_encoding::ascii:
      for (auto c : bytes) {
        buffer_ += static_cast<unsigned char>(c) < 0x80 ? c : '?';
      }
      return;
    case text_encoding::latin1:
      for (auto c : bytes) {
        detail::append_utf8(buffer_, static_cast<unsigned char>(c));
      }
      return;
    case text_encoding::utf16le:
      decode_utf16(bytes, true);
      return;
    case text_encoding::utf16be:
      decode_utf16(bytes, false);
      return;
  }
}

void text_reader::decode_utf16(std::string_view bytes, bool little_endian) {
  pending_.append(bytes);
  auto i = size_t{0};
  for (; i + 1 < pending_.size(); i += 2) {
    auto first = static_cast<unsigned char>(pending_[i]);
    auto second = static_cast<unsigned char>(pending_[i + 1]);
    auto unit = little_endian ? char32_t(first | (second << 8))
                              : char32_t((first << 8) | second);
    if (unit >= 0xD800 and unit <= 0xDBFF) {
      if (high_surrogate_ != 0) {
        detail::append_utf8(buffer_, replacement_character);
      }
      high_surrogate_ = unit;
      continue;
    }
    if (unit >= 0xDC00 and unit <= 0xDFFF) {
      if (high_surrogate_ == 0) {
        detail::append_utf8(buffer_, replacement_character);
        continue;
      }
      auto code_point
        = 0x10000 + ((high_surrogate_ - 0xD800) << 10) + (unit - 0xDC00);
      high_surrogate_ = 0;
      detail::append_utf8(buffer_, code_point);
      continue;
    }
    if (high_surrogate_ != 0) {
      detail::append_utf8(buffer_, replacement_character);
      high_surrogate_ = 0;
    }
    detail::append_utf8(buffer_, unit);
  }
  pending_.erase(0, i);
}

} // namespace ingest
