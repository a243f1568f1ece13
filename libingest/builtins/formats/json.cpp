//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/detail/string.hpp"
#include "ingest/error.hpp"
#include "ingest/formats.hpp"
#include "ingest/logger.hpp"
#include "ingest/text_reader.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <string>
#include <string_view>
#include <vector>

#include <simdjson.h>

namespace ingest {

namespace {

using simdjson::ondemand::json_type;
using simdjson::ondemand::number_type;

auto kind_name(json_type type) -> std::string_view {
  switch (type) {
    case json_type::array:
      return "array";
    case json_type::object:
      return "object";
    case json_type::number:
      return "number";
    case json_type::string:
      return "string";
    case json_type::boolean:
      return "boolean";
    case json_type::null:
      return "null";
    default:
      return "unknown";
  }
}

auto make_json_error(simdjson::error_code code) -> caf::error {
  return caf::make_error(ec::parse_error, simdjson::error_message(code));
}

/// Renders an array or object as minified JSON text.
auto to_json_text(auto&& val) -> caf::expected<std::string> {
  auto raw = std::string_view{};
  if (auto error = simdjson::to_json_string(val).get(raw)) {
    return make_json_error(error);
  }
  auto result = std::string(raw.size(), '\0');
  auto length = size_t{0};
  if (auto error
      = simdjson::minify(raw.data(), raw.size(), result.data(), length)) {
    return make_json_error(error);
  }
  result.resize(length);
  return result;
}

/// Integers that fit into 64 signed bits stay integral. All other numbers,
/// including integers beyond 64 bits, become doubles.
auto to_number(auto&& val) -> caf::expected<data> {
  auto kind = number_type{};
  if (auto error = val.get_number_type().get(kind)) {
    return make_json_error(error);
  }
  switch (kind) {
    case number_type::signed_integer: {
      auto result = int64_t{0};
      if (auto error = val.get_int64().get(result)) {
        return make_json_error(error);
      }
      return data{result};
    }
    case number_type::unsigned_integer: {
      auto result = uint64_t{0};
      if (auto error = val.get_uint64().get(result)) {
        return make_json_error(error);
      }
      return data{static_cast<double>(result)};
    }
    case number_type::floating_point_number:
    case number_type::big_integer: {
      auto result = 0.0;
      if (auto error = val.get_double().get(result)) {
        return make_json_error(error);
      }
      return data{result};
    }
  }
  return make_json_error(simdjson::NUMBER_ERROR);
}

/// Converts a JSON value into a column value. Arrays and objects become their
/// minified JSON text.
auto to_data(auto&& val) -> caf::expected<data> {
  auto type = json_type{};
  if (auto error = val.type().get(type)) {
    return make_json_error(error);
  }
  switch (type) {
    case json_type::null: {
      auto null = false;
      if (auto error = val.is_null().get(null)) {
        return make_json_error(error);
      }
      if (not null) {
        return make_json_error(simdjson::N_ATOM_ERROR);
      }
      return data{caf::none};
    }
    case json_type::boolean: {
      auto result = false;
      if (auto error = val.get_bool().get(result)) {
        return make_json_error(error);
      }
      return data{result};
    }
    case json_type::number:
      return to_number(val);
    case json_type::string: {
      auto result = std::string_view{};
      if (auto error = val.get_string().get(result)) {
        return make_json_error(error);
      }
      return data{std::string{result}};
    }
    case json_type::array:
    case json_type::object: {
      auto text = to_json_text(val);
      if (not text) {
        return std::move(text.error());
      }
      return data{std::move(*text)};
    }
    default:
      return make_json_error(simdjson::TAPE_ERROR);
  }
}

/// Flattens an object into a record. Other values become a record with the
/// single column `value`.
auto to_record(auto&& val) -> caf::expected<record> {
  auto result = record{};
  auto type = json_type{};
  if (auto error = val.type().get(type)) {
    return make_json_error(error);
  }
  if (type != json_type::object) {
    auto value = to_data(val);
    if (not value) {
      return std::move(value.error());
    }
    result.insert_or_assign("value", std::move(*value));
    return result;
  }
  auto object = simdjson::ondemand::object{};
  if (auto error = val.get_object().get(object)) {
    return make_json_error(error);
  }
  for (auto field : object) {
    auto key = std::string_view{};
    if (auto error = field.unescaped_key().get(key)) {
      return make_json_error(error);
    }
    auto name = std::string{key};
    auto value = field.value();
    if (value.error()) {
      return make_json_error(value.error());
    }
    auto converted = to_data(value.value_unsafe());
    if (not converted) {
      return std::move(converted.error());
    }
    result.insert_or_assign(std::move(name), std::move(*converted));
  }
  return result;
}

/// Splits a data root path into object keys. A leading `$` or `$.` is
/// ignored, and so are empty segments.
auto path_segments(std::string_view path) -> std::vector<std::string_view> {
  if (path.starts_with("$.")) {
    path.remove_prefix(2);
  } else if (path.starts_with("$")) {
    path.remove_prefix(1);
  }
  return detail::split(path, ".", true);
}

/// Follows a non-empty sequence of object keys from the document root.
auto navigate(simdjson::ondemand::document& doc,
              const std::vector<std::string_view>& segments)
  -> caf::expected<simdjson::ondemand::value> {
  auto cannot_navigate = [](json_type type, std::string_view segment) {
    return caf::make_error(ec::lookup_error,
                           fmt::format("Cannot navigate into {} at segment "
                                       "'{}'",
                                       kind_name(type), segment));
  };
  auto type = json_type{};
  if (auto error = doc.type().get(type)) {
    return make_json_error(error);
  }
  if (type != json_type::object) {
    return cannot_navigate(type, segments.front());
  }
  auto object = simdjson::ondemand::object{};
  if (auto error = doc.get_object().get(object)) {
    return make_json_error(error);
  }
  auto current = simdjson::ondemand::value{};
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) {
      if (auto error = current.type().get(type)) {
        return make_json_error(error);
      }
      if (type != json_type::object) {
        return cannot_navigate(type, segments[i]);
      }
      if (auto error = current.get_object().get(object)) {
        return make_json_error(error);
      }
    }
    auto error = object.find_field_unordered(segments[i]).get(current);
    if (error == simdjson::NO_SUCH_FIELD) {
      return caf::make_error(ec::lookup_error,
                             fmt::format("Path segment '{}' not found",
                                         segments[i]));
    }
    if (error) {
      return make_json_error(error);
    }
  }
  return current;
}

/// Converts the records below a root value. The whole target is converted
/// before the first row is produced, so a malformed document yields no
/// partial rows.
auto collect_records(auto& root, const std::stop_token& stop)
  -> caf::expected<std::vector<record>> {
  auto type = json_type{};
  if (auto error = root.type().get(type)) {
    return make_json_error(error);
  }
  auto result = std::vector<record>{};
  switch (type) {
    case json_type::array: {
      auto array = simdjson::ondemand::array{};
      if (auto error = root.get_array().get(array)) {
        return make_json_error(error);
      }
      for (auto element : array) {
        if (stop.stop_requested()) {
          throw operation_cancelled{};
        }
        if (element.error()) {
          return make_json_error(element.error());
        }
        auto columns = to_record(element.value_unsafe());
        if (not columns) {
          return std::move(columns.error());
        }
        result.push_back(std::move(*columns));
      }
      return result;
    }
    case json_type::object: {
      auto columns = to_record(root);
      if (not columns) {
        return std::move(columns.error());
      }
      result.push_back(std::move(*columns));
      return result;
    }
    default:
      return caf::make_error(ec::type_clash,
                             fmt::format("Expected JSON array or object, got "
                                         "{}",
                                         kind_name(type)));
  }
}

/// Converts the records of a whole document, starting at the data root.
auto collect_document(simdjson::ondemand::parser& parser,
                      simdjson::padded_string& json,
                      const format_config& config, const std::stop_token& stop)
  -> caf::expected<std::vector<record>> {
  auto doc = simdjson::ondemand::document{};
  if (auto error = parser.iterate(json).get(doc)) {
    return make_json_error(error);
  }
  auto segments = config.data_root_path
                    ? path_segments(*config.data_root_path)
                    : std::vector<std::string_view>{};
  if (segments.empty()) {
    auto records = collect_records(doc, stop);
    if (records and not doc.at_end()) {
      return make_json_error(simdjson::TRAILING_CONTENT);
    }
    return records;
  }
  auto target = navigate(doc, segments);
  if (not target) {
    return std::move(target.error());
  }
  return collect_records(*target, stop);
}

auto parse_document(text_reader& reader, const format_config& config,
                    std::stop_token stop) -> generator<parsed_row> {
  auto json = simdjson::padded_string{reader.read_to_end()};
  auto parser = simdjson::ondemand::parser{};
  auto records = collect_document(parser, json, config, stop);
  if (not records) {
    co_yield parsed_row::make_error(
      0, fmt::format("JSON parse error: {}", message(records.error())));
    co_return;
  }
  auto line_number = int64_t{0};
  for (auto& columns : *records) {
    if (stop.stop_requested()) {
      throw operation_cancelled{};
    }
    co_yield parsed_row::make(++line_number, std::move(columns));
  }
  INGEST_DEBUG("json parser read {} records", line_number);
}

/// Parses a single line as a standalone JSON document.
auto parse_line(simdjson::ondemand::parser& parser, std::string_view line)
  -> caf::expected<record> {
  auto padded = simdjson::padded_string{line};
  auto doc = simdjson::ondemand::document{};
  if (auto error = parser.iterate(padded).get(doc)) {
    return make_json_error(error);
  }
  auto columns = to_record(doc);
  if (columns and not doc.at_end()) {
    return make_json_error(simdjson::TRAILING_CONTENT);
  }
  return columns;
}

auto parse_lines(text_reader& reader, std::stop_token stop)
  -> generator<parsed_row> {
  auto parser = simdjson::ondemand::parser{};
  auto line_number = int64_t{0};
  while (true) {
    if (stop.stop_requested()) {
      throw operation_cancelled{};
    }
    auto line = reader.read_line();
    if (not line) {
      break;
    }
    ++line_number;
    if (detail::is_blank(*line)) {
      continue;
    }
    auto columns = parse_line(parser, *line);
    if (not columns) {
      co_yield parsed_row::make_error(
        line_number,
        fmt::format("Line {}: {}", line_number, message(columns.error())));
      continue;
    }
    co_yield parsed_row::make(line_number, std::move(*columns));
  }
}

} // namespace

auto json_parser::name() const -> std::string {
  return "JSON";
}

auto json_parser::parse(std::istream& input, format_config config,
                        std::stop_token stop) const -> generator<parsed_row> {
  auto reader = text_reader{input, resolve_encoding(config.encoding)};
  auto rows = config.is_json_lines ? parse_lines(reader, stop)
                                   : parse_document(reader, config, stop);
  for (auto&& row : rows) {
    co_yield std::move(row);
  }
}

} // namespace ingest
