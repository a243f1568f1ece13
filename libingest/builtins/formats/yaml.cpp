//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/defaults.hpp"
#include "ingest/detail/string.hpp"
#include "ingest/error.hpp"
#include "ingest/formats.hpp"
#include "ingest/logger.hpp"
#include "ingest/text_reader.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace ingest {

namespace {

auto kind_name(const YAML::Node& node) -> std::string_view {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return "null";
    case YAML::NodeType::Scalar:
      return "scalar";
    case YAML::NodeType::Sequence:
      return "list";
    case YAML::NodeType::Map:
      return "object";
    default:
      return "undefined";
  }
}

auto load(std::string_view text) -> caf::expected<YAML::Node> {
  try {
    return YAML::Load(std::string{text});
  } catch (const YAML::Exception& err) {
    return caf::make_error(ec::parse_error, err.what());
  }
}

auto key_name(const YAML::Node& key) -> std::string {
  return key.IsScalar() ? key.Scalar() : std::string{"null"};
}

/// Renders a node as compact JSON. Scalars become JSON strings.
auto append_json(std::string& out, const YAML::Node& node, size_t depth)
  -> caf::error {
  if (depth > defaults::max_recursion) {
    return caf::make_error(ec::format_error,
                           fmt::format("nesting exceeds the maximum depth of "
                                       "{}",
                                       defaults::max_recursion));
  }
  switch (node.Type()) {
    case YAML::NodeType::Scalar:
      out += '"';
      out += detail::json_escape(node.Scalar());
      out += '"';
      return {};
    case YAML::NodeType::Sequence: {
      out += '[';
      auto first = true;
      for (const auto& item : node) {
        if (not std::exchange(first, false)) {
          out += ',';
        }
        if (auto err = append_json(out, item, depth + 1)) {
          return err;
        }
      }
      out += ']';
      return {};
    }
    case YAML::NodeType::Map: {
      out += '{';
      auto first = true;
      for (const auto& entry : node) {
        if (not std::exchange(first, false)) {
          out += ',';
        }
        out += '"';
        out += detail::json_escape(key_name(entry.first));
        out += "\":";
        if (auto err = append_json(out, entry.second, depth + 1)) {
          return err;
        }
      }
      out += '}';
      return {};
    }
    default:
      out += "null";
      return {};
  }
}

/// Converts a node into a column value. Scalars stay text, YAML nulls become
/// null, and collections become their JSON text.
auto to_data(const YAML::Node& node) -> caf::expected<data> {
  if (node.IsNull()) {
    return data{};
  }
  if (node.IsScalar()) {
    return data{node.Scalar()};
  }
  auto result = std::string{};
  if (auto err = append_json(result, node, 1)) {
    return err;
  }
  return data{std::move(result)};
}

/// Flattens a mapping into a record. Other values become a record with the
/// single column `value`.
auto to_record(const YAML::Node& node) -> caf::expected<record> {
  auto result = record{};
  if (not node.IsMap()) {
    auto value = to_data(node);
    if (not value) {
      return std::move(value.error());
    }
    result.insert_or_assign("value", std::move(*value));
    return result;
  }
  for (const auto& entry : node) {
    auto value = to_data(entry.second);
    if (not value) {
      return add_context(value.error(), "key '{}'", key_name(entry.first));
    }
    result.insert_or_assign(key_name(entry.first), std::move(*value));
  }
  return result;
}

/// Follows a dot-separated path of mapping keys. Leading `$` and `.`
/// characters are ignored, and so are empty segments.
auto navigate(YAML::Node root, std::string_view path)
  -> caf::expected<YAML::Node> {
  path.remove_prefix(std::min(path.find_first_not_of('$'), path.size()));
  path.remove_prefix(std::min(path.find_first_not_of('.'), path.size()));
  auto current = root;
  for (auto segment : detail::split(path, ".", true)) {
    if (not current.IsMap()) {
      return caf::make_error(ec::lookup_error,
                             fmt::format("Cannot navigate into {} at segment "
                                         "'{}'",
                                         kind_name(current), segment));
    }
    auto found = false;
    for (const auto& entry : current) {
      if (entry.first.IsScalar() and entry.first.Scalar() == segment) {
        // Assignment would overwrite the referenced node, so rebind instead.
        current.reset(entry.second);
        found = true;
        break;
      }
    }
    if (not found) {
      return caf::make_error(ec::lookup_error,
                             fmt::format("Key '{}' not found in YAML object",
                                         segment));
    }
  }
  return current;
}

} // namespace

auto yaml_parser::name() const -> std::string {
  return "YAML";
}

auto yaml_parser::parse(std::istream& input, format_config config,
                        std::stop_token stop) const -> generator<parsed_row> {
  auto reader = text_reader{input, resolve_encoding(config.encoding)};
  auto root = load(reader.read_to_end());
  if (not root) {
    co_yield parsed_row::make_error(
      0, fmt::format("YAML parse error: {}", message(root.error())));
    co_return;
  }
  if (not root->IsDefined() or root->IsNull()) {
    INGEST_WARN("yaml parser: document is empty");
    co_return;
  }
  auto target = *root;
  if (config.data_root_path and not detail::is_blank(*config.data_root_path)) {
    auto navigated = navigate(*root, *config.data_root_path);
    if (not navigated) {
      co_yield parsed_row::make_error(
        0, fmt::format("YAML structure error: {}", message(navigated.error())));
      co_return;
    }
    target.reset(*navigated);
  }
  auto emit = [](int64_t line_number, const YAML::Node& node) {
    auto columns = to_record(node);
    if (not columns) {
      return parsed_row::make_error(
        line_number,
        fmt::format("Line {}: {}", line_number, message(columns.error())));
    }
    return parsed_row::make(line_number, std::move(*columns));
  };
  if (target.IsSequence()) {
    auto line_number = int64_t{0};
    for (const auto& item : target) {
      if (stop.stop_requested()) {
        throw operation_cancelled{};
      }
      ++line_number;
      co_yield emit(line_number, item);
    }
    INGEST_DEBUG("yaml parser read {} records", line_number);
  } else if (target.IsMap()) {
    if (stop.stop_requested()) {
      throw operation_cancelled{};
    }
    co_yield emit(1, target);
  } else {
    co_yield parsed_row::make_error(
      0, fmt::format("YAML structure error: Expected a list or object, got {}",
                     kind_name(target)));
  }
}

} // namespace ingest
