//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/format_config.hpp"

#include "ingest/detail/string.hpp"
#include "ingest/error.hpp"
#include "ingest/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

#include <yaml-cpp/yaml.h>

namespace ingest {

namespace {

/// Lowercases a key and drops word separators so that `hasHeader`,
/// `HasHeader`, and `has_header` compare equal.
auto normalize_key(std::string_view key) -> std::string {
  auto result = std::string{};
  for (auto c : detail::to_lower(key)) {
    if (c != '_' and c != '-') {
      result += c;
    }
  }
  return result;
}

auto type_error(std::string_view key, std::string_view expected)
  -> caf::error {
  return caf::make_error(ec::invalid_configuration,
                         fmt::format("option '{}' must be {}", key, expected));
}

auto to_string_option(std::string_view key, const YAML::Node& node)
  -> caf::expected<std::optional<std::string>> {
  if (node.IsNull()) {
    return std::optional<std::string>{};
  }
  if (not node.IsScalar()) {
    return type_error(key, "a string");
  }
  return std::optional<std::string>{node.Scalar()};
}

auto to_bool_option(std::string_view key, const YAML::Node& node)
  -> caf::expected<bool> {
  auto result = false;
  if (not node.IsScalar() or not YAML::convert<bool>::decode(node, result)) {
    return type_error(key, "a boolean");
  }
  return result;
}

auto to_integer_option(std::string_view key, const YAML::Node& node)
  -> caf::expected<int64_t> {
  auto result = int64_t{0};
  if (not node.IsScalar() or not YAML::convert<int64_t>::decode(node, result)) {
    return type_error(key, "an integer");
  }
  return result;
}

using option_setter
  = caf::error (*)(format_config&, std::string_view, const YAML::Node&);

/// Sets a string option; null keeps the default.
template <std::string format_config::*Member>
auto set_string(format_config& cfg, std::string_view key,
                const YAML::Node& node) -> caf::error {
  auto value = to_string_option(key, node);
  if (not value) {
    return std::move(value.error());
  }
  if (*value) {
    cfg.*Member = std::move(**value);
  }
  return {};
}

template <std::optional<std::string> format_config::*Member>
auto set_optional_string(format_config& cfg, std::string_view key,
                         const YAML::Node& node) -> caf::error {
  auto value = to_string_option(key, node);
  if (not value) {
    return std::move(value.error());
  }
  cfg.*Member = std::move(*value);
  return {};
}

template <bool format_config::*Member>
auto set_bool(format_config& cfg, std::string_view key, const YAML::Node& node)
  -> caf::error {
  auto value = to_bool_option(key, node);
  if (not value) {
    return std::move(value.error());
  }
  cfg.*Member = *value;
  return {};
}

auto set_skip_rows(format_config& cfg, std::string_view key,
                   const YAML::Node& node) -> caf::error {
  auto value = to_integer_option(key, node);
  if (not value) {
    return std::move(value.error());
  }
  if (*value < 0) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("option '{}' must not be negative, got "
                                       "{}",
                                       key, *value));
  }
  cfg.skip_rows = *value;
  return {};
}

struct option {
  std::string_view name;
  option_setter set;
};

// Names are in normalized form.
constexpr option options[] = {
  {"delimiter", set_string<&format_config::delimiter>},
  {"quotechar", set_string<&format_config::quote_char>},
  {"encoding", set_string<&format_config::encoding>},
  {"hasheader", set_bool<&format_config::has_header>},
  {"skiprows", set_skip_rows},
  {"trimwhitespace", set_bool<&format_config::trim_whitespace>},
  {"nullvalue", set_optional_string<&format_config::null_value>},
  {"isjsonlines", set_bool<&format_config::is_json_lines>},
  {"datarootpath", set_optional_string<&format_config::data_root_path>},
  {"recordelement", set_optional_string<&format_config::record_element>},
  {"xmlnamespace", set_optional_string<&format_config::xml_namespace>},
};

} // namespace

auto parse_format_config(std::string_view text, format_config base)
  -> caf::expected<format_config> {
  auto result = std::move(base);
  if (detail::is_blank(text)) {
    return result;
  }
  auto root = YAML::Node{};
  try {
    root = YAML::Load(std::string{text});
  } catch (const YAML::Exception& err) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse format configuration: "
                                       "{}",
                                       err.what()));
  }
  if (root.IsNull()) {
    return result;
  }
  if (not root.IsMap()) {
    return caf::make_error(ec::invalid_configuration,
                           "format configuration must be a mapping");
  }
  for (const auto& entry : root) {
    if (not entry.first.IsScalar()) {
      return caf::make_error(ec::invalid_configuration,
                             "format configuration keys must be strings");
    }
    const auto& key = entry.first.Scalar();
    auto normalized = normalize_key(key);
    const auto* it = std::find_if(std::begin(options), std::end(options),
                                  [&](const option& x) {
                                    return x.name == normalized;
                                  });
    if (it == std::end(options)) {
      INGEST_WARN("ignoring unknown format configuration option '{}'", key);
      continue;
    }
    if (auto err = it->set(result, key, entry.second)) {
      return err;
    }
  }
  INGEST_DEBUG("parsed format configuration with {} options", root.size());
  return result;
}

auto load_format_config(const std::filesystem::path& path,
                        format_config base) -> caf::expected<format_config> {
  auto err = std::error_code{};
  if (not std::filesystem::exists(path, err)) {
    return caf::make_error(ec::no_such_file,
                           fmt::format("format configuration file '{}' does "
                                       "not exist",
                                       path.string()));
  }
  auto input = std::ifstream{path};
  if (not input) {
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to open format configuration "
                                       "file '{}'",
                                       path.string()));
  }
  auto buffer = std::stringstream{};
  buffer << input.rdbuf();
  auto result = parse_format_config(buffer.str(), std::move(base));
  if (not result) {
    return add_context(result.error(), "{}", path.string());
  }
  return result;
}

} // namespace ingest
