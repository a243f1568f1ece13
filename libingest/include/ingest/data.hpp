//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include <caf/none.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace ingest {

/// The value of a single column. Nested source structures are not modeled;
/// they arrive as their serialized text.
class data {
public:
  /// The sum type of all possible column values.
  using variant = std::variant<caf::none_t, bool, int64_t, double, std::string>;

  /// Default-constructs null.
  data() = default;

  data(caf::none_t) {
    // nop
  }

  data(bool x) : data_{x} {
    // nop
  }

  data(int x) : data_{int64_t{x}} {
    // nop
  }

  data(int64_t x) : data_{x} {
    // nop
  }

  data(double x) : data_{x} {
    // nop
  }

  data(std::string x) : data_{std::move(x)} {
    // nop
  }

  data(std::string_view x) : data_{std::string{x}} {
    // nop
  }

  data(const char* x) : data_{std::string{x}} {
    // nop
  }

  friend auto operator==(const data& lhs, const data& rhs) -> bool = default;

  [[nodiscard]] auto get_data() -> variant& {
    return data_;
  }

  [[nodiscard]] auto get_data() const -> const variant& {
    return data_;
  }

  /// Checks whether the value is null.
  [[nodiscard]] auto is_null() const -> bool {
    return std::holds_alternative<caf::none_t>(data_);
  }

private:
  variant data_;
};

/// Checks whether a value holds an alternative.
/// @relates data
template <class T>
auto is(const data& x) -> bool {
  return std::holds_alternative<T>(x.get_data());
}

/// Returns a pointer to the held alternative, or `nullptr` if the value holds
/// a different alternative.
/// @relates data
template <class T>
auto try_as(const data& x) -> const T* {
  return std::get_if<T>(&x.get_data());
}

/// Renders a value as JSON. Strings become quoted JSON strings, null becomes
/// `null`, and non-finite floating-point numbers become `null`.
/// @relates data
auto to_json(const data& x) -> std::string;

/// Returns the kind of the held alternative, e.g., `string` or `int64`.
/// @relates data
auto kind_name(const data& x) -> std::string_view;

} // namespace ingest

template <>
struct fmt::formatter<ingest::data> {
  constexpr auto parse(fmt::format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const ingest::data& x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", ingest::to_json(x));
  }
};
