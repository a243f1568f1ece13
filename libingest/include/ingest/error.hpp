//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <exception>
#include <string>
#include <type_traits>

namespace ingest {

/// The error codes of the ingest library.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// Requested file does not exist.
  no_such_file,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// Expected a different type.
  type_clash,
  /// Failure during parsing.
  parse_error,
  /// An error with an input format.
  format_error,
  /// Exhausted the input.
  end_of_input,
  /// An expression does not adhere to the expected syntax.
  syntax_error,
  /// A dictionary or table lookup failed to return a value.
  lookup_error,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// A function received an invalid argument.
  invalid_argument,
  /// A configuration was invalid.
  invalid_configuration,
  /// The command line contained an unrecognized option.
  unrecognized_option,
  /// Encountered a currently unimplemented code path or missing feature.
  unimplemented,
  /// An error from interacting with the operating system.
  system_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

template <class Inspector>
auto inspect(Inspector& f, ec& x) -> bool {
  using underlying = std::underlying_type_t<ec>;
  auto get = [&x] {
    return static_cast<underlying>(x);
  };
  auto set = [&x](underlying value) {
    if (value >= static_cast<underlying>(ec::ec_count)) {
      return false;
    }
    x = static_cast<ec>(value);
    return true;
  };
  return f.apply(get, set);
}

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

/// Returns only the context of an error, i.e., the human-readable message
/// without the leading error code.
auto message(const caf::error& err) -> std::string;

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

/// Thrown out of a row sequence when its stop token was triggered.
class operation_cancelled : public std::exception {
public:
  auto what() const noexcept -> const char* override {
    return "the operation was cancelled";
  }
};

} // namespace ingest

CAF_ERROR_CODE_ENUM(ingest::ec)
