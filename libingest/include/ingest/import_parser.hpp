//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/fwd.hpp"

#include "ingest/format_config.hpp"
#include "ingest/generator.hpp"
#include "ingest/parsed_row.hpp"

#include <istream>
#include <stop_token>
#include <string>

namespace ingest {

/// Turns a byte stream of one format into a lazy sequence of rows.
///
/// The returned generator borrows both the parser and the stream; both must
/// outlive it. Parsing starts with the first iteration and proceeds one
/// record per step. The stream is neither owned nor closed.
///
/// A malformed record produces an error row and parsing continues. A
/// malformed document produces exactly one error row with line number 0 and
/// ends the sequence. If `stop` is triggered, the next step throws
/// `operation_cancelled`.
class import_parser {
public:
  virtual ~import_parser() noexcept = default;

  /// Returns the canonical name of the format.
  [[nodiscard]] virtual auto name() const -> std::string = 0;

  /// Parses the stream with the given options.
  [[nodiscard]] virtual auto parse(std::istream& input, format_config config,
                                   std::stop_token stop = {}) const
    -> generator<parsed_row>
    = 0;
};

} // namespace ingest
