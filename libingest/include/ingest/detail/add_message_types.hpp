//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace ingest::detail {

/// Registers the CAF meta objects of all types that ingest errors can carry.
/// Must be called once before any `caf::error` is rendered.
void add_message_types();

} // namespace ingest::detail
