//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/detail/add_message_types.hpp"

#include "ingest/error.hpp"
#include "ingest/fwd.hpp"

#include <caf/init_global_meta_objects.hpp>

namespace ingest::detail {

void add_message_types() {
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::ingest_types>();
}

} // namespace ingest::detail
