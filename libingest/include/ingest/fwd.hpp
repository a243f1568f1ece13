//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/config.hpp"

#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>

#define INGEST_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(ingest_types, type)

namespace ingest {

// -- classes ------------------------------------------------------------------

class import_parser;
class record;
class text_reader;

// -- structs ------------------------------------------------------------------

struct format_config;
struct parsed_row;
struct preview_result;

// -- enum classes -------------------------------------------------------------

enum class ec : uint8_t;
enum class text_encoding : uint8_t;

// -- templates ----------------------------------------------------------------

template <class T>
class generator;

} // namespace ingest

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_ingest_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(ingest_types, first_ingest_type_id)

  INGEST_ADD_TYPE_ID((ingest::ec))

CAF_END_TYPE_ID_BLOCK(ingest_types)

#undef INGEST_ADD_TYPE_ID
