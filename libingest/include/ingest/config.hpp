//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

// -- log levels ---------------------------------------------------------------

#define INGEST_LOG_LEVEL_QUIET 0
#define INGEST_LOG_LEVEL_CRITICAL 1
#define INGEST_LOG_LEVEL_ERROR 2
#define INGEST_LOG_LEVEL_WARNING 3
#define INGEST_LOG_LEVEL_INFO 4
#define INGEST_LOG_LEVEL_VERBOSE 5
#define INGEST_LOG_LEVEL_DEBUG 6
#define INGEST_LOG_LEVEL_TRACE 7

// The build system passes the maximum compiled-in log level as a definition.
#ifndef INGEST_LOG_LEVEL
#  define INGEST_LOG_LEVEL INGEST_LOG_LEVEL_DEBUG
#endif

#define INGEST_VERSION "1.0.0"
