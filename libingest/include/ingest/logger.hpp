//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "ingest/config.hpp"
#include "ingest/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>

#include <memory>
#include <string>

// INGEST_INFO -> spdlog::info
// INGEST_VERBOSE -> spdlog::debug
// INGEST_DEBUG -> spdlog::trace

#if INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif INGEST_LOG_LEVEL == INGEST_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include <spdlog/spdlog.h>

namespace ingest::detail {

/// Returns the process-wide logger. Until `create_log_context` runs, this is
/// a logger that discards everything.
auto logger() -> std::shared_ptr<spdlog::logger>&;

} // namespace ingest::detail

#define INGEST_DISCARD_ARGS(...)                                               \
  do {                                                                         \
  } while (false)

#if INGEST_LOG_LEVEL >= INGEST_LOG_LEVEL_TRACE

#  define INGEST_TRACE(...)                                                    \
    SPDLOG_LOGGER_TRACE(::ingest::detail::logger(), __VA_ARGS__)

#else // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_TRACE

#  define INGEST_TRACE(...) INGEST_DISCARD_ARGS(__VA_ARGS__)

#endif // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_TRACE

#if INGEST_LOG_LEVEL >= INGEST_LOG_LEVEL_DEBUG

#  define INGEST_DEBUG(...)                                                    \
    SPDLOG_LOGGER_TRACE(::ingest::detail::logger(), __VA_ARGS__)

#else // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_DEBUG

#  define INGEST_DEBUG(...) INGEST_DISCARD_ARGS(__VA_ARGS__)

#endif // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_DEBUG

#if INGEST_LOG_LEVEL >= INGEST_LOG_LEVEL_VERBOSE

#  define INGEST_VERBOSE(...)                                                  \
    SPDLOG_LOGGER_DEBUG(::ingest::detail::logger(), __VA_ARGS__)

#else // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_VERBOSE

#  define INGEST_VERBOSE(...) INGEST_DISCARD_ARGS(__VA_ARGS__)

#endif // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_VERBOSE

#if INGEST_LOG_LEVEL >= INGEST_LOG_LEVEL_INFO

#  define INGEST_INFO(...)                                                     \
    SPDLOG_LOGGER_INFO(::ingest::detail::logger(), __VA_ARGS__)

#else // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_INFO

#  define INGEST_INFO(...) INGEST_DISCARD_ARGS(__VA_ARGS__)

#endif // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_INFO

#if INGEST_LOG_LEVEL >= INGEST_LOG_LEVEL_WARNING

#  define INGEST_WARN(...)                                                     \
    SPDLOG_LOGGER_WARN(::ingest::detail::logger(), __VA_ARGS__)

#else // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_WARNING

#  define INGEST_WARN(...) INGEST_DISCARD_ARGS(__VA_ARGS__)

#endif // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_WARNING

#if INGEST_LOG_LEVEL >= INGEST_LOG_LEVEL_ERROR

#  define INGEST_ERROR(...)                                                    \
    SPDLOG_LOGGER_ERROR(::ingest::detail::logger(), __VA_ARGS__)

#else // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_ERROR

#  define INGEST_ERROR(...) INGEST_DISCARD_ARGS(__VA_ARGS__)

#endif // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_ERROR

#if INGEST_LOG_LEVEL >= INGEST_LOG_LEVEL_CRITICAL

#  define INGEST_CRITICAL(...)                                                 \
    SPDLOG_LOGGER_CRITICAL(::ingest::detail::logger(), __VA_ARGS__)

#else // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_CRITICAL

#  define INGEST_CRITICAL(...) INGEST_DISCARD_ARGS(__VA_ARGS__)

#endif // INGEST_LOG_LEVEL < INGEST_LOG_LEVEL_CRITICAL

namespace ingest {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to make log level strings from config, like 'debug', to a log level int.
auto loglevel_to_int(std::string x, int default_value = INGEST_LOG_LEVEL_QUIET)
  -> int;

/// Replaces the discarding default logger with a colored console logger that
/// writes to stderr. The returned guard shuts down logging when destroyed.
/// @param verbosity One of quiet, critical, error, warning, info, verbose,
///                  debug, or trace.
/// @param pattern The spdlog pattern for console output.
[[nodiscard]] auto
create_log_context(const std::string& verbosity, const std::string& pattern)
  -> caf::expected<caf::detail::scope_guard<void (*)()>>;

} // namespace ingest
