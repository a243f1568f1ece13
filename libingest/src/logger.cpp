//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2026 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "ingest/logger.hpp"

#include "ingest/config.hpp"
#include "ingest/error.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <cctype>
#include <memory>

namespace ingest {

namespace {

/// Converts an ingest log level to spdlog level
auto ingest_loglevel_to_spd(const int value) -> spdlog::level::level_enum {
  switch (value) {
    case INGEST_LOG_LEVEL_QUIET:
      return spdlog::level::off;
    case INGEST_LOG_LEVEL_CRITICAL:
      return spdlog::level::critical;
    case INGEST_LOG_LEVEL_ERROR:
      return spdlog::level::err;
    case INGEST_LOG_LEVEL_WARNING:
      return spdlog::level::warn;
    case INGEST_LOG_LEVEL_INFO:
      return spdlog::level::info;
    case INGEST_LOG_LEVEL_VERBOSE:
      return spdlog::level::debug;
    case INGEST_LOG_LEVEL_DEBUG:
    case INGEST_LOG_LEVEL_TRACE:
      return spdlog::level::trace;
  }
  return spdlog::level::off;
}

void shutdown_spdlog() {
  INGEST_DEBUG("shut down logging");
  detail::logger()->flush();
  spdlog::shutdown();
}

} // namespace

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
auto loglevel_to_int(std::string x, int default_value) -> int {
  for (auto& ch : x) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  if (x == "quiet") {
    return INGEST_LOG_LEVEL_QUIET;
  }
  if (x == "critical") {
    return INGEST_LOG_LEVEL_CRITICAL;
  }
  if (x == "error") {
    return INGEST_LOG_LEVEL_ERROR;
  }
  if (x == "warning") {
    return INGEST_LOG_LEVEL_WARNING;
  }
  if (x == "info") {
    return INGEST_LOG_LEVEL_INFO;
  }
  if (x == "verbose") {
    return INGEST_LOG_LEVEL_VERBOSE;
  }
  if (x == "debug") {
    return INGEST_LOG_LEVEL_DEBUG;
  }
  if (x == "trace") {
    return INGEST_LOG_LEVEL_TRACE;
  }
  return default_value;
}

auto create_log_context(const std::string& verbosity,
                        const std::string& pattern)
  -> caf::expected<caf::detail::scope_guard<void (*)()>> try {
  auto level = loglevel_to_int(verbosity, -1);
  if (level < 0) {
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("failed to start logger; verbosity "
                                       "'{}' is invalid",
                                       verbosity));
  }
  if (detail::logger()->name() != "/dev/null") {
    return caf::make_error(ec::logic_error, "logger already initialized");
  }
  auto console_sink = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(
    spdlog::color_mode::automatic);
  console_sink->set_pattern(pattern);
  console_sink->set_level(ingest_loglevel_to_spd(level));
  // Replace the /dev/null logger that was created during init.
  detail::logger() = std::make_shared<spdlog::logger>("ingest", console_sink);
  detail::logger()->set_level(ingest_loglevel_to_spd(level));
  spdlog::register_logger(detail::logger());
  return {caf::detail::make_scope_guard(std::addressof(shutdown_spdlog))};
} catch (const spdlog::spdlog_ex& err) {
  return caf::make_error(ec::unspecified,
                         fmt::format("failed to start logger: {}", err.what()));
}

namespace detail {

auto logger() -> std::shared_ptr<spdlog::logger>& {
  static auto ingest_logger = std::make_shared<spdlog::logger>(
    "/dev/null", std::make_shared<spdlog::sinks::null_sink_mt>());
  return ingest_logger;
}

} // namespace detail
} // namespace ingest
