#pragma once

// TimeOddity Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "oddity/core/Log.hh"
//   ODDITY_LOG_INFO("Rewind started at t={}", cursor);
//   ODDITY_LOG_WARN("Snapshot rejected: {}", reason);

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace oddity::log {

/// Initialize the logging subsystem (console + logs/oddity.log).
/// Call once at startup before any logging.
void init();

/// Initialize with an extra caller-provided file sink.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Get the root logger. Valid after init().
quill::Logger* logger();

/// Logger for the temporal engine (time manager and history buffer).
quill::Logger* temporalLogger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);

/// Set runtime log level of the temporal channel only.
void setTemporalLevel(quill::LogLevel level);

} // namespace oddity::log

// Root logging macros.
// Compile-time filtering: in Release builds, DEBUG and TRACE are absent.
#define ODDITY_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(oddity::log::logger(), fmt, ##__VA_ARGS__)
#define ODDITY_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(oddity::log::logger(), fmt, ##__VA_ARGS__)
#define ODDITY_LOG_INFO(fmt, ...) QUILL_LOG_INFO(oddity::log::logger(), fmt, ##__VA_ARGS__)
#define ODDITY_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(oddity::log::logger(), fmt, ##__VA_ARGS__)
#define ODDITY_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(oddity::log::logger(), fmt, ##__VA_ARGS__)
#define ODDITY_LOG_CRITICAL(fmt, ...) QUILL_LOG_CRITICAL(oddity::log::logger(), fmt, ##__VA_ARGS__)

// Temporal channel macros.
#define ODDITY_TEMPORAL_DEBUG(fmt, ...) QUILL_LOG_DEBUG(oddity::log::temporalLogger(), fmt, ##__VA_ARGS__)
#define ODDITY_TEMPORAL_INFO(fmt, ...) QUILL_LOG_INFO(oddity::log::temporalLogger(), fmt, ##__VA_ARGS__)
#define ODDITY_TEMPORAL_WARN(fmt, ...) QUILL_LOG_WARNING(oddity::log::temporalLogger(), fmt, ##__VA_ARGS__)
#define ODDITY_TEMPORAL_ERROR(fmt, ...) QUILL_LOG_ERROR(oddity::log::temporalLogger(), fmt, ##__VA_ARGS__)
