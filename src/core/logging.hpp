#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace csrfguard::control {
struct LogConfig;
}

namespace csrfguard::logging {

// Initialize Quill logging backend (called once at startup)
void init_logging_system();

// Initialize per-worker logger with config-driven settings
// Returns logger for the given worker ID and binds it to the calling thread
quill::Logger* init_worker_logger(int worker_id, const csrfguard::control::LogConfig& config);

// Shutdown logging system (called at exit)
void shutdown_logging();

// UUID v4 generation for correlation IDs
std::string generate_correlation_id();

// Validate correlation ID format ({uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Get current thread's logger (returns nullptr if not initialized)
quill::Logger* get_current_logger();

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, correlation_id)            \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, duration_us={}, "         \
             "correlation_id={}",                                                         \
             method, path, status, duration_us, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

}  // namespace csrfguard::logging
