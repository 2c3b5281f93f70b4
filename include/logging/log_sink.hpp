#pragma once

#include "core/types.hpp"
#include "redact/field_value.hpp"

#include <chrono>
#include <string>

namespace logscrub {

/**
 * @brief One log event as it reaches a sink
 *
 * message and fields are already sanitized by SanitizingLogger; sinks never
 * see raw input.
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    FieldValue fields;      // NUL or MAPPING
};

/**
 * @brief Abstract interface for log output destinations
 *
 * Calls are serialized by SanitizingLogger, so implementations need no
 * internal locking.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a single record. Returns true on success.
    [[nodiscard]] virtual bool write(const LogRecord& record) = 0;

    /// Flush any buffered data to the underlying stream.
    virtual void flush() = 0;

    /// Human-readable sink name for diagnostics (e.g. "stream:stderr")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace logscrub
