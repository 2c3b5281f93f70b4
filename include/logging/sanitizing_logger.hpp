#pragma once

#include "core/types.hpp"
#include "logging/log_sink.hpp"
#include "redact/field_value.hpp"
#include "redact/sanitizer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace logscrub {

/**
 * @brief The interception point between application code and log sinks
 *
 * Every message goes through Sanitizer::sanitize_message and every field
 * payload through Sanitizer::sanitize_fields before a LogRecord is built, so
 * sinks only ever receive sanitized text. Safe to call from any thread:
 * sanitization runs on the caller's thread, sink access is serialized.
 *
 *   [Thread 1] --log()--> [sanitize] --+
 *   [Thread N] --log()--> [sanitize] --+--(mutex)--> [Sink 1..N]
 */
class SanitizingLogger {
public:
    explicit SanitizingLogger(std::shared_ptr<const PatternRegistry> registry = PatternRegistry::defaults(),
                              LogLevel min_level = LogLevel::INFO);

    SanitizingLogger(const SanitizingLogger&) = delete;
    SanitizingLogger& operator=(const SanitizingLogger&) = delete;

    void add_sink(std::shared_ptr<ILogSink> sink);

    /**
     * @brief Sanitize and dispatch one event
     * @return false when filtered by level or when no sink accepted the record
     */
    bool log(LogLevel level, std::string_view message, const FieldValue& fields = FieldValue());

    /**
     * @brief Log one JSON line: an object becomes the record's fields with an
     *        empty message, anything else (including invalid JSON) the message
     */
    bool log_json_line(LogLevel level, std::string_view line);

    bool debug(std::string_view message, const FieldValue& fields = FieldValue()) {
        return log(LogLevel::DEBUG, message, fields);
    }
    bool info(std::string_view message, const FieldValue& fields = FieldValue()) {
        return log(LogLevel::INFO, message, fields);
    }
    bool warn(std::string_view message, const FieldValue& fields = FieldValue()) {
        return log(LogLevel::WARN, message, fields);
    }
    bool error(std::string_view message, const FieldValue& fields = FieldValue()) {
        return log(LogLevel::ERROR, message, fields);
    }

    void flush();

    void set_min_level(LogLevel level) {
        min_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }
    [[nodiscard]] LogLevel min_level() const {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    struct Stats {
        uint64_t total_logged;          ///< Records that passed the level filter
        uint64_t total_written;         ///< Successful sink writes
        uint64_t filtered;              ///< Dropped by the level filter
        uint64_t sink_write_failures;   ///< Sink writes that returned false
        uint64_t secrets_redacted;      ///< Records whose message or fields changed
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const Sanitizer& sanitizer() const { return sanitizer_; }

private:
    Sanitizer sanitizer_;
    std::atomic<int> min_level_;

    mutable std::mutex sink_mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;

    std::atomic<uint64_t> total_logged_{0};
    std::atomic<uint64_t> total_written_{0};
    std::atomic<uint64_t> filtered_{0};
    std::atomic<uint64_t> sink_write_failures_{0};
    std::atomic<uint64_t> secrets_redacted_{0};
};

} // namespace logscrub
