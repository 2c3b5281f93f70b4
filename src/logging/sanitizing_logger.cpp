#include "logging/sanitizing_logger.hpp"
#include "core/utils.hpp"
#include "payload/json_payload.hpp"

#include <chrono>
#include <format>

namespace logscrub {

SanitizingLogger::SanitizingLogger(std::shared_ptr<const PatternRegistry> registry,
                                   LogLevel min_level)
    : sanitizer_(std::move(registry)),
      min_level_(static_cast<int>(min_level)) {}

void SanitizingLogger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(sink_mutex_);
    utils::log::debug(std::format("Log sink added: {}", sink->name()));
    sinks_.push_back(std::move(sink));
}

bool SanitizingLogger::log(LogLevel level, std::string_view message, const FieldValue& fields) {
    if (static_cast<int>(level) < min_level_.load(std::memory_order_relaxed)) {
        filtered_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    total_logged_.fetch_add(1, std::memory_order_relaxed);

    LogRecord record;
    record.level = level;
    record.timestamp = std::chrono::system_clock::now();
    record.message = sanitizer_.sanitize_message(message);

    StructuredRedactor::Stats stats;
    if (!fields.is_null()) {
        record.fields = sanitizer_.sanitize_fields(fields, stats);
    }

    if (record.message != message || stats.keys_masked > 0 ||
        stats.strings_redacted > 0 || stats.cycles_broken > 0) {
        secrets_redacted_.fetch_add(1, std::memory_order_relaxed);
    }

    bool any_written = false;
    std::lock_guard<std::mutex> lock(sink_mutex_);
    for (const auto& sink : sinks_) {
        if (sink->write(record)) {
            total_written_.fetch_add(1, std::memory_order_relaxed);
            any_written = true;
        } else {
            sink_write_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    return any_written;
}

bool SanitizingLogger::log_json_line(LogLevel level, std::string_view line) {
    auto parsed = parse_json_payload(line);
    if (parsed.is_ok() && parsed.value().is_mapping()) {
        return log(level, "", parsed.value());
    }
    return log(level, line);
}

void SanitizingLogger::flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

SanitizingLogger::Stats SanitizingLogger::get_stats() const {
    size_t active = 0;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        active = sinks_.size();
    }
    return {
        total_logged_.load(std::memory_order_relaxed),
        total_written_.load(std::memory_order_relaxed),
        filtered_.load(std::memory_order_relaxed),
        sink_write_failures_.load(std::memory_order_relaxed),
        secrets_redacted_.load(std::memory_order_relaxed),
        active
    };
}

} // namespace logscrub
