#include "logging/stream_sink.hpp"
#include "logging/log_format.hpp"

#include <format>

namespace logscrub {

StreamSink::StreamSink(std::ostream& out)
    : StreamSink(out, Config{}) {}

StreamSink::StreamSink(std::ostream& out, const Config& config)
    : out_(out), config_(config) {}

bool StreamSink::write(const LogRecord& record) {
    const auto line = (config_.format == LogFormat::JSON)
        ? format_json(record)
        : format_text(record);
    out_ << line << '\n';
    if (config_.flush_each_record) {
        out_.flush();
    }
    if (!out_.good()) {
        return false;
    }
    ++records_written_;
    return true;
}

void StreamSink::flush() {
    out_.flush();
}

std::string StreamSink::name() const {
    return std::format("{}:{}", config_.label,
        config_.format == LogFormat::JSON ? "json" : "text");
}

} // namespace logscrub
