#pragma once

#include "core/types.hpp"
#include "logging/log_sink.hpp"

#include <cstddef>
#include <ostream>
#include <string>

namespace logscrub {

/**
 * @brief Writes formatted records, one per line, to a borrowed std::ostream
 *
 * The stream must outlive the sink. Used for stdout/stderr.
 */
class StreamSink : public ILogSink {
public:
    struct Config {
        LogFormat format = LogFormat::TEXT;
        std::string label = "stream";
        bool flush_each_record = false;
    };

    explicit StreamSink(std::ostream& out);
    StreamSink(std::ostream& out, const Config& config);

    [[nodiscard]] bool write(const LogRecord& record) override;
    void flush() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t records_written() const { return records_written_; }

private:
    std::ostream& out_;
    Config config_;
    size_t records_written_ = 0;
};

} // namespace logscrub
