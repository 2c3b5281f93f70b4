#include "logging/log_format.hpp"
#include "core/utils.hpp"
#include "payload/json_payload.hpp"

#include <format>

namespace logscrub {

namespace {

bool has_fields(const FieldValue& fields) {
    if (fields.is_null()) return false;
    if (fields.is_mapping()) return fields.as_mapping() && !fields.as_mapping()->empty();
    return true;
}

} // anonymous namespace

std::string format_text(const LogRecord& record) {
    auto line = std::format("{} {:<5} {}",
        utils::format_timestamp_utc(record.timestamp),
        log_level_to_string(record.level),
        record.message);
    if (has_fields(record.fields)) {
        line += ' ';
        line += to_json(record.fields);
    }
    return line;
}

std::string format_json(const LogRecord& record) {
    auto line = std::format(R"({{"ts":"{}","level":"{}","msg":"{}")",
        utils::format_timestamp_utc(record.timestamp),
        log_level_to_string(record.level),
        utils::escape_json(record.message));
    if (has_fields(record.fields)) {
        line += R"(,"fields":)";
        line += to_json(record.fields);
    }
    line += '}';
    return line;
}

} // namespace logscrub
