#pragma once

#include "core/error.hpp"
#include "redact/field_value.hpp"
#include "redact/sanitizer.hpp"
#include "redact/structured_redactor.hpp"

#include <glaze/glaze.hpp>

#include <string>
#include <string_view>

namespace logscrub {

/**
 * @brief Convert a parsed glaze DOM into a FieldValue tree
 *
 * Integral numbers that fit in int64 become INTEGER, other numbers REAL.
 * glz::json_t stores objects in a sorted map, so key order follows the map.
 */
[[nodiscard]] FieldValue from_json(const glz::json_t& json);

/**
 * @brief Parse JSON text into a FieldValue tree
 * @return PARSE_ERROR result on malformed input; the message never quotes
 *         the input
 */
[[nodiscard]] Result<FieldValue> parse_json_payload(std::string_view text);

/**
 * @brief Render a FieldValue as compact JSON
 *
 * Objects are rendered through their fields, opaque values through
 * to_log_string(). A container reached again while it is still being
 * rendered is written as null, so the output is always finite. Meant for
 * already-sanitized values.
 */
[[nodiscard]] std::string to_json(const FieldValue& value);

struct SanitizedJsonLine {
    std::string json;       // compact JSON, no trailing newline
    bool parsed = false;    // false when the line was sanitized as text
};

/**
 * @brief Sanitize one JSON log line and render it back as compact JSON
 *
 * Valid JSON is sanitized structurally. Anything else is sanitized as free
 * text and rendered as a JSON string, so the raw line is never returned.
 */
[[nodiscard]] SanitizedJsonLine sanitize_json_line(const Sanitizer& sanitizer,
                                                   std::string_view line,
                                                   StructuredRedactor::Stats& stats);

} // namespace logscrub
