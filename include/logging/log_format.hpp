#pragma once

#include "logging/log_sink.hpp"

#include <string>

namespace logscrub {

/**
 * @brief "2026-10-18T21:58:03.120Z INFO  message {"k":"v"}"
 *
 * The field payload is appended as compact JSON when it is a non-empty
 * mapping. No trailing newline.
 */
[[nodiscard]] std::string format_text(const LogRecord& record);

/**
 * @brief {"ts":"...","level":"INFO","msg":"...","fields":{...}}
 *
 * "fields" is omitted when the payload is null or an empty mapping.
 * No trailing newline.
 */
[[nodiscard]] std::string format_json(const LogRecord& record);

} // namespace logscrub
