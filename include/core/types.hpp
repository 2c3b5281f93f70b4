#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace logscrub {

// ============================================================================
// Constants
// ============================================================================

/// Default placeholder substituted for detected secret material.
/// Must never match any detector (checked when a registry is built).
inline constexpr std::string_view kRedactionMask = "***REDACTED***";

/// Substituted for values that could not be sanitized (fail-closed).
inline constexpr std::string_view kUnloggableMarker = "<unloggable value>";

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief Credential family a detector targets.
 *
 * Also the priority rank: TOKEN detectors run first, GENERIC_SECRET last.
 */
enum class DetectorKind : uint8_t {
    TOKEN,
    HEADER,
    GENERIC_SECRET
};

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

enum class LogFormat : uint8_t {
    TEXT,
    JSON
};

// ============================================================================
// Redaction Results
// ============================================================================

/**
 * @brief One replaced byte range of a sanitized string
 *
 * Offsets refer to the ORIGINAL input. [begin, end) is the secret itself,
 * which may be narrower than the text the detector matched (e.g. the scheme
 * word of an Authorization header is matched but kept).
 */
struct RedactionSpan {
    size_t begin = 0;
    size_t end = 0;
    std::string detector;
    DetectorKind kind = DetectorKind::GENERIC_SECRET;

    [[nodiscard]] size_t length() const { return end - begin; }
};

// ============================================================================
// Enum <-> string
// ============================================================================

inline const char* detector_kind_to_string(DetectorKind kind) {
    switch (kind) {
        case DetectorKind::TOKEN: return "token";
        case DetectorKind::HEADER: return "header";
        case DetectorKind::GENERIC_SECRET: return "generic_secret";
        default: return "unknown";
    }
}

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

} // namespace logscrub
