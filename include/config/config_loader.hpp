#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "redact/pattern_registry.hpp"

#include <toml++/toml.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace logscrub {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingSettings {
    LogLevel level = LogLevel::INFO;
    LogFormat format = LogFormat::TEXT;
};

// ============================================================================
// Redaction Config (mirrors TOML hierarchy)
// ============================================================================

struct CustomDetectorConfig {
    std::string name;
    DetectorKind kind = DetectorKind::GENERIC_SECRET;
    std::string pattern;
    size_t secret_group = 0;
    bool case_insensitive = false;
    double min_entropy = 0.0;
};

struct RedactionConfig {
    std::string mask = std::string(kRedactionMask);
    bool builtin_detectors = true;
    std::vector<std::string> disabled_detectors;
    bool builtin_sensitive_keys = true;
    std::vector<std::string> sensitive_keys;
    std::vector<CustomDetectorConfig> detectors;
};

struct ScrubConfig {
    LoggingSettings logging;
    RedactionConfig redaction;
};

// ============================================================================
// ConfigLoader
// ============================================================================

/**
 * @brief Loads logscrub.toml
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string.
 */
class ConfigLoader {
public:
    /**
     * @brief Load config from a TOML file
     * @return CONFIG_ERROR result on I/O, syntax or validation failure
     */
    [[nodiscard]] static Result<ScrubConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static Result<ScrubConfig> load_from_string(const std::string& toml_content);

    /**
     * @brief Build the frozen registry described by a redaction section
     * @throws PatternCompilationError (fatal at startup)
     */
    [[nodiscard]] static std::shared_ptr<const PatternRegistry> build_registry(const RedactionConfig& config);

    /// Every problem found, one message per entry; empty when valid
    [[nodiscard]] static std::vector<std::string> validate_config(const ScrubConfig& config);

    [[nodiscard]] static std::optional<DetectorKind> parse_detector_kind(const std::string& kind_str);
    [[nodiscard]] static std::optional<LogFormat> parse_log_format(const std::string& format_str);

private:
    static Result<ScrubConfig> extract_all_sections(const toml::table& root);
    static Result<LoggingSettings> extract_logging(const toml::table& root);
    static Result<RedactionConfig> extract_redaction(const toml::table& root);
    static Result<ScrubConfig> validate_and_return(ScrubConfig config);
};

} // namespace logscrub
