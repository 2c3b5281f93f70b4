#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

using namespace std::string_literals;

namespace logscrub {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

/// Accepts integer or float TOML values
double toml_number(const toml::table& tbl, const std::string_view key, double fallback) {
    if (const auto v = tbl[key].value<double>()) return *v;
    if (const auto v = tbl[key].value<int64_t>()) return static_cast<double>(*v);
    return fallback;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Helpers ---------------------------------------------------------------

std::optional<DetectorKind> ConfigLoader::parse_detector_kind(const std::string& kind_str) {
    const std::string lower = utils::to_lower(kind_str);

    static const std::unordered_map<std::string, DetectorKind> lookup = {
        {"token",          DetectorKind::TOKEN},
        {"header",         DetectorKind::HEADER},
        {"generic_secret", DetectorKind::GENERIC_SECRET},
    };

    const auto it = lookup.find(lower);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<LogFormat> ConfigLoader::parse_log_format(const std::string& format_str) {
    const std::string lower = utils::to_lower(format_str);
    if (lower == "text") return LogFormat::TEXT;
    if (lower == "json") return LogFormat::JSON;
    return std::nullopt;
}

// ---- Section extractors ----------------------------------------------------

Result<LoggingSettings> ConfigLoader::extract_logging(const toml::table& root) {
    LoggingSettings cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return Result<LoggingSettings>::ok(cfg);
    const auto& l = *logging;

    const auto level_str = l["level"].value_or("info"s);
    const auto level = utils::log::parse_level(level_str);
    if (!level) {
        return Result<LoggingSettings>::error(ErrorCategory::CONFIG_ERROR,
            std::format("logging.level: unknown level '{}'", level_str));
    }
    cfg.level = *level;

    const auto format_str = l["format"].value_or("text"s);
    const auto format = parse_log_format(format_str);
    if (!format) {
        return Result<LoggingSettings>::error(ErrorCategory::CONFIG_ERROR,
            std::format("logging.format: unknown format '{}'", format_str));
    }
    cfg.format = *format;

    return Result<LoggingSettings>::ok(cfg);
}

Result<RedactionConfig> ConfigLoader::extract_redaction(const toml::table& root) {
    RedactionConfig cfg;
    const auto* redaction = root["redaction"].as_table();
    if (!redaction) return Result<RedactionConfig>::ok(std::move(cfg));
    const auto& r = *redaction;

    if (auto mask = toml_optional_string(r, "mask")) {
        cfg.mask = std::move(*mask);
    }
    cfg.builtin_detectors = r["builtin_detectors"].value_or(true);
    cfg.disabled_detectors = toml_string_array(r, "disabled_detectors");
    cfg.builtin_sensitive_keys = r["builtin_sensitive_keys"].value_or(true);
    cfg.sensitive_keys = toml_string_array(r, "sensitive_keys");

    if (const auto* arr = r["detectors"].as_array()) {
        size_t index = 0;
        for (const auto& elem : *arr) {
            const auto* d = elem.as_table();
            if (!d) {
                return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("redaction.detectors[{}] must be a table", index));
            }

            CustomDetectorConfig det;
            auto name = toml_optional_string(*d, "name");
            if (!name) {
                return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("redaction.detectors[{}].name is required", index));
            }
            det.name = std::move(*name);

            auto pattern = toml_optional_string(*d, "pattern");
            if (!pattern) {
                return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("redaction.detectors[{}].pattern is required", index));
            }
            det.pattern = std::move(*pattern);

            const auto kind_str = (*d)["kind"].value_or("generic_secret"s);
            const auto kind = parse_detector_kind(kind_str);
            if (!kind) {
                return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("redaction.detectors[{}].kind: unknown kind '{}'", index, kind_str));
            }
            det.kind = *kind;

            const auto group = (*d)["secret_group"].value_or(int64_t{0});
            if (group < 0) {
                return Result<RedactionConfig>::error(ErrorCategory::CONFIG_ERROR,
                    std::format("redaction.detectors[{}].secret_group must be >= 0", index));
            }
            det.secret_group = static_cast<size_t>(group);
            det.case_insensitive = (*d)["case_insensitive"].value_or(false);
            det.min_entropy = toml_number(*d, "min_entropy", 0.0);

            cfg.detectors.push_back(std::move(det));
            ++index;
        }
    }

    return Result<RedactionConfig>::ok(std::move(cfg));
}

Result<ScrubConfig> ConfigLoader::extract_all_sections(const toml::table& root) {
    ScrubConfig config;

    auto logging = extract_logging(root);
    if (!logging.is_ok()) {
        return Result<ScrubConfig>::error(logging.error_category(), logging.error_message());
    }
    config.logging = logging.value();

    auto redaction = extract_redaction(root);
    if (!redaction.is_ok()) {
        return Result<ScrubConfig>::error(redaction.error_category(), redaction.error_message());
    }
    config.redaction = std::move(redaction.value());

    return Result<ScrubConfig>::ok(std::move(config));
}

Result<ScrubConfig> ConfigLoader::validate_and_return(ScrubConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return Result<ScrubConfig>::error(ErrorCategory::CONFIG_ERROR, std::move(combined));
    }
    return Result<ScrubConfig>::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

Result<ScrubConfig> ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        auto extracted = extract_all_sections(tbl);
        if (!extracted.is_ok()) return extracted;
        return validate_and_return(std::move(extracted.value()));
    } catch (const toml::parse_error& e) {
        return Result<ScrubConfig>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to load config {}: {} (line {})", config_path,
                e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return Result<ScrubConfig>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to load config {}: {}", config_path, e.what()));
    }
}

Result<ScrubConfig> ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        auto extracted = extract_all_sections(tbl);
        if (!extracted.is_ok()) return extracted;
        return validate_and_return(std::move(extracted.value()));
    } catch (const toml::parse_error& e) {
        return Result<ScrubConfig>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to parse config: {} (line {})",
                e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return Result<ScrubConfig>::error(ErrorCategory::CONFIG_ERROR,
            std::format("Failed to parse config: {}", e.what()));
    }
}

std::shared_ptr<const PatternRegistry> ConfigLoader::build_registry(const RedactionConfig& config) {
    PatternRegistry::Builder builder;
    builder.set_mask(config.mask);

    if (config.builtin_sensitive_keys) {
        builder.add_builtin_sensitive_keys();
    }
    for (const auto& key : config.sensitive_keys) {
        builder.add_sensitive_key(key);
    }

    if (config.builtin_detectors) {
        builder.add_builtin_detectors();
    }
    for (const auto& name : config.disabled_detectors) {
        builder.remove_detector(name);
    }
    for (const auto& det : config.detectors) {
        builder.add_detector(det.name, det.kind, det.pattern,
                             det.secret_group, det.case_insensitive, det.min_entropy);
    }

    return builder.build();
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ScrubConfig& config) {
    std::vector<std::string> errors;
    const auto& r = config.redaction;

    if (r.mask.empty()) {
        errors.push_back("redaction.mask must not be empty");
    }

    std::unordered_set<std::string> names;
    for (size_t i = 0; i < r.detectors.size(); ++i) {
        const auto& det = r.detectors[i];
        if (det.name.empty()) {
            errors.push_back(std::format("redaction.detectors[{}].name must not be empty", i));
        } else if (!names.insert(det.name).second) {
            errors.push_back(std::format("redaction.detectors[{}].name '{}' is duplicated", i, det.name));
        }
        if (det.pattern.empty()) {
            errors.push_back(std::format("redaction.detectors[{}].pattern must not be empty", i));
        }
        if (det.min_entropy < 0.0 || det.min_entropy > 8.0) {
            errors.push_back(std::format(
                "redaction.detectors[{}].min_entropy must be within 0-8, got {}", i, det.min_entropy));
        }
    }

    for (const auto& key : r.sensitive_keys) {
        if (utils::trim(key).empty()) {
            errors.push_back("redaction.sensitive_keys must not contain blank entries");
            break;
        }
    }

    if (!r.builtin_detectors && r.detectors.empty()) {
        utils::log::warn("Config has no detectors enabled; only sensitive field keys will be masked");
    }

    return errors;
}

} // namespace logscrub
