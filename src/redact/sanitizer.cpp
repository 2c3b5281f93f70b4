#include "redact/sanitizer.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>

namespace logscrub {

Sanitizer::Sanitizer(std::shared_ptr<const PatternRegistry> registry)
    : registry_(registry ? std::move(registry) : PatternRegistry::defaults()),
      structured_(registry_) {}

std::string Sanitizer::sanitize_message(std::string_view text) const {
    try {
        return structured_.text_redactor().redact(text);
    } catch (const std::regex_error& e) {
        utils::log::warn(std::format(
            "Regex engine gave up on a {}-byte message ({}); logged as unloggable",
            text.size(), e.what()));
        return std::string(kUnloggableMarker);
    }
}

std::string Sanitizer::sanitize_message(const std::string& text) const {
    return sanitize_message(std::string_view(text));
}

std::string Sanitizer::sanitize_message(const char* text) const {
    if (text == nullptr) {
        throw InvalidInputKindError("sanitize_message: null C string");
    }
    return sanitize_message(std::string_view(text));
}

std::string Sanitizer::sanitize_message(const FieldValue& value) const {
    if (!value.is_string()) {
        throw InvalidInputKindError(std::format(
            "sanitize_message: expected a string, got {}", field_kind_to_string(value.kind())));
    }
    return sanitize_message(std::string_view(value.as_string()));
}

FieldValue Sanitizer::sanitize_fields(const FieldValue& payload) const {
    return structured_.redact(payload);
}

FieldValue Sanitizer::sanitize_fields(const FieldValue& payload,
                                      StructuredRedactor::Stats& stats) const {
    return structured_.redact(payload, stats);
}

// ============================================================================
// Process-wide entry points
// ============================================================================

const Sanitizer& default_sanitizer() {
    static const Sanitizer sanitizer(PatternRegistry::defaults());
    return sanitizer;
}

std::string sanitize_message(std::string_view text) {
    return default_sanitizer().sanitize_message(text);
}

std::string sanitize_message(const std::string& text) {
    return default_sanitizer().sanitize_message(text);
}

std::string sanitize_message(const char* text) {
    return default_sanitizer().sanitize_message(text);
}

std::string sanitize_message(const FieldValue& value) {
    return default_sanitizer().sanitize_message(value);
}

FieldValue sanitize_fields(const FieldValue& payload) {
    return default_sanitizer().sanitize_fields(payload);
}

} // namespace logscrub
