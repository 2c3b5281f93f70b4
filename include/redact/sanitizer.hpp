#pragma once

#include "redact/field_value.hpp"
#include "redact/pattern_registry.hpp"
#include "redact/structured_redactor.hpp"
#include "redact/text_redactor.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace logscrub {

/**
 * @brief Entry points for the logging interception layer
 *
 * Every message and field payload must pass through here immediately before
 * it reaches a sink. Fails closed: a value that cannot be sanitized is
 * either rejected with an exception or replaced by kUnloggableMarker, never
 * returned raw.
 */
class Sanitizer {
public:
    explicit Sanitizer(std::shared_ptr<const PatternRegistry> registry = PatternRegistry::defaults());

    /**
     * @brief Sanitize a free-form log message
     * @throws InvalidInputKindError for a null C string or a non-string FieldValue
     */
    [[nodiscard]] std::string sanitize_message(std::string_view text) const;
    [[nodiscard]] std::string sanitize_message(const std::string& text) const;
    [[nodiscard]] std::string sanitize_message(const char* text) const;
    [[nodiscard]] std::string sanitize_message(const FieldValue& value) const;

    /**
     * @brief Sanitize a structured payload; same shape out, never throws for
     *        supported kinds
     */
    [[nodiscard]] FieldValue sanitize_fields(const FieldValue& payload) const;
    [[nodiscard]] FieldValue sanitize_fields(const FieldValue& payload,
                                             StructuredRedactor::Stats& stats) const;

    [[nodiscard]] const PatternRegistry& registry() const { return *registry_; }
    [[nodiscard]] const TextRedactor& text_redactor() const { return structured_.text_redactor(); }

private:
    std::shared_ptr<const PatternRegistry> registry_;
    StructuredRedactor structured_;
};

// ============================================================================
// Process-wide entry points (default registry)
// ============================================================================

[[nodiscard]] const Sanitizer& default_sanitizer();

[[nodiscard]] std::string sanitize_message(std::string_view text);
[[nodiscard]] std::string sanitize_message(const std::string& text);
[[nodiscard]] std::string sanitize_message(const char* text);
[[nodiscard]] std::string sanitize_message(const FieldValue& value);
[[nodiscard]] FieldValue sanitize_fields(const FieldValue& payload);

} // namespace logscrub
