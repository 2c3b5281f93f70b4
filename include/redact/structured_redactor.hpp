#pragma once

#include "redact/field_value.hpp"
#include "redact/pattern_registry.hpp"
#include "redact/text_redactor.hpp"

#include <cstddef>
#include <memory>

namespace logscrub {

/**
 * @brief Deep-copies a structured payload with secrets masked
 *
 * - String leaves go through the TextRedactor.
 * - A value under a sensitive key (mapping key or object field name) becomes
 *   the mask wholesale; its children are never inspected.
 * - Numbers, booleans and null pass through unchanged.
 * - Opaque leaves are stringified and then scanned as text.
 * - Objects come out as mappings with the same field names.
 *
 * Traversal uses an explicit stack, so depth is bounded only by memory.
 * Each distinct container is expanded once: a reference back to a container
 * still being walked (a cycle) becomes the mask, and a container reached
 * again through another path reuses its sanitized copy.
 */
class StructuredRedactor {
public:
    struct Stats {
        size_t containers_visited = 0;
        size_t cycles_broken = 0;
        size_t keys_masked = 0;
        size_t strings_redacted = 0;
        size_t unloggable_values = 0;
    };

    explicit StructuredRedactor(std::shared_ptr<const PatternRegistry> registry);

    [[nodiscard]] FieldValue redact(const FieldValue& value) const;
    [[nodiscard]] FieldValue redact(const FieldValue& value, Stats& stats) const;

    [[nodiscard]] const TextRedactor& text_redactor() const { return text_; }

private:
    std::shared_ptr<const PatternRegistry> registry_;
    TextRedactor text_;
};

} // namespace logscrub
