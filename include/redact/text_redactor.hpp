#pragma once

#include "core/types.hpp"
#include "redact/pattern_registry.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace logscrub {

/**
 * @brief Replaces every detected secret in free-form text with the mask
 *
 * Detectors run in registry order. Each detector only scans the byte ranges
 * no earlier detector has claimed, so a span is redacted at most once and
 * overlaps resolve to the higher-priority detector. Everything outside the
 * reported spans is copied byte-for-byte.
 *
 * Stateless apart from the shared immutable registry: safe to call
 * concurrently.
 */
class TextRedactor {
public:
    explicit TextRedactor(std::shared_ptr<const PatternRegistry> registry);

    /// Sanitized copy of text; idempotent
    [[nodiscard]] std::string redact(std::string_view text) const;

    /// Spans that redact() replaces, sorted by offset, non-overlapping
    [[nodiscard]] std::vector<RedactionSpan> find_spans(std::string_view text) const;

    /// True if any detector fires on text
    [[nodiscard]] bool contains_secret(std::string_view text) const;

    [[nodiscard]] const PatternRegistry& registry() const { return *registry_; }

    /// Replace spans (from find_spans on the same text) with mask
    [[nodiscard]] static std::string apply_spans(std::string_view text,
                                                 const std::vector<RedactionSpan>& spans,
                                                 std::string_view mask);

private:
    std::shared_ptr<const PatternRegistry> registry_;
};

} // namespace logscrub
