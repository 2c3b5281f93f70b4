#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace logscrub {

/**
 * @brief One named credential matcher
 *
 * secret_group selects the capture group that is replaced by the mask
 * (0 = whole match). The rest of the match stays readable and is still
 * scanned by lower-priority detectors.
 */
struct Detector {
    std::string name;
    DetectorKind kind = DetectorKind::GENERIC_SECRET;
    std::string source;         // regex source, kept for diagnostics
    std::regex pattern;
    size_t secret_group = 0;
    double min_entropy = 0.0;   // bits/char the secret must reach; 0 disables
    bool mixed_charset = false; // secret must hold an upper, a lower and a digit

    /// Post-match filters (entropy, character mix) applied to a secret group
    [[nodiscard]] bool accepts(std::string_view secret) const;
};

/**
 * @brief Case-insensitive set of sensitive field names
 *
 * Keys are normalized (ASCII lowercase; '-', '.', ' ' become '_'). A key is
 * sensitive when its normalized form contains any entry, so "X-Api-Key" and
 * "github_token" both match.
 */
class SensitiveKeySet {
public:
    SensitiveKeySet() = default;
    explicit SensitiveKeySet(const std::vector<std::string>& keys);

    [[nodiscard]] bool is_sensitive(std::string_view key) const;

    [[nodiscard]] const std::vector<std::string>& entries() const { return entries_; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

    [[nodiscard]] static std::string normalize(std::string_view key);

private:
    std::vector<std::string> entries_;   // normalized, deduplicated
};

/**
 * @brief Immutable, ordered set of detectors plus the sensitive key set.
 *
 * Built once through Builder (construct-then-freeze) and shared read-only
 * across threads. Detectors are ordered by kind (TOKEN, HEADER,
 * GENERIC_SECRET), registration order within a kind.
 */
class PatternRegistry {
public:
    /// Detectors whose pattern is generated from the sensitive key set
    enum class KeyPattern : uint8_t {
        NONE,
        ASSIGNMENT,
        QUOTED_ASSIGNMENT
    };

    class Builder {
    public:
        Builder() = default;

        /// Register a detector; compiled in build()
        Builder& add_detector(std::string name,
                              DetectorKind kind,
                              std::string pattern,
                              size_t secret_group = 0,
                              bool case_insensitive = false,
                              double min_entropy = 0.0);

        /// GitHub tokens, JWT, Authorization headers, key=value, hex, base64
        Builder& add_builtin_detectors();

        /// Drop a previously registered detector (no-op if absent)
        Builder& remove_detector(std::string_view name);

        Builder& add_sensitive_key(std::string key);
        Builder& add_builtin_sensitive_keys();

        Builder& set_mask(std::string mask);

        /**
         * @brief Compile every detector and freeze the registry
         * @throws PatternCompilationError on a malformed pattern, a secret group
         *         beyond the capture count, a duplicate name, or a mask that is
         *         empty or matched by a detector
         */
        [[nodiscard]] std::shared_ptr<const PatternRegistry> build() const;

    private:
        struct DetectorSpec {
            std::string name;
            DetectorKind kind;
            std::string pattern;        // empty for key-derived detectors
            size_t secret_group;
            bool case_insensitive;
            double min_entropy;
            KeyPattern key_pattern;
            bool mixed_charset = false;
        };

        std::vector<DetectorSpec> specs_;
        std::vector<std::string> sensitive_keys_;
        std::string mask_{kRedactionMask};
    };

    /// Process-wide default registry (built-in detectors and keys), built once
    [[nodiscard]] static std::shared_ptr<const PatternRegistry> defaults();

    [[nodiscard]] const std::vector<Detector>& detectors() const { return detectors_; }
    [[nodiscard]] const SensitiveKeySet& sensitive_keys() const { return sensitive_keys_; }
    [[nodiscard]] const std::string& mask() const { return mask_; }

    [[nodiscard]] const Detector* find(std::string_view name) const;

    /// Regex matching "<sensitive key>[=:]<value>" with the value in group 3
    [[nodiscard]] static std::string assignment_pattern(const SensitiveKeySet& keys);

    /// Same with a quoted value, which may contain spaces; value in group 3
    [[nodiscard]] static std::string quoted_assignment_pattern(const SensitiveKeySet& keys);

private:
    struct BuildTag {
        explicit BuildTag() = default;
    };

public:
    /// Only reachable through Builder::build()
    PatternRegistry(BuildTag, std::vector<Detector> detectors, SensitiveKeySet keys, std::string mask);

private:
    std::vector<Detector> detectors_;
    SensitiveKeySet sensitive_keys_;
    std::string mask_;
};

} // namespace logscrub
