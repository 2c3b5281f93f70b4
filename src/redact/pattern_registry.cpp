#include "redact/pattern_registry.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <unordered_set>

namespace logscrub {

namespace {

// Quantifiers are bounded: libstdc++'s regex executor recurses once per
// repeated character, so an unbounded run over a large blob can exhaust the
// stack. Longer secrets are covered by consecutive matches.

// Classic GitHub tokens: ghp_ (personal), gho_ (OAuth), ghu_ (user-to-server),
// ghs_ (server-to-server), ghr_ (refresh). Prefix is case-sensitive.
constexpr std::string_view kGithubTokenPattern =
    R"(gh[pousr]_[A-Za-z0-9]{36,255})";

// Fine-grained PAT: github_pat_<22 chars>_<59 chars>
constexpr std::string_view kGithubPatPattern =
    R"(github_pat_[A-Za-z0-9_]{22,255})";

// header.payload.signature, both JSON segments start with '{"' => "eyJ"
constexpr std::string_view kJwtPattern =
    R"(eyJ[A-Za-z0-9_-]{10,2048}\.eyJ[A-Za-z0-9_-]{10,2048}\.[A-Za-z0-9_-]{0,2048})";

// "Authorization: Bearer <credential>" -- the scheme word is kept
constexpr std::string_view kAuthorizationHeaderPattern =
    R"((authorization["']?\s*[:=]\s*["']?(?:bearer|basic|token)\s+)([^\s"',;]{1,2048}))";

// Bare scheme word. Without the header name the credential must look like
// one: at least 8 chars and a digit or one of + / _ -
constexpr std::string_view kAuthSchemePattern =
    R"(\b(?:bearer|basic|token)\s+((?=[A-Za-z0-9._~+/-]{8})(?=[A-Za-z.~]{0,2048}[0-9+/_-])[A-Za-z0-9._~+/-]{8,2048}={0,2}))";

constexpr std::string_view kHexSecretPattern =
    R"([0-9a-fA-F]{32,2048})";

// Standard and url-safe alphabets. The upper/lower/digit requirement is
// checked on the match (Detector::mixed_charset); lookaheads for it make
// libstdc++ backtrack at every input position.
constexpr std::string_view kBase64SecretPattern =
    R"([A-Za-z0-9+/_-]{40,2048}={0,2})";

constexpr double kBase64MinEntropy = 4.4;

constexpr std::string_view kAssignmentDetectorName = "sensitive_assignment";
constexpr std::string_view kQuotedAssignmentDetectorName = "quoted_sensitive_assignment";

const std::vector<std::string>& builtin_sensitive_keys() {
    static const std::vector<std::string> keys = {
        "authorization",
        "password",
        "passwd",
        "secret",
        "token",
        "api_key",
        "apikey",
        "access_key",
        "private_key",
        "credential",
        "cookie",
    };
    return keys;
}

int kind_rank(DetectorKind kind) {
    return static_cast<int>(kind);
}

// Escape a normalized key for use inside a regex alternation. '_' also
// accepts the separators normalize() folds into it.
std::string key_to_regex(std::string_view key) {
    std::string out;
    out.reserve(key.size() * 2);
    for (const char c : key) {
        if (c == '_') {
            out += "[_. -]?";
            continue;
        }
        if (std::string_view(R"(\^$.|?*+()[]{})").find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

// Longest first so the alternation prefers "api_key" over shorter entries
std::string key_alternation(const SensitiveKeySet& keys) {
    std::vector<std::string> sorted = keys.entries();
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const std::string& a, const std::string& b) { return a.size() > b.size(); });

    std::string alternation;
    for (const auto& key : sorted) {
        if (!alternation.empty()) alternation += '|';
        alternation += key_to_regex(key);
    }
    return alternation;
}

std::regex compile_or_throw(const std::string& name, const std::string& source,
                            bool case_insensitive) {
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (case_insensitive) {
        flags |= std::regex::icase;
    }
    try {
        return std::regex(source, flags);
    } catch (const std::regex_error& e) {
        throw PatternCompilationError(name,
            std::format("Detector '{}': invalid pattern: {}", name, e.what()));
    }
}

// True when some match of the detector in text yields a secret it accepts
bool matches_secret(const Detector& detector, const std::string& text) {
    for (std::sregex_iterator it(text.begin(), text.end(), detector.pattern), end;
         it != end; ++it) {
        const auto& secret = (*it)[detector.secret_group];
        if (secret.matched && secret.length() > 0 &&
            detector.accepts(secret.str())) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Detector
// ============================================================================

bool Detector::accepts(std::string_view secret) const {
    if (min_entropy > 0.0 && utils::shannon_entropy(secret) < min_entropy) {
        return false;
    }
    if (mixed_charset) {
        bool upper = false;
        bool lower = false;
        bool digit = false;
        for (const char c : secret) {
            const auto u = static_cast<unsigned char>(c);
            upper = upper || std::isupper(u) != 0;
            lower = lower || std::islower(u) != 0;
            digit = digit || std::isdigit(u) != 0;
        }
        return upper && lower && digit;
    }
    return true;
}

// ============================================================================
// SensitiveKeySet
// ============================================================================

SensitiveKeySet::SensitiveKeySet(const std::vector<std::string>& keys) {
    std::unordered_set<std::string> seen;
    entries_.reserve(keys.size());
    for (const auto& key : keys) {
        auto normalized = normalize(key);
        if (normalized.empty()) continue;
        if (seen.insert(normalized).second) {
            entries_.push_back(std::move(normalized));
        }
    }
}

std::string SensitiveKeySet::normalize(std::string_view key) {
    std::string result;
    result.reserve(key.size());
    for (const char c : key) {
        if (c == '-' || c == '.' || c == ' ') {
            result += '_';
        } else {
            result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

bool SensitiveKeySet::is_sensitive(std::string_view key) const {
    if (key.empty() || entries_.empty()) return false;

    const std::string normalized = normalize(key);
    return std::any_of(entries_.begin(), entries_.end(),
        [&normalized](const std::string& entry) {
            return normalized.find(entry) != std::string::npos;
        });
}

// ============================================================================
// PatternRegistry::Builder
// ============================================================================

PatternRegistry::Builder& PatternRegistry::Builder::add_detector(
    std::string name,
    DetectorKind kind,
    std::string pattern,
    size_t secret_group,
    bool case_insensitive,
    double min_entropy) {

    specs_.push_back(DetectorSpec{
        std::move(name), kind, std::move(pattern),
        secret_group, case_insensitive, min_entropy, KeyPattern::NONE});
    return *this;
}

PatternRegistry::Builder& PatternRegistry::Builder::add_builtin_detectors() {
    add_detector("github_token", DetectorKind::TOKEN,
                 std::string(kGithubTokenPattern));
    add_detector("github_fine_grained_pat", DetectorKind::TOKEN,
                 std::string(kGithubPatPattern));
    add_detector("jwt", DetectorKind::TOKEN,
                 std::string(kJwtPattern));
    add_detector("authorization_header", DetectorKind::HEADER,
                 std::string(kAuthorizationHeaderPattern), 2, true);
    add_detector("auth_scheme", DetectorKind::HEADER,
                 std::string(kAuthSchemePattern), 1, true);

    // Patterns are derived from the final sensitive key set in build().
    // The quoted form goes first so a quoted value is masked up to its
    // closing quote.
    specs_.push_back(DetectorSpec{
        std::string(kQuotedAssignmentDetectorName), DetectorKind::GENERIC_SECRET, {},
        3, true, 0.0, KeyPattern::QUOTED_ASSIGNMENT});
    specs_.push_back(DetectorSpec{
        std::string(kAssignmentDetectorName), DetectorKind::GENERIC_SECRET, {},
        3, true, 0.0, KeyPattern::ASSIGNMENT});

    add_detector("hex_secret", DetectorKind::GENERIC_SECRET,
                 std::string(kHexSecretPattern));
    add_detector("base64_secret", DetectorKind::GENERIC_SECRET,
                 std::string(kBase64SecretPattern), 0, false, kBase64MinEntropy);
    specs_.back().mixed_charset = true;
    return *this;
}

PatternRegistry::Builder& PatternRegistry::Builder::remove_detector(std::string_view name) {
    std::erase_if(specs_, [name](const DetectorSpec& spec) { return spec.name == name; });
    return *this;
}

PatternRegistry::Builder& PatternRegistry::Builder::add_sensitive_key(std::string key) {
    sensitive_keys_.push_back(std::move(key));
    return *this;
}

PatternRegistry::Builder& PatternRegistry::Builder::add_builtin_sensitive_keys() {
    const auto& keys = builtin_sensitive_keys();
    sensitive_keys_.insert(sensitive_keys_.end(), keys.begin(), keys.end());
    return *this;
}

PatternRegistry::Builder& PatternRegistry::Builder::set_mask(std::string mask) {
    mask_ = std::move(mask);
    return *this;
}

std::shared_ptr<const PatternRegistry> PatternRegistry::Builder::build() const {
    if (mask_.empty()) {
        throw PatternCompilationError("", "Redaction mask must not be empty");
    }

    SensitiveKeySet keys(sensitive_keys_);

    std::vector<DetectorSpec> ordered = specs_;
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const DetectorSpec& a, const DetectorSpec& b) {
            return kind_rank(a.kind) < kind_rank(b.kind);
        });

    std::vector<Detector> detectors;
    detectors.reserve(ordered.size());
    std::unordered_set<std::string> names;

    for (const auto& spec : ordered) {
        if (spec.name.empty()) {
            throw PatternCompilationError(spec.name, "Detector name must not be empty");
        }
        if (!names.insert(spec.name).second) {
            throw PatternCompilationError(spec.name,
                std::format("Duplicate detector name '{}'", spec.name));
        }

        std::string source = spec.pattern;
        if (spec.key_pattern != KeyPattern::NONE) {
            if (keys.empty()) {
                utils::log::debug(std::format(
                    "Detector '{}' skipped: no sensitive keys configured", spec.name));
                continue;
            }
            source = (spec.key_pattern == KeyPattern::QUOTED_ASSIGNMENT)
                ? quoted_assignment_pattern(keys)
                : assignment_pattern(keys);
        }
        if (source.empty()) {
            throw PatternCompilationError(spec.name,
                std::format("Detector '{}': empty pattern", spec.name));
        }

        Detector detector;
        detector.name = spec.name;
        detector.kind = spec.kind;
        detector.source = source;
        detector.pattern = compile_or_throw(spec.name, source, spec.case_insensitive);
        detector.secret_group = spec.secret_group;
        detector.min_entropy = spec.min_entropy;
        detector.mixed_charset = spec.mixed_charset;

        if (detector.secret_group > detector.pattern.mark_count()) {
            throw PatternCompilationError(spec.name, std::format(
                "Detector '{}': secret group {} but pattern has {} capture group(s)",
                spec.name, detector.secret_group, detector.pattern.mark_count()));
        }

        // mask and detected-secret shapes must stay disjoint, otherwise
        // sanitizing already-sanitized text would not be a no-op
        if (matches_secret(detector, mask_)) {
            throw PatternCompilationError(spec.name, std::format(
                "Detector '{}' matches the redaction mask", spec.name));
        }

        detectors.push_back(std::move(detector));
    }

    utils::log::debug(std::format("Pattern registry built: {} detectors, {} sensitive keys",
                                  detectors.size(), keys.size()));

    return std::make_shared<PatternRegistry>(
        BuildTag{}, std::move(detectors), std::move(keys), mask_);
}

// ============================================================================
// PatternRegistry
// ============================================================================

PatternRegistry::PatternRegistry(BuildTag,
                                 std::vector<Detector> detectors,
                                 SensitiveKeySet keys,
                                 std::string mask)
    : detectors_(std::move(detectors)),
      sensitive_keys_(std::move(keys)),
      mask_(std::move(mask)) {}

std::shared_ptr<const PatternRegistry> PatternRegistry::defaults() {
    static const std::shared_ptr<const PatternRegistry> registry =
        Builder().add_builtin_detectors().add_builtin_sensitive_keys().build();
    return registry;
}

const Detector* PatternRegistry::find(std::string_view name) const {
    const auto it = std::find_if(detectors_.begin(), detectors_.end(),
        [name](const Detector& d) { return d.name == name; });
    return it != detectors_.end() ? &*it : nullptr;
}

std::string PatternRegistry::assignment_pattern(const SensitiveKeySet& keys) {
    // The search starts at the key itself: a leading word-character repeat
    // would be retried at every input position.
    // group 1: key name, group 2: separator with optional quotes and an
    // optional auth scheme word (kept readable), group 3: value. A scheme
    // word directly before a claimed span or the end of the text is never
    // taken as the value.
    return std::format(
        R"(((?:{})[A-Za-z0-9_.-]{{0,64}})(["']?\s{{0,8}}[:=]\s{{0,8}}["']?(?:(?:bearer|basic|token)\s{{1,8}})?)((?!(?:bearer|basic|token)\s+$)[^\s"'&,;]{{1,2048}}))",
        key_alternation(keys));
}

std::string PatternRegistry::quoted_assignment_pattern(const SensitiveKeySet& keys) {
    // group 1: key, separator, opening quote and optional scheme word;
    // group 2: the quote character; group 3: everything up to the closing quote
    return std::format(
        R"(((?:{})[A-Za-z0-9_.-]{{0,64}}["']?\s{{0,8}}[:=]\s{{0,8}}(["'])(?:(?:bearer|basic|token)\s{{1,8}})?)((?:(?!\2)[^\r\n]){{1,2048}})\2)",
        key_alternation(keys));
}

} // namespace logscrub
