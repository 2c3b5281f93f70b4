#include "redact/text_redactor.hpp"

#include <algorithm>
#include <cstddef>
#include <regex>
#include <utility>

namespace logscrub {

namespace {

using SvIterator = std::string_view::const_iterator;
using SvRegexIterator = std::regex_iterator<SvIterator>;
using Range = std::pair<size_t, size_t>;   // [begin, end)

// Upper bound on re-scans in redact(). Output normally settles after the
// first confirming pass.
constexpr int kMaxPasses = 4;

std::vector<Range> unclaimed_gaps(const std::vector<Range>& claimed, size_t length) {
    std::vector<Range> gaps;
    size_t pos = 0;
    for (const auto& [begin, end] : claimed) {
        if (begin > pos) gaps.emplace_back(pos, begin);
        pos = std::max(pos, end);
    }
    if (pos < length) gaps.emplace_back(pos, length);
    return gaps;
}

void merge_claims(std::vector<Range>& claimed, const std::vector<Range>& fresh) {
    if (fresh.empty()) return;
    claimed.insert(claimed.end(), fresh.begin(), fresh.end());
    std::sort(claimed.begin(), claimed.end());
}

void add_unmasked_pieces(std::vector<RedactionSpan>& spans, std::string_view secret,
                         size_t offset, std::string_view mask, const Detector& detector) {
    size_t pos = 0;
    while (pos < secret.size()) {
        const size_t hit = secret.find(mask, pos);
        const size_t piece_end = (hit == std::string_view::npos) ? secret.size() : hit;
        if (piece_end > pos) {
            spans.push_back(RedactionSpan{
                offset + pos, offset + piece_end, detector.name, detector.kind});
        }
        if (hit == std::string_view::npos) break;
        pos = hit + mask.size();
    }
}

} // anonymous namespace

TextRedactor::TextRedactor(std::shared_ptr<const PatternRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        registry_ = PatternRegistry::defaults();
    }
}

std::vector<RedactionSpan> TextRedactor::find_spans(std::string_view text) const {
    std::vector<RedactionSpan> spans;
    if (text.empty()) return spans;

    const std::string_view mask = registry_->mask();
    std::vector<Range> claimed;

    for (const auto& detector : registry_->detectors()) {
        std::vector<Range> fresh;

        for (const auto& [gap_begin, gap_end] : unclaimed_gaps(claimed, text.size())) {
            const auto first = text.begin() + static_cast<std::ptrdiff_t>(gap_begin);
            const auto last = text.begin() + static_cast<std::ptrdiff_t>(gap_end);

            // Let \b see the byte before the gap
            const auto flags = gap_begin > 0
                ? std::regex_constants::match_prev_avail
                : std::regex_constants::match_default;

            for (SvRegexIterator it(first, last, detector.pattern, flags), end; it != end; ++it) {
                const auto& match = *it;
                const auto& secret = match[detector.secret_group];
                if (!secret.matched || secret.length() == 0) continue;

                const auto secret_begin = static_cast<size_t>(secret.first - text.begin());
                const auto secret_len = static_cast<size_t>(secret.length());
                const std::string_view secret_text = text.substr(secret_begin, secret_len);

                if (secret_text.find(mask) != std::string_view::npos) {
                    // Partly masked already: redact only what lies between masks
                    fresh.emplace_back(secret_begin, secret_begin + secret_len);
                    add_unmasked_pieces(spans, secret_text, secret_begin, mask, detector);
                    continue;
                }

                if (!detector.accepts(secret_text)) {
                    continue;
                }

                fresh.emplace_back(secret_begin, secret_begin + secret_len);
                spans.push_back(RedactionSpan{
                    secret_begin, secret_begin + secret_len, detector.name, detector.kind});
            }
        }

        merge_claims(claimed, fresh);
    }

    std::sort(spans.begin(), spans.end(),
        [](const RedactionSpan& a, const RedactionSpan& b) { return a.begin < b.begin; });
    return spans;
}

std::string TextRedactor::apply_spans(std::string_view text,
                                      const std::vector<RedactionSpan>& spans,
                                      std::string_view mask) {
    std::string out;
    out.reserve(text.size() + spans.size() * mask.size());

    size_t pos = 0;
    for (const auto& span : spans) {
        if (span.begin < pos || span.end > text.size()) continue;
        out.append(text.substr(pos, span.begin - pos));
        out.append(mask);
        pos = span.end;
    }
    out.append(text.substr(pos));
    return out;
}

std::string TextRedactor::redact(std::string_view text) const {
    auto spans = find_spans(text);
    if (spans.empty()) {
        return std::string(text);
    }

    // Re-scan until a pass finds nothing. A detector whose kept context (a
    // scheme word, a key name) is only recognizable next to the live secret
    // could otherwise let a later call redact that context.
    std::string current = apply_spans(text, spans, registry_->mask());
    for (int pass = 1; pass < kMaxPasses; ++pass) {
        spans = find_spans(current);
        if (spans.empty()) break;
        current = apply_spans(current, spans, registry_->mask());
    }
    return current;
}

bool TextRedactor::contains_secret(std::string_view text) const {
    return !find_spans(text).empty();
}

} // namespace logscrub
