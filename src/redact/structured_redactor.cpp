#include "redact/structured_redactor.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <exception>
#include <format>
#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace logscrub {

namespace {

template <typename T>
std::string safe_type_name(const T& adapter) {
    try {
        return adapter.type_name();
    } catch (const std::exception&) {
        return "<unnamed>";
    }
}

/**
 * @brief One sanitization walk. Not shared between calls.
 */
class Walker {
public:
    Walker(const TextRedactor& text, const PatternRegistry& registry,
           StructuredRedactor::Stats& stats)
        : text_(text),
          keys_(registry.sensitive_keys()),
          mask_(registry.mask()),
          stats_(stats) {}

    FieldValue run(const FieldValue& root) {
        FieldValue immediate;
        if (!enter(root, immediate)) {
            return immediate;
        }

        while (!stack_.empty()) {
            const size_t top = stack_.size() - 1;

            if (stack_[top].next >= child_count(stack_[top])) {
                FieldValue done = std::move(stack_[top].output);
                finished_.emplace(stack_[top].id, done);
                on_path_.erase(stack_[top].id);
                stack_.pop_back();

                if (stack_.empty()) {
                    return done;
                }
                attach(stack_.back(), std::move(done));
                continue;
            }

            const size_t index = stack_[top].next++;
            auto [key, child, keyed] = child_at(stack_[top], index);

            if (keyed && keys_.is_sensitive(key)) {
                ++stats_.keys_masked;
                stack_[top].pending_key = std::move(key);
                attach(stack_[top], FieldValue(mask_));
                continue;
            }

            stack_[top].pending_key = std::move(key);

            FieldValue value;
            if (enter(child, value)) {
                continue;   // attached when the child frame completes
            }
            attach(stack_[top], std::move(value));
        }
        return FieldValue();
    }

private:
    struct Frame {
        const void* id = nullptr;
        FieldValue::Kind kind = FieldValue::Kind::NUL;
        FieldValue source;                  // keeps the node alive
        std::vector<Field> object_fields;   // snapshot of FieldObject::fields()
        FieldValue output;
        size_t next = 0;
        std::string pending_key;
    };

    struct Child {
        std::string key;
        FieldValue value;
        bool keyed;
    };

    static size_t child_count(const Frame& frame) {
        switch (frame.kind) {
            case FieldValue::Kind::MAPPING: return frame.source.as_mapping()->size();
            case FieldValue::Kind::SEQUENCE: return frame.source.as_sequence()->size();
            case FieldValue::Kind::OBJECT: return frame.object_fields.size();
            default: return 0;
        }
    }

    static Child child_at(const Frame& frame, size_t index) {
        switch (frame.kind) {
            case FieldValue::Kind::MAPPING: {
                const auto& entry = frame.source.as_mapping()->entries[index];
                return {entry.first, entry.second, true};
            }
            case FieldValue::Kind::SEQUENCE:
                return {{}, frame.source.as_sequence()->items[index], false};
            case FieldValue::Kind::OBJECT: {
                const auto& field = frame.object_fields[index];
                return {field.first, field.second, true};
            }
            default:
                return {{}, FieldValue(), false};
        }
    }

    static void attach(Frame& parent, FieldValue value) {
        if (parent.output.is_sequence()) {
            parent.output.as_sequence()->items.push_back(std::move(value));
        } else {
            parent.output.as_mapping()->entries.emplace_back(
                std::move(parent.pending_key), std::move(value));
            parent.pending_key.clear();
        }
    }

    // Pushes a frame for a container not yet seen and returns true. Otherwise
    // stores the finished value in out and returns false.
    bool enter(const FieldValue& node, FieldValue& out) {
        const auto kind = node.kind();
        if (kind != FieldValue::Kind::MAPPING &&
            kind != FieldValue::Kind::SEQUENCE &&
            kind != FieldValue::Kind::OBJECT) {
            out = leaf(node);
            return false;
        }

        const void* id = node.identity();
        if (id == nullptr) {
            out = FieldValue();
            return false;
        }
        if (on_path_.contains(id)) {
            ++stats_.cycles_broken;
            out = FieldValue(mask_);
            return false;
        }
        if (const auto it = finished_.find(id); it != finished_.end()) {
            out = it->second;
            return false;
        }

        Frame frame;
        frame.id = id;
        frame.kind = kind;
        frame.source = node;

        switch (kind) {
            case FieldValue::Kind::MAPPING: {
                auto mapping = std::make_shared<Mapping>();
                mapping->entries.reserve(node.as_mapping()->size());
                frame.output = FieldValue(std::move(mapping));
                break;
            }
            case FieldValue::Kind::SEQUENCE: {
                auto sequence = std::make_shared<Sequence>();
                sequence->items.reserve(node.as_sequence()->size());
                frame.output = FieldValue(std::move(sequence));
                break;
            }
            default: {
                try {
                    frame.object_fields = node.as_object()->fields();
                } catch (const std::exception&) {
                    utils::log::warn(std::format(
                        "Object of type '{}' could not be enumerated; logged as unloggable",
                        safe_type_name(*node.as_object())));
                    ++stats_.unloggable_values;
                    out = FieldValue(kUnloggableMarker);
                    return false;
                }
                auto mapping = std::make_shared<Mapping>();
                mapping->entries.reserve(frame.object_fields.size());
                frame.output = FieldValue(std::move(mapping));
                break;
            }
        }

        ++stats_.containers_visited;
        on_path_.insert(id);
        stack_.push_back(std::move(frame));
        return true;
    }

    FieldValue leaf(const FieldValue& value) {
        switch (value.kind()) {
            case FieldValue::Kind::STRING:
                return redact_string(value.as_string());

            case FieldValue::Kind::OPAQUE: {
                const auto& opaque = value.as_opaque();
                if (!opaque) return FieldValue();
                std::string rendered;
                try {
                    rendered = opaque->to_log_string();
                } catch (const std::exception&) {
                    utils::log::warn(std::format(
                        "Value of type '{}' could not be stringified; logged as unloggable",
                        safe_type_name(*opaque)));
                    ++stats_.unloggable_values;
                    return FieldValue(kUnloggableMarker);
                }
                return redact_string(rendered);
            }

            default:
                return value;
        }
    }

    FieldValue redact_string(const std::string& text) {
        try {
            auto redacted = text_.redact(text);
            if (redacted != text) ++stats_.strings_redacted;
            return FieldValue(std::move(redacted));
        } catch (const std::regex_error& e) {
            utils::log::warn(std::format(
                "Regex engine gave up on a {}-byte string ({}); logged as unloggable",
                text.size(), e.what()));
            ++stats_.unloggable_values;
            return FieldValue(kUnloggableMarker);
        }
    }

    const TextRedactor& text_;
    const SensitiveKeySet& keys_;
    const std::string& mask_;
    StructuredRedactor::Stats& stats_;

    std::vector<Frame> stack_;
    std::unordered_set<const void*> on_path_;
    std::unordered_map<const void*, FieldValue> finished_;
};

} // anonymous namespace

StructuredRedactor::StructuredRedactor(std::shared_ptr<const PatternRegistry> registry)
    : registry_(registry ? std::move(registry) : PatternRegistry::defaults()),
      text_(registry_) {}

FieldValue StructuredRedactor::redact(const FieldValue& value) const {
    Stats stats;
    return redact(value, stats);
}

FieldValue StructuredRedactor::redact(const FieldValue& value, Stats& stats) const {
    Walker walker(text_, *registry_, stats);
    return walker.run(value);
}

} // namespace logscrub
