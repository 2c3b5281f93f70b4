#include "payload/json_payload.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <cstdint>
#include <exception>
#include <format>
#include <limits>
#include <memory>
#include <unordered_set>

namespace logscrub {

namespace {

// Largest double range where every integer is exactly representable
constexpr double kMaxExactInteger = 9007199254740992.0;   // 2^53

FieldValue number_from_json(double d) {
    if (std::isfinite(d) && d == std::floor(d) &&
        d >= -kMaxExactInteger && d <= kMaxExactInteger) {
        return FieldValue(static_cast<std::int64_t>(d));
    }
    return FieldValue(d);
}

class JsonWriter {
public:
    std::string write(const FieldValue& value) {
        append(value);
        return std::move(out_);
    }

private:
    void append(const FieldValue& value) {
        switch (value.kind()) {
            case FieldValue::Kind::NUL:
                out_ += "null";
                break;
            case FieldValue::Kind::BOOLEAN:
                out_ += value.as_bool() ? "true" : "false";
                break;
            case FieldValue::Kind::INTEGER:
                out_ += std::format("{}", value.as_integer());
                break;
            case FieldValue::Kind::REAL: {
                const double d = value.as_real();
                out_ += std::isfinite(d) ? std::format("{}", d) : "null";
                break;
            }
            case FieldValue::Kind::STRING:
                append_string(value.as_string());
                break;
            case FieldValue::Kind::MAPPING:
                if (enter(value)) {
                    append_fields(value.as_mapping()->entries);
                    leave(value);
                }
                break;
            case FieldValue::Kind::SEQUENCE:
                if (enter(value)) {
                    out_ += '[';
                    bool first = true;
                    for (const auto& item : value.as_sequence()->items) {
                        if (!first) out_ += ',';
                        first = false;
                        append(item);
                    }
                    out_ += ']';
                    leave(value);
                }
                break;
            case FieldValue::Kind::OBJECT:
                if (enter(value)) {
                    try {
                        append_fields(value.as_object()->fields());
                    } catch (const std::exception&) {
                        append_string(kUnloggableMarker);
                    }
                    leave(value);
                }
                break;
            case FieldValue::Kind::OPAQUE: {
                const auto& opaque = value.as_opaque();
                if (!opaque) {
                    out_ += "null";
                    break;
                }
                try {
                    append_string(opaque->to_log_string());
                } catch (const std::exception&) {
                    append_string(kUnloggableMarker);
                }
                break;
            }
        }
    }

    void append_fields(const std::vector<Field>& fields) {
        out_ += '{';
        bool first = true;
        for (const auto& [key, item] : fields) {
            if (!first) out_ += ',';
            first = false;
            append_string(key);
            out_ += ':';
            append(item);
        }
        out_ += '}';
    }

    void append_string(std::string_view s) {
        out_ += '"';
        out_ += utils::escape_json(s);
        out_ += '"';
    }

    // False (and null written) for a null pointer or a container already open
    bool enter(const FieldValue& value) {
        const void* id = value.identity();
        if (id == nullptr || !open_.insert(id).second) {
            out_ += "null";
            return false;
        }
        return true;
    }

    void leave(const FieldValue& value) {
        open_.erase(value.identity());
    }

    std::string out_;
    std::unordered_set<const void*> open_;
};

} // anonymous namespace

FieldValue from_json(const glz::json_t& json) {
    if (json.is_null()) {
        return FieldValue();
    }
    if (json.is_boolean()) {
        return FieldValue(json.get<bool>());
    }
    if (json.is_number()) {
        return number_from_json(json.get<double>());
    }
    if (json.is_string()) {
        return FieldValue(json.get<std::string>());
    }
    if (json.is_array()) {
        auto sequence = std::make_shared<Sequence>();
        const auto& arr = json.get_array();
        sequence->items.reserve(arr.size());
        for (const auto& item : arr) {
            sequence->items.push_back(from_json(item));
        }
        return FieldValue(std::move(sequence));
    }
    if (json.is_object()) {
        auto mapping = std::make_shared<Mapping>();
        const auto& obj = json.get_object();
        mapping->entries.reserve(obj.size());
        for (const auto& [key, item] : obj) {
            mapping->entries.emplace_back(key, from_json(item));
        }
        return FieldValue(std::move(mapping));
    }
    return FieldValue();
}

Result<FieldValue> parse_json_payload(std::string_view text) {
    glz::json_t parsed;
    const std::string buffer(text);
    const auto ec = glz::read_json(parsed, buffer);
    if (ec) {
        return Result<FieldValue>::error(ErrorCategory::PARSE_ERROR,
            std::format("JSON parse error ({} bytes)", text.size()));
    }
    return Result<FieldValue>::ok(from_json(parsed));
}

std::string to_json(const FieldValue& value) {
    JsonWriter writer;
    return writer.write(value);
}

SanitizedJsonLine sanitize_json_line(const Sanitizer& sanitizer,
                                     std::string_view line,
                                     StructuredRedactor::Stats& stats) {
    SanitizedJsonLine result;
    auto parsed = parse_json_payload(line);
    if (!parsed.is_ok()) {
        result.json = to_json(FieldValue(sanitizer.sanitize_message(line)));
        return result;
    }
    result.parsed = true;
    result.json = to_json(sanitizer.sanitize_fields(parsed.value(), stats));
    return result;
}

} // namespace logscrub
