#include "redact/field_value.hpp"

#include <algorithm>

namespace logscrub {

FieldValue::FieldValue(std::shared_ptr<Mapping> v) : data_(std::move(v)) {}
FieldValue::FieldValue(std::shared_ptr<Sequence> v) : data_(std::move(v)) {}
FieldValue::FieldValue(std::shared_ptr<const FieldObject> v) : data_(std::move(v)) {}
FieldValue::FieldValue(std::shared_ptr<const OpaqueValue> v) : data_(std::move(v)) {}

FieldValue FieldValue::mapping(std::initializer_list<std::pair<std::string, FieldValue>> entries) {
    return FieldValue(std::make_shared<Mapping>(entries));
}

FieldValue FieldValue::sequence(std::initializer_list<FieldValue> items) {
    return FieldValue(std::make_shared<Sequence>(items));
}

FieldValue::Kind FieldValue::kind() const {
    switch (data_.index()) {
        case 0: return Kind::NUL;
        case 1: return Kind::BOOLEAN;
        case 2: return Kind::INTEGER;
        case 3: return Kind::REAL;
        case 4: return Kind::STRING;
        case 5: return Kind::MAPPING;
        case 6: return Kind::SEQUENCE;
        case 7: return Kind::OBJECT;
        case 8: return Kind::OPAQUE;
        default: return Kind::NUL;
    }
}

bool FieldValue::is_container() const {
    const auto k = kind();
    return k == Kind::MAPPING || k == Kind::SEQUENCE || k == Kind::OBJECT;
}

const void* FieldValue::identity() const {
    switch (kind()) {
        case Kind::MAPPING: return as_mapping().get();
        case Kind::SEQUENCE: return as_sequence().get();
        case Kind::OBJECT: return as_object().get();
        case Kind::OPAQUE: return as_opaque().get();
        default: return nullptr;
    }
}

bool operator==(const FieldValue& a, const FieldValue& b) {
    if (a.kind() != b.kind()) return false;

    switch (a.kind()) {
        case FieldValue::Kind::NUL:
            return true;
        case FieldValue::Kind::BOOLEAN:
            return a.as_bool() == b.as_bool();
        case FieldValue::Kind::INTEGER:
            return a.as_integer() == b.as_integer();
        case FieldValue::Kind::REAL:
            return a.as_real() == b.as_real();
        case FieldValue::Kind::STRING:
            return a.as_string() == b.as_string();
        case FieldValue::Kind::MAPPING: {
            const auto& lhs = a.as_mapping();
            const auto& rhs = b.as_mapping();
            if (lhs == rhs) return true;
            if (!lhs || !rhs) return false;
            return lhs->entries == rhs->entries;
        }
        case FieldValue::Kind::SEQUENCE: {
            const auto& lhs = a.as_sequence();
            const auto& rhs = b.as_sequence();
            if (lhs == rhs) return true;
            if (!lhs || !rhs) return false;
            return lhs->items == rhs->items;
        }
        case FieldValue::Kind::OBJECT:
            return a.as_object() == b.as_object();
        case FieldValue::Kind::OPAQUE:
            return a.as_opaque() == b.as_opaque();
    }
    return false;
}

const FieldValue* Mapping::find(std::string_view key) const {
    const auto it = std::find_if(entries.begin(), entries.end(),
        [key](const Field& f) { return f.first == key; });
    return it != entries.end() ? &it->second : nullptr;
}

void Mapping::set(std::string key, FieldValue value) {
    const auto it = std::find_if(entries.begin(), entries.end(),
        [&key](const Field& f) { return f.first == key; });
    if (it != entries.end()) {
        it->second = std::move(value);
    } else {
        entries.emplace_back(std::move(key), std::move(value));
    }
}

const char* field_kind_to_string(FieldValue::Kind kind) {
    switch (kind) {
        case FieldValue::Kind::NUL: return "null";
        case FieldValue::Kind::BOOLEAN: return "boolean";
        case FieldValue::Kind::INTEGER: return "integer";
        case FieldValue::Kind::REAL: return "real";
        case FieldValue::Kind::STRING: return "string";
        case FieldValue::Kind::MAPPING: return "mapping";
        case FieldValue::Kind::SEQUENCE: return "sequence";
        case FieldValue::Kind::OBJECT: return "object";
        case FieldValue::Kind::OPAQUE: return "opaque";
        default: return "unknown";
    }
}

} // namespace logscrub
