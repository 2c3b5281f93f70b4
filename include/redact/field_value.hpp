#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace logscrub {

struct Mapping;
struct Sequence;
class FieldObject;
class OpaqueValue;

/**
 * @brief A structured-logging value: scalar leaf or reference to a container
 *
 * Containers are held by shared_ptr, so a payload may share sub-trees or
 * even contain itself; identity() exposes the node address used for cycle
 * detection. Copying a FieldValue copies the reference, not the container.
 */
class FieldValue {
public:
    enum class Kind {
        NUL,
        BOOLEAN,
        INTEGER,
        REAL,
        STRING,
        MAPPING,
        SEQUENCE,
        OBJECT,
        OPAQUE
    };

    // ===== Constructors =====

    FieldValue() = default;
    FieldValue(std::nullptr_t) {}
    FieldValue(bool v) : data_(v) {}

    template <typename T>
        requires (std::is_integral_v<T> && !std::is_same_v<T, bool>)
    FieldValue(T v) : data_(static_cast<std::int64_t>(v)) {}

    FieldValue(double v) : data_(v) {}
    FieldValue(const char* v) : data_(std::string(v)) {}
    FieldValue(std::string_view v) : data_(std::string(v)) {}
    FieldValue(std::string v) : data_(std::move(v)) {}
    FieldValue(std::shared_ptr<Mapping> v);
    FieldValue(std::shared_ptr<Sequence> v);
    FieldValue(std::shared_ptr<const FieldObject> v);
    FieldValue(std::shared_ptr<const OpaqueValue> v);

    // ===== Factories =====

    [[nodiscard]] static FieldValue mapping(
        std::initializer_list<std::pair<std::string, FieldValue>> entries = {});
    [[nodiscard]] static FieldValue sequence(std::initializer_list<FieldValue> items = {});

    // ===== Type Checks =====

    [[nodiscard]] Kind kind() const;
    [[nodiscard]] bool is_null() const { return kind() == Kind::NUL; }
    [[nodiscard]] bool is_string() const { return kind() == Kind::STRING; }
    [[nodiscard]] bool is_mapping() const { return kind() == Kind::MAPPING; }
    [[nodiscard]] bool is_sequence() const { return kind() == Kind::SEQUENCE; }
    [[nodiscard]] bool is_object() const { return kind() == Kind::OBJECT; }
    [[nodiscard]] bool is_opaque() const { return kind() == Kind::OPAQUE; }

    /// Mapping, sequence or object
    [[nodiscard]] bool is_container() const;

    // ===== Value Access (std::bad_variant_access on kind mismatch) =====

    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    [[nodiscard]] double as_real() const { return std::get<double>(data_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const std::shared_ptr<Mapping>& as_mapping() const {
        return std::get<std::shared_ptr<Mapping>>(data_);
    }
    [[nodiscard]] const std::shared_ptr<Sequence>& as_sequence() const {
        return std::get<std::shared_ptr<Sequence>>(data_);
    }
    [[nodiscard]] const std::shared_ptr<const FieldObject>& as_object() const {
        return std::get<std::shared_ptr<const FieldObject>>(data_);
    }
    [[nodiscard]] const std::shared_ptr<const OpaqueValue>& as_opaque() const {
        return std::get<std::shared_ptr<const OpaqueValue>>(data_);
    }

    /// Address of the referenced container, nullptr for leaves
    [[nodiscard]] const void* identity() const;

    /// Deep structural equality. Both sides must be acyclic.
    friend bool operator==(const FieldValue& a, const FieldValue& b);

private:
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 double,
                 std::string,
                 std::shared_ptr<Mapping>,
                 std::shared_ptr<Sequence>,
                 std::shared_ptr<const FieldObject>,
                 std::shared_ptr<const OpaqueValue>> data_;
};

using Field = std::pair<std::string, FieldValue>;

/// Ordered name -> value mapping; insertion order is preserved
struct Mapping {
    std::vector<Field> entries;

    Mapping() = default;
    Mapping(std::initializer_list<Field> init) : entries(init) {}

    [[nodiscard]] size_t size() const { return entries.size(); }
    [[nodiscard]] bool empty() const { return entries.empty(); }

    /// First value stored under key, nullptr if absent
    [[nodiscard]] const FieldValue* find(std::string_view key) const;

    void set(std::string key, FieldValue value);
};

struct Sequence {
    std::vector<FieldValue> items;

    Sequence() = default;
    Sequence(std::initializer_list<FieldValue> init) : items(init) {}

    [[nodiscard]] size_t size() const { return items.size(); }
    [[nodiscard]] bool empty() const { return items.empty(); }
};

/**
 * @brief Adapter for application objects that expose named fields.
 *
 * Sanitized output renders an object as a Mapping with the same field names.
 * fields() may throw; the sanitizer then substitutes the unloggable marker.
 */
class FieldObject {
public:
    virtual ~FieldObject() = default;

    [[nodiscard]] virtual std::string type_name() const = 0;
    [[nodiscard]] virtual std::vector<Field> fields() const = 0;
};

/**
 * @brief Leaf of a type the sanitizer cannot inspect structurally.
 *
 * It is stringified, scanned, and logged as a string.
 */
class OpaqueValue {
public:
    virtual ~OpaqueValue() = default;

    [[nodiscard]] virtual std::string type_name() const = 0;
    [[nodiscard]] virtual std::string to_log_string() const = 0;
};

[[nodiscard]] const char* field_kind_to_string(FieldValue::Kind kind);

} // namespace logscrub
