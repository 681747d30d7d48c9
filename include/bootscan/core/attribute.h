#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Declared type of a unit attribute.
 */
enum class AttributeType {
    String,
    StringList,
    TypeRef,
    TypeRefList,
    Boolean,
    Enum
};

const char* toString(AttributeType type);

/**
 * @brief Reference to a type by its fully-qualified, dot-separated name.
 *
 * Type identity is name identity: two references are the same type iff their
 * qualified names are equal.
 */
struct TypeRef {
    std::string qualifiedName;

    TypeRef() = default;
    explicit TypeRef(std::string name) : qualifiedName(std::move(name)) {}

    /**
     * @brief Portion of the name before the last '.', empty for the default package.
     */
    std::string packageName() const;

    std::string simpleName() const;

    bool operator==(const TypeRef& other) const { return qualifiedName == other.qualifiedName; }
    bool operator!=(const TypeRef& other) const { return !(*this == other); }
    bool operator<(const TypeRef& other) const { return qualifiedName < other.qualifiedName; }
};

/**
 * @brief A constant of a named enumeration, e.g. {"ScopedProxyMode", "NO"}.
 */
struct EnumValue {
    std::string enumType;
    std::string constant;

    bool operator==(const EnumValue& other) const {
        return enumType == other.enumType && constant == other.constant;
    }
    bool operator!=(const EnumValue& other) const { return !(*this == other); }
};

/**
 * @brief Value of an attribute. The variant index always agrees with AttributeType.
 */
using AttributeValue = std::variant<
    std::string,
    std::vector<std::string>,
    TypeRef,
    std::vector<TypeRef>,
    bool,
    EnumValue
>;

AttributeType typeOf(const AttributeValue& value);

/**
 * @brief Human-readable rendering used in diagnostics, e.g. `{"a", "b"}` or `true`.
 */
std::string describe(const AttributeValue& value);

/**
 * @brief Identifies an attribute by owning unit and attribute name.
 */
struct AttributeKey {
    std::string unit;
    std::string attribute;

    AttributeKey() = default;
    AttributeKey(std::string u, std::string a)
        : unit(std::move(u)), attribute(std::move(a)) {}

    /**
     * @brief Renders as "Unit.attribute".
     */
    std::string toString() const { return unit + "." + attribute; }

    bool operator==(const AttributeKey& other) const {
        return unit == other.unit && attribute == other.attribute;
    }
    bool operator!=(const AttributeKey& other) const { return !(*this == other); }
    bool operator<(const AttributeKey& other) const {
        if (unit != other.unit) return unit < other.unit;
        return attribute < other.attribute;
    }
};

/**
 * @brief Static definition of one attribute of a declarative unit.
 */
struct AttributeDefinition {
    std::string name;
    AttributeType type{AttributeType::String};
    AttributeValue defaultValue;
};

} // namespace core
} // namespace bootscan

namespace std {
template <>
struct hash<bootscan::core::AttributeKey> {
    size_t operator()(const bootscan::core::AttributeKey& key) const {
        size_t h1 = hash<string>{}(key.unit);
        size_t h2 = hash<string>{}(key.attribute);
        return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    }
};
} // namespace std
