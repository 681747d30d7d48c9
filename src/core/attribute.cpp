#include "bootscan/core/attribute.h"
#include <sstream>
#include <type_traits>

namespace bootscan {
namespace core {

const char* toString(AttributeType type) {
    switch (type) {
        case AttributeType::String: return "string";
        case AttributeType::StringList: return "string[]";
        case AttributeType::TypeRef: return "type";
        case AttributeType::TypeRefList: return "type[]";
        case AttributeType::Boolean: return "boolean";
        case AttributeType::Enum: return "enum";
    }
    return "unknown";
}

std::string TypeRef::packageName() const {
    auto pos = qualifiedName.rfind('.');
    if (pos == std::string::npos) {
        return "";
    }
    return qualifiedName.substr(0, pos);
}

std::string TypeRef::simpleName() const {
    auto pos = qualifiedName.rfind('.');
    if (pos == std::string::npos) {
        return qualifiedName;
    }
    return qualifiedName.substr(pos + 1);
}

AttributeType typeOf(const AttributeValue& value) {
    // Alternatives are declared in AttributeType order
    return static_cast<AttributeType>(value.index());
}

std::string describe(const AttributeValue& value) {
    std::ostringstream out;
    std::visit([&out](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
            out << '"' << v << '"';
        } else if constexpr (std::is_same_v<V, std::vector<std::string>>) {
            out << '{';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out << ", ";
                out << '"' << v[i] << '"';
            }
            out << '}';
        } else if constexpr (std::is_same_v<V, TypeRef>) {
            out << v.qualifiedName;
        } else if constexpr (std::is_same_v<V, std::vector<TypeRef>>) {
            out << '{';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out << ", ";
                out << v[i].qualifiedName;
            }
            out << '}';
        } else if constexpr (std::is_same_v<V, bool>) {
            out << (v ? "true" : "false");
        } else {
            out << v.enumType << '.' << v.constant;
        }
    }, value);
    return out.str();
}

} // namespace core
} // namespace bootscan
