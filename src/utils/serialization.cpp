#include "bootscan/utils/serialization.h"
#include "bootscan/core/errors.h"
#include <stdexcept>
#include <type_traits>

namespace bootscan {
namespace utils {

namespace {

std::string requireString(const nlohmann::json& value, const std::string& what) {
    if (!value.is_string()) {
        throw std::invalid_argument(what + " must be a string, got " + value.dump());
    }
    return value.get<std::string>();
}

std::vector<std::string> requireStringList(const nlohmann::json& value, const std::string& what) {
    if (value.is_string()) {
        return {value.get<std::string>()};
    }
    if (!value.is_array()) {
        throw std::invalid_argument(what + " must be an array of strings, got " + value.dump());
    }
    std::vector<std::string> items;
    for (const auto& item : value) {
        items.push_back(requireString(item, what + " element"));
    }
    return items;
}

const nlohmann::json& requireKey(const nlohmann::json& object, const char* key, const std::string& what) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw std::invalid_argument(what + " is missing '" + key + "'");
    }
    return *it;
}

void assignAll(core::InstanceDeclaration& declaration, const core::UnitModel& model,
               const std::string& unit, const nlohmann::json& attributes) {
    if (!attributes.is_object()) {
        throw std::invalid_argument("attributes of " + unit + " must be an object");
    }
    for (const auto& [name, value] : attributes.items()) {
        core::AttributeKey key(unit, name);
        if (!model.contains(key)) {
            throw core::InvalidAssignmentError(key, "no such attribute in " + model.rootName());
        }
        declaration.set(key, parseAttributeValue(value, model.typeOf(key)));
    }
}

} // namespace

core::AttributeValue parseAttributeValue(const nlohmann::json& value, core::AttributeType type) {
    switch (type) {
        case core::AttributeType::String:
            return requireString(value, "string attribute");
        case core::AttributeType::StringList:
            return requireStringList(value, "string list attribute");
        case core::AttributeType::TypeRef:
            return core::TypeRef(requireString(value, "type attribute"));
        case core::AttributeType::TypeRefList: {
            std::vector<core::TypeRef> types;
            for (auto& name : requireStringList(value, "type list attribute")) {
                types.emplace_back(std::move(name));
            }
            return types;
        }
        case core::AttributeType::Boolean:
            if (!value.is_boolean()) {
                throw std::invalid_argument("boolean attribute must be true or false, got " + value.dump());
            }
            return value.get<bool>();
        case core::AttributeType::Enum: {
            auto text = requireString(value, "enum attribute");
            auto dot = text.rfind('.');
            if (dot == std::string::npos || dot == 0 || dot + 1 == text.size()) {
                throw std::invalid_argument("enum attribute must look like Type.CONSTANT, got " + text);
            }
            return core::EnumValue{text.substr(0, dot), text.substr(dot + 1)};
        }
    }
    throw std::invalid_argument("unsupported attribute type");
}

nlohmann::json toJson(const core::AttributeValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, core::TypeRef>) {
            return v.qualifiedName;
        } else if constexpr (std::is_same_v<V, std::vector<core::TypeRef>>) {
            nlohmann::json names = nlohmann::json::array();
            for (const auto& type : v) {
                names.push_back(type.qualifiedName);
            }
            return names;
        } else if constexpr (std::is_same_v<V, core::EnumValue>) {
            return v.enumType + "." + v.constant;
        } else {
            return v;
        }
    }, value);
}

core::ExclusionFilter parseExclusionFilter(const nlohmann::json& filter) {
    if (!filter.is_object()) {
        throw std::invalid_argument("exclusion filter must be an object, got " + filter.dump());
    }
    auto type = requireString(requireKey(filter, "type", "exclusion filter"), "exclusion filter type");

    if (type == "regex") {
        return core::ByRegexName(requireString(requireKey(filter, "pattern", "regex filter"), "pattern"));
    }
    if (type == "annotation") {
        return core::ByAnnotationType{
            core::TypeRef(requireString(requireKey(filter, "class", "annotation filter"), "class"))};
    }
    if (type == "assignable") {
        return core::ByAssignableType{
            core::TypeRef(requireString(requireKey(filter, "class", "assignable filter"), "class"))};
    }
    throw std::invalid_argument("unknown exclusion filter type '" + type + "'");
}

nlohmann::json toJson(const core::ExclusionFilter& filter) {
    if (const auto* regex = std::get_if<core::ByRegexName>(&filter)) {
        return {{"type", "regex"}, {"pattern", regex->pattern()}};
    }
    if (const auto* annotation = std::get_if<core::ByAnnotationType>(&filter)) {
        return {{"type", "annotation"}, {"class", annotation->annotation.qualifiedName}};
    }
    if (const auto* assignable = std::get_if<core::ByAssignableType>(&filter)) {
        return {{"type", "assignable"}, {"class", assignable->type.qualifiedName}};
    }
    return {{"type", "custom"}, {"description", std::get<core::Custom>(filter).description}};
}

core::InstanceDeclaration parseDeclaration(const nlohmann::json& declaration, const core::UnitModel& model) {
    if (!declaration.is_object()) {
        throw std::invalid_argument("declaration must be an object");
    }
    core::InstanceDeclaration result(
        core::TypeRef(requireString(requireKey(declaration, "entry_point", "declaration"), "entry_point")));

    if (auto it = declaration.find("attributes"); it != declaration.end()) {
        assignAll(result, model, model.rootName(), *it);
    }
    if (auto it = declaration.find("units"); it != declaration.end()) {
        if (!it->is_object()) {
            throw std::invalid_argument("'units' must be an object keyed by unit name");
        }
        for (const auto& [unit, attributes] : it->items()) {
            assignAll(result, model, unit, attributes);
        }
    }
    return result;
}

nlohmann::json toJson(const core::ScanSpec& spec) {
    nlohmann::json filters = nlohmann::json::array();
    for (const auto& filter : spec.excludeFilters.filters()) {
        filters.push_back(toJson(filter));
    }
    return {
        {"base_packages", spec.basePackages},
        {"name_generator", spec.nameGenerator ? nlohmann::json(spec.nameGenerator->qualifiedName)
                                              : nlohmann::json(nullptr)},
        {"lazy_init", spec.lazyInit},
        {"exclude_filters", filters},
    };
}

nlohmann::json toJson(const core::BootstrapPlan& plan) {
    nlohmann::json unmatched = nlohmann::json::array();
    for (const auto& type : plan.deferred.unmatchedExcludes) {
        unmatched.push_back(type.qualifiedName);
    }
    return {
        {"scan", toJson(plan.scanSpec)},
        {"explicit", plan.explicitRegistrations},
        {"excluded_components", plan.excludedComponents},
        {"deferred_imports", plan.deferred.imports},
        {"unmatched_excludes", unmatched},
        {"unmatched_exclude_names", plan.deferred.unmatchedExcludeNames},
        {"proxy_bean_methods", plan.proxyBeanMethods},
    };
}

} // namespace utils
} // namespace bootscan
