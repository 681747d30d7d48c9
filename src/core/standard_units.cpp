#include "bootscan/core/standard_units.h"

namespace bootscan {
namespace core {
namespace units {

namespace {

using StringList = std::vector<std::string>;
using TypeRefList = std::vector<TypeRef>;

} // namespace

std::shared_ptr<const UnitDefinition> configuration() {
    static const auto unit = std::make_shared<const UnitDefinition>(UnitDefinition{
        kConfiguration,
        {
            {kValue, AttributeType::String, std::string()},
            {kProxyBeanMethods, AttributeType::Boolean, true},
        },
        {},
        {},
    });
    return unit;
}

std::shared_ptr<const UnitDefinition> bootConfiguration() {
    static const auto unit = std::make_shared<const UnitDefinition>(UnitDefinition{
        kBootConfiguration,
        {
            {kProxyBeanMethods, AttributeType::Boolean, true},
        },
        {
            {kProxyBeanMethods, kConfiguration, ""},
        },
        {
            {configuration(), {}},
        },
    });
    return unit;
}

std::shared_ptr<const UnitDefinition> enableAutoConfiguration() {
    static const auto unit = std::make_shared<const UnitDefinition>(UnitDefinition{
        kEnableAutoConfiguration,
        {
            {kExclude, AttributeType::TypeRefList, TypeRefList{}},
            {kExcludeName, AttributeType::StringList, StringList{}},
        },
        {},
        {},
    });
    return unit;
}

std::shared_ptr<const UnitDefinition> componentScan() {
    static const auto unit = std::make_shared<const UnitDefinition>(UnitDefinition{
        kComponentScan,
        {
            {kValue, AttributeType::StringList, StringList{}},
            {kBasePackages, AttributeType::StringList, StringList{}},
            {kBasePackageClasses, AttributeType::TypeRefList, TypeRefList{}},
            {kNameGenerator, AttributeType::TypeRef, TypeRef(kInheritNameGenerator)},
            {kLazyInit, AttributeType::Boolean, false},
            {kScopedProxy, AttributeType::Enum, EnumValue{"ScopedProxyMode", "DEFAULT"}},
        },
        {
            {kValue, "", kBasePackages},
            {kBasePackages, "", kValue},
        },
        {},
    });
    return unit;
}

std::shared_ptr<const UnitDefinition> bootApplication() {
    static const auto unit = std::make_shared<const UnitDefinition>(UnitDefinition{
        kBootApplication,
        {
            {kExclude, AttributeType::TypeRefList, TypeRefList{}},
            {kExcludeName, AttributeType::StringList, StringList{}},
            {kScanBasePackages, AttributeType::StringList, StringList{}},
            {kScanBasePackageClasses, AttributeType::TypeRefList, TypeRefList{}},
            {kNameGenerator, AttributeType::TypeRef, TypeRef(kInheritNameGenerator)},
            {kProxyBeanMethods, AttributeType::Boolean, true},
        },
        {
            {kExclude, kEnableAutoConfiguration, ""},
            {kExcludeName, kEnableAutoConfiguration, ""},
            {kScanBasePackages, kComponentScan, kBasePackages},
            {kScanBasePackageClasses, kComponentScan, kBasePackageClasses},
            {kNameGenerator, kComponentScan, kNameGenerator},
            {kProxyBeanMethods, kConfiguration, ""},
        },
        {
            {bootConfiguration(), {}},
            {enableAutoConfiguration(), {}},
            {componentScan(), {}},
        },
    });
    return unit;
}

} // namespace units
} // namespace core
} // namespace bootscan
