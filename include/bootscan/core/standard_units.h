#pragma once

#include "bootscan/core/attribute.h"
#include "bootscan/core/unit_definition.h"
#include <memory>

namespace bootscan {
namespace core {

/**
 * @brief Definitions of the composed bootstrap marker and the directives it aggregates.
 *
 * BootApplication composes:
 * - BootConfiguration, which composes Configuration (factory-method declarations)
 * - EnableAutoConfiguration (automatic capability discovery)
 * - ComponentScan (component scanning with exclusions)
 *
 * Every attribute of BootApplication is an alias of the matching attribute of
 * one of those directives. Each definition is created once and shared.
 */
namespace units {

inline constexpr const char* kConfiguration = "bootscan.Configuration";
inline constexpr const char* kBootConfiguration = "bootscan.BootConfiguration";
inline constexpr const char* kEnableAutoConfiguration = "bootscan.EnableAutoConfiguration";
inline constexpr const char* kComponentScan = "bootscan.ComponentScan";
inline constexpr const char* kBootApplication = "bootscan.BootApplication";

// Default of nameGenerator: "use whatever generator the container would use"
inline constexpr const char* kInheritNameGenerator = "bootscan.NameGenerator";

// Attribute names
inline constexpr const char* kValue = "value";
inline constexpr const char* kProxyBeanMethods = "proxyBeanMethods";
inline constexpr const char* kExclude = "exclude";
inline constexpr const char* kExcludeName = "excludeName";
inline constexpr const char* kBasePackages = "basePackages";
inline constexpr const char* kBasePackageClasses = "basePackageClasses";
inline constexpr const char* kNameGenerator = "nameGenerator";
inline constexpr const char* kLazyInit = "lazyInit";
inline constexpr const char* kScopedProxy = "scopedProxy";
inline constexpr const char* kScanBasePackages = "scanBasePackages";
inline constexpr const char* kScanBasePackageClasses = "scanBasePackageClasses";

std::shared_ptr<const UnitDefinition> configuration();
std::shared_ptr<const UnitDefinition> bootConfiguration();
std::shared_ptr<const UnitDefinition> enableAutoConfiguration();
std::shared_ptr<const UnitDefinition> componentScan();
std::shared_ptr<const UnitDefinition> bootApplication();

inline AttributeKey bootKey(const char* attribute) {
    return AttributeKey(kBootApplication, attribute);
}

} // namespace units
} // namespace core
} // namespace bootscan
