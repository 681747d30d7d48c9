#ifndef BOOTSCAN_UTILS_SERIALIZATION_H
#define BOOTSCAN_UTILS_SERIALIZATION_H

#include "bootscan/core/alias_resolver.h"
#include "bootscan/core/attribute.h"
#include "bootscan/core/bootstrap_coordinator.h"
#include "bootscan/core/exclusion_filter.h"
#include "bootscan/core/scan_configuration.h"
#include <nlohmann/json.hpp>

namespace bootscan {
namespace utils {

/**
 * @brief Converts a JSON value into an attribute value of the given type.
 *
 * Mapping: String and TypeRef from a JSON string, StringList and TypeRefList
 * from an array of strings (a single string is accepted as a one-element
 * list), Boolean from a JSON boolean, Enum from "EnumType.CONSTANT".
 *
 * @throws std::invalid_argument if the JSON value does not fit the type
 */
core::AttributeValue parseAttributeValue(const nlohmann::json& value, core::AttributeType type);

nlohmann::json toJson(const core::AttributeValue& value);

/**
 * @brief Parses one exclusion filter.
 *
 * Accepted forms: {"type": "regex", "pattern": P}, {"type": "annotation",
 * "class": C}, {"type": "assignable", "class": C}. Custom filters carry code
 * and cannot be declared in JSON.
 *
 * @throws std::invalid_argument for unknown types, missing keys or bad patterns
 */
core::ExclusionFilter parseExclusionFilter(const nlohmann::json& filter);

nlohmann::json toJson(const core::ExclusionFilter& filter);

/**
 * @brief Parses the declaration of one entry point against a unit model.
 *
 * ```json
 * {
 *   "entry_point": "com.example.Application",
 *   "attributes": {"scanBasePackages": ["com.example.web"]},
 *   "units": {"bootscan.ComponentScan": {"lazyInit": true}}
 * }
 * ```
 * "attributes" assigns attributes of the model's root unit, "units" assigns
 * attributes of any unit of the composition.
 *
 * @throws std::invalid_argument for a missing entry point or a value that does not fit
 * @throws core::InvalidAssignmentError for attributes the model does not have
 */
core::InstanceDeclaration parseDeclaration(const nlohmann::json& declaration, const core::UnitModel& model);

nlohmann::json toJson(const core::ScanSpec& spec);

nlohmann::json toJson(const core::BootstrapPlan& plan);

} // namespace utils
} // namespace bootscan

#endif // BOOTSCAN_UTILS_SERIALIZATION_H
