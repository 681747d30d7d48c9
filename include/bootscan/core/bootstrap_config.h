#pragma once

#include "bootscan/core/exclusion_filter.h"
#include "bootscan/utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Environment-level settings of a bootstrap.
 *
 * JSON form (every key optional):
 * ```json
 * {
 *   "log_level": "info",
 *   "enable_auto_configuration": true,
 *   "autoconfigure.exclude": ["com.acme.autoconfigure.MetricsAutoConfiguration"],
 *   "warn_unmatched_excludes": true,
 *   "exclude_filters": [
 *     {"type": "regex", "pattern": "com\\.example\\..*Test"},
 *     {"type": "annotation", "class": "com.example.Generated"},
 *     {"type": "assignable", "class": "com.example.Legacy"}
 *   ]
 * }
 * ```
 */
struct BootstrapConfig {
    /**
     * @brief Process-wide minimum log level. The coordinator does not apply it;
     * the application passes it to utils::setLogLevel once at startup. Unset
     * keeps the current level.
     */
    std::optional<utils::LogLevel> log_level;

    /**
     * @brief When false no capability is auto-imported.
     */
    bool enable_auto_configuration{true};

    /**
     * @brief Capability names excluded in addition to the marker's excludeName.
     */
    std::vector<std::string> exclude_names;

    /**
     * @brief Log a warning for each `exclude` type that matches no discovered capability.
     */
    bool warn_unmatched_excludes{true};

    /**
     * @brief Exclusion filters appended after the built-ins.
     */
    std::vector<ExclusionFilter> exclude_filters;

    /**
     * @brief Parses a configuration document.
     * @throws std::invalid_argument naming the offending key
     */
    static BootstrapConfig fromJson(const nlohmann::json& config);
};

} // namespace core
} // namespace bootscan
