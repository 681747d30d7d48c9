#include "bootscan/core/bootstrap_config.h"
#include "bootscan/utils/serialization.h"
#include <stdexcept>

namespace bootscan {
namespace core {

namespace {

bool readBool(const nlohmann::json& config, const char* key, bool fallback) {
    auto it = config.find(key);
    if (it == config.end()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a boolean");
    }
    return it->get<bool>();
}

} // namespace

BootstrapConfig BootstrapConfig::fromJson(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw std::invalid_argument("bootstrap configuration must be a JSON object");
    }

    BootstrapConfig result;

    if (auto it = config.find("log_level"); it != config.end()) {
        if (!it->is_string()) {
            throw std::invalid_argument("'log_level' must be a string");
        }
        result.log_level = utils::parseLogLevel(it->get<std::string>());
    }

    result.enable_auto_configuration = readBool(config, "enable_auto_configuration", true);
    result.warn_unmatched_excludes = readBool(config, "warn_unmatched_excludes", true);

    if (auto it = config.find("autoconfigure.exclude"); it != config.end()) {
        auto names = utils::parseAttributeValue(*it, AttributeType::StringList);
        // Property values may carry several comma-separated names per entry
        for (const auto& entry : std::get<std::vector<std::string>>(names)) {
            size_t start = 0;
            while (start <= entry.size()) {
                size_t comma = entry.find(',', start);
                auto name = entry.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
                auto first = name.find_first_not_of(" \t");
                if (first != std::string::npos) {
                    result.exclude_names.push_back(name.substr(first, name.find_last_not_of(" \t") - first + 1));
                }
                if (comma == std::string::npos) {
                    break;
                }
                start = comma + 1;
            }
        }
    }

    if (auto it = config.find("exclude_filters"); it != config.end()) {
        if (!it->is_array()) {
            throw std::invalid_argument("'exclude_filters' must be an array");
        }
        for (const auto& filter : *it) {
            result.exclude_filters.push_back(utils::parseExclusionFilter(filter));
        }
    }

    return result;
}

} // namespace core
} // namespace bootscan
