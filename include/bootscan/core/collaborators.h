#pragma once

#include "bootscan/core/exclusion_filter.h"
#include "bootscan/core/scan_configuration.h"
#include "bootscan/utils/result.hpp"
#include <string>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Finds component candidates below the base packages of a ScanSpec.
 *
 * Filtering by the ScanSpec's exclusion chain is done by the caller; scanners
 * return every candidate they find, in a stable order.
 */
class ComponentScanner {
public:
    virtual ~ComponentScanner() = default;

    virtual std::vector<Candidate> scan(const ScanSpec& spec) = 0;
};

/**
 * @brief Proposes capabilities for automatic registration.
 */
class CapabilityDiscovery {
public:
    virtual ~CapabilityDiscovery() = default;

    /**
     * @brief Returns the ordered candidate names, or an Error when discovery
     * failed or was cancelled.
     */
    virtual Result<std::vector<std::string>> discover() = 0;
};

/**
 * @brief Whether factory methods of explicit registrations are intercepted.
 */
enum class RegistrationMode {
    Proxied,   ///< proxyBeanMethods = true
    Lite       ///< proxyBeanMethods = false
};

/**
 * @brief Receives registrations at the end of a bootstrap.
 *
 * registerExplicit is always called before applyDeferredImports, so a unit
 * that is both declared and discovered keeps its explicit registration.
 */
class RegistrationContainer {
public:
    virtual ~RegistrationContainer() = default;

    virtual void registerExplicit(const std::vector<std::string>& names, RegistrationMode mode) = 0;

    virtual void applyDeferredImports(const std::vector<std::string>& names) = 0;
};

} // namespace core
} // namespace bootscan
