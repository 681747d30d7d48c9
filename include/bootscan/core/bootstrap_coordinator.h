#pragma once

#include "bootscan/core/alias_resolver.h"
#include "bootscan/core/bootstrap_config.h"
#include "bootscan/core/collaborators.h"
#include "bootscan/core/definition_cache.h"
#include "bootscan/core/scan_configuration.h"
#include "bootscan/core/unit_definition.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Discovered capabilities left after applying exclusions.
 */
struct DeferredImports {
    std::vector<std::string> imports;             ///< In discovery order, duplicates dropped
    std::vector<TypeRef> unmatchedExcludes;       ///< `exclude` entries that matched nothing
    std::vector<std::string> unmatchedExcludeNames;
};

/**
 * @brief Outcome of one bootstrap.
 */
struct BootstrapPlan {
    ScanSpec scanSpec;
    std::vector<std::string> explicitRegistrations;  ///< Entry point, then scanned components
    std::vector<std::string> excludedComponents;     ///< Scanned but filtered out
    DeferredImports deferred;
    bool proxyBeanMethods{true};

    RegistrationMode registrationMode() const {
        return proxyBeanMethods ? RegistrationMode::Proxied : RegistrationMode::Lite;
    }
};

/**
 * @brief Runs the bootstrap of one annotated entry point.
 *
 * Order of work:
 * 1. validate the marker definition (cached per definition),
 * 2. resolve the instance's effective values,
 * 3. query capability discovery,
 * 4. build the ScanSpec, scan and filter components,
 * 5. compute deferred imports,
 * 6. register explicit units, then apply deferred imports.
 *
 * Any error in steps 1-5 propagates before the container is touched. Results
 * are memoized: calling bootstrap() again returns the same plan without
 * invoking the collaborators.
 *
 * Not thread-safe; concurrent bootstraps use separate coordinators and may
 * share one DefinitionCache.
 */
class BootstrapCoordinator {
public:
    /**
     * @param marker The composed unit declared on the entry point
     * @param declaration Explicit assignments of the entry point
     * @param scanner Component scanning collaborator
     * @param discovery Capability discovery collaborator
     * @param container Registration target
     * @param config Environment settings
     * @param cache Definition cache; the process-wide cache when null
     */
    BootstrapCoordinator(std::shared_ptr<const UnitDefinition> marker,
                         InstanceDeclaration declaration,
                         std::shared_ptr<ComponentScanner> scanner,
                         std::shared_ptr<CapabilityDiscovery> discovery,
                         std::shared_ptr<RegistrationContainer> container,
                         BootstrapConfig config = BootstrapConfig{},
                         DefinitionCache* cache = nullptr);

    /**
     * @brief Sets the hook behind the TypeExcludeFilter built-in. Must be
     * called before bootstrap().
     */
    void setExclusionHook(ExclusionHook hook);

    /**
     * @throws MalformedUnitError, AliasCycleError on invalid definitions
     * @throws InvalidAssignmentError, AliasConflictError on invalid declarations
     * @throws DiscoveryError if discovery failed or was cancelled
     * @throws std::logic_error if a previous call failed inside the container;
     *         the coordinator cannot be reused once registration has started
     */
    const BootstrapPlan& bootstrap();

    /**
     * @brief Effective values of the declaration, resolved on first use.
     */
    const ResolvedAttributes& resolvedAttributes();

    /**
     * @brief Removes excluded identities and names from discovered candidates.
     *
     * Names in excludeNames are compared as strings only; an entry that matches
     * no candidate is inert.
     */
    static DeferredImports computeDeferredImports(const std::vector<std::string>& candidates,
                                                  const std::vector<TypeRef>& exclude,
                                                  const std::vector<std::string>& excludeNames);

private:
    std::vector<std::string> runDiscovery();

    std::shared_ptr<const UnitDefinition> marker_;
    InstanceDeclaration declaration_;
    std::shared_ptr<ComponentScanner> scanner_;
    std::shared_ptr<CapabilityDiscovery> discovery_;
    std::shared_ptr<RegistrationContainer> container_;
    BootstrapConfig config_;
    DefinitionCache* cache_;
    ExclusionHook hook_;

    std::optional<ResolvedAttributes> resolved_;
    std::optional<BootstrapPlan> plan_;
    bool registrationStarted_{false};
};

} // namespace core
} // namespace bootscan
