#include "bootscan/core/bootstrap_coordinator.h"
#include "bootscan/core/errors.h"
#include "bootscan/core/standard_units.h"
#include "bootscan/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace bootscan {
namespace core {

namespace {

const AttributeKey kExcludeKey(units::kEnableAutoConfiguration, units::kExclude);
const AttributeKey kExcludeNameKey(units::kEnableAutoConfiguration, units::kExcludeName);
const AttributeKey kProxyKey(units::kConfiguration, units::kProxyBeanMethods);

bool declares(const ResolvedAttributes& resolved, const std::string& unit) {
    const auto& units = resolved.graph().model().units();
    return std::find(units.begin(), units.end(), unit) != units.end();
}

} // namespace

BootstrapCoordinator::BootstrapCoordinator(std::shared_ptr<const UnitDefinition> marker,
                                           InstanceDeclaration declaration,
                                           std::shared_ptr<ComponentScanner> scanner,
                                           std::shared_ptr<CapabilityDiscovery> discovery,
                                           std::shared_ptr<RegistrationContainer> container,
                                           BootstrapConfig config,
                                           DefinitionCache* cache)
    : marker_(std::move(marker)),
      declaration_(std::move(declaration)),
      scanner_(std::move(scanner)),
      discovery_(std::move(discovery)),
      container_(std::move(container)),
      config_(std::move(config)),
      cache_(cache != nullptr ? cache : &DefinitionCache::shared()) {
    if (!marker_ || !scanner_ || !discovery_ || !container_) {
        throw std::invalid_argument("BootstrapCoordinator requires a marker and all collaborators");
    }
}

void BootstrapCoordinator::setExclusionHook(ExclusionHook hook) {
    if (plan_) {
        throw std::logic_error("Exclusion hook set after bootstrap");
    }
    hook_ = std::move(hook);
}

const ResolvedAttributes& BootstrapCoordinator::resolvedAttributes() {
    if (!resolved_) {
        auto graph = cache_->validate(marker_);
        resolved_.emplace(AliasResolver::resolve(graph, declaration_));
    }
    return *resolved_;
}

std::vector<std::string> BootstrapCoordinator::runDiscovery() {
    Result<std::vector<std::string>> result = [this]() -> Result<std::vector<std::string>> {
        try {
            return discovery_->discover();
        } catch (const std::exception& e) {
            return utils::Error{e.what(), false};
        }
    }();

    if (result.has_error()) {
        BSLOG_ERROR("Capability discovery for " << declaration_.entryPoint().qualifiedName
                    << " did not complete: " << result.error().message);
        throw DiscoveryError(result.error().message, result.error().cancelled);
    }
    return std::move(result.value());
}

const BootstrapPlan& BootstrapCoordinator::bootstrap() {
    if (plan_) {
        return *plan_;
    }
    if (registrationStarted_) {
        throw std::logic_error("Bootstrap retried after the container failed; registrations may be partial");
    }

    const auto& entryPoint = declaration_.entryPoint().qualifiedName;
    BSLOG_INFO("Bootstrapping " << entryPoint << " with " << marker_->name);

    const auto& resolved = resolvedAttributes();
    const bool autoConfiguration = declares(resolved, units::kEnableAutoConfiguration);

    std::vector<std::string> discovered;
    if (autoConfiguration) {
        discovered = runDiscovery();
        BSLOG_DEBUG("Discovery proposed " << discovered.size() << " capabilities");
    }

    BootstrapPlan plan;
    plan.proxyBeanMethods = declares(resolved, units::kConfiguration) ? resolved.as<bool>(kProxyKey) : true;
    plan.explicitRegistrations.push_back(entryPoint);

    if (declares(resolved, units::kComponentScan)) {
        ScanConfigurationBuilder builder(resolved);
        builder.withExclusionHook(hook_).withAutoDiscovered(discovered);
        for (const auto& filter : config_.exclude_filters) {
            builder.addExcludeFilter(filter);
        }
        plan.scanSpec = builder.build();

        for (const auto& candidate : scanner_->scan(plan.scanSpec)) {
            if (candidate.name == entryPoint) {
                continue;
            }
            auto match = plan.scanSpec.excludeFilters.firstMatch(candidate);
            if (match) {
                BSLOG_DEBUG("Excluded " << candidate.name << " by "
                            << describe(plan.scanSpec.excludeFilters.filters()[*match]));
                plan.excludedComponents.push_back(candidate.name);
            } else {
                plan.explicitRegistrations.push_back(candidate.name);
            }
        }
    }

    if (autoConfiguration) {
        std::vector<std::string> excludeNames = resolved.as<std::vector<std::string>>(kExcludeNameKey);
        excludeNames.insert(excludeNames.end(), config_.exclude_names.begin(), config_.exclude_names.end());
        plan.deferred = computeDeferredImports(discovered, resolved.as<std::vector<TypeRef>>(kExcludeKey),
                                               excludeNames);

        if (config_.warn_unmatched_excludes) {
            for (const auto& type : plan.deferred.unmatchedExcludes) {
                BSLOG_WARN("Excluded capability " << type.qualifiedName
                           << " is not an automatically discovered capability");
            }
        }
        for (const auto& name : plan.deferred.unmatchedExcludeNames) {
            BSLOG_DEBUG("Excluded capability name " << name << " matched nothing");
        }
        if (!config_.enable_auto_configuration) {
            BSLOG_INFO("Automatic configuration disabled; " << plan.deferred.imports.size()
                       << " discovered capabilities not imported");
            plan.deferred.imports.clear();
        }
    }

    registrationStarted_ = true;
    container_->registerExplicit(plan.explicitRegistrations, plan.registrationMode());
    container_->applyDeferredImports(plan.deferred.imports);

    BSLOG_INFO("Bootstrapped " << entryPoint << ": " << plan.explicitRegistrations.size()
               << " explicit registrations, " << plan.deferred.imports.size() << " deferred imports");
    plan_ = std::move(plan);
    return *plan_;
}

DeferredImports BootstrapCoordinator::computeDeferredImports(const std::vector<std::string>& candidates,
                                                             const std::vector<TypeRef>& exclude,
                                                             const std::vector<std::string>& excludeNames) {
    std::unordered_set<std::string> excluded;
    for (const auto& type : exclude) {
        excluded.insert(type.qualifiedName);
    }
    excluded.insert(excludeNames.begin(), excludeNames.end());

    DeferredImports result;
    std::unordered_set<std::string> seen;
    for (const auto& candidate : candidates) {
        if (!seen.insert(candidate).second) {
            continue;
        }
        if (!excluded.count(candidate)) {
            result.imports.push_back(candidate);
        }
    }

    for (const auto& type : exclude) {
        if (!seen.count(type.qualifiedName)) {
            result.unmatchedExcludes.push_back(type);
        }
    }
    for (const auto& name : excludeNames) {
        if (!seen.count(name)) {
            result.unmatchedExcludeNames.push_back(name);
        }
    }
    return result;
}

} // namespace core
} // namespace bootscan
