#include "bootscan/core/scan_configuration.h"
#include "bootscan/core/standard_units.h"
#include "bootscan/utils/logging.hpp"

namespace bootscan {
namespace core {

bool ScanSpec::covers(const std::string& qualifiedName) const {
    for (const auto& base : basePackages) {
        if (base.empty()) {
            return true;
        }
        if (qualifiedName.size() > base.size() &&
            qualifiedName.compare(0, base.size(), base) == 0 &&
            qualifiedName[base.size()] == '.') {
            return true;
        }
    }
    return false;
}

ScanConfigurationBuilder::ScanConfigurationBuilder(const ResolvedAttributes& resolved)
    : resolved_(resolved) {}

ScanConfigurationBuilder& ScanConfigurationBuilder::withExclusionHook(ExclusionHook hook) {
    hook_ = std::move(hook);
    return *this;
}

ScanConfigurationBuilder& ScanConfigurationBuilder::withAutoDiscovered(std::vector<std::string> names) {
    autoDiscovered_ = std::move(names);
    return *this;
}

ScanConfigurationBuilder& ScanConfigurationBuilder::addExcludeFilter(ExclusionFilter filter) {
    additional_.push_back(std::move(filter));
    return *this;
}

std::vector<std::string> ScanConfigurationBuilder::tokenizePackages(const std::string& packages) {
    static const std::string delimiters = ",; \t\n";
    std::vector<std::string> tokens;
    size_t start = packages.find_first_not_of(delimiters);
    while (start != std::string::npos) {
        size_t end = packages.find_first_of(delimiters, start);
        tokens.push_back(packages.substr(start, end == std::string::npos ? std::string::npos : end - start));
        start = packages.find_first_not_of(delimiters, end);
    }
    return tokens;
}

ScanSpec ScanConfigurationBuilder::build() const {
    const AttributeKey packagesKey(units::kComponentScan, units::kBasePackages);
    const AttributeKey classesKey(units::kComponentScan, units::kBasePackageClasses);
    const AttributeKey generatorKey(units::kComponentScan, units::kNameGenerator);
    const AttributeKey lazyKey(units::kComponentScan, units::kLazyInit);

    ScanSpec spec;

    for (const auto& entry : resolved_.as<std::vector<std::string>>(packagesKey)) {
        for (auto& token : tokenizePackages(entry)) {
            spec.basePackages.insert(std::move(token));
        }
    }
    for (const auto& type : resolved_.as<std::vector<TypeRef>>(classesKey)) {
        spec.basePackages.insert(type.packageName());
    }
    if (spec.basePackages.empty()) {
        spec.basePackages.insert(resolved_.entryPoint().packageName());
    }

    // The declared default is a sentinel type meaning "inherit"; compare by type identity
    const auto& generator = resolved_.as<TypeRef>(generatorKey);
    const auto& sentinel = std::get<TypeRef>(resolved_.graph().model().declaredDefaultOf(generatorKey));
    if (generator != sentinel) {
        spec.nameGenerator = generator;
    }

    spec.lazyInit = resolved_.as<bool>(lazyKey);

    std::vector<ExclusionFilter> filters;
    filters.reserve(2 + additional_.size());
    filters.emplace_back(makeTypeExcludeFilter(hook_));
    filters.emplace_back(makeAutoConfigurationExcludeFilter(autoDiscovered_));
    filters.insert(filters.end(), additional_.begin(), additional_.end());
    spec.excludeFilters = ExclusionFilterChain(std::move(filters));

    BSLOG_DEBUG("Scan spec for " << resolved_.entryPoint().qualifiedName << ": "
                << spec.basePackages.size() << " base packages, "
                << spec.excludeFilters.size() << " exclusion filters"
                << (spec.nameGenerator ? ", name generator " + spec.nameGenerator->qualifiedName : std::string()));
    return spec;
}

} // namespace core
} // namespace bootscan
