#pragma once

#include "bootscan/core/alias_resolver.h"
#include "bootscan/core/attribute.h"
#include "bootscan/core/exclusion_filter.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Effective component-scan settings of one entry point. Read-only once built.
 */
struct ScanSpec {
    std::set<std::string> basePackages;
    std::optional<TypeRef> nameGenerator;    ///< Unset: the container keeps its own generator
    ExclusionFilterChain excludeFilters;
    bool lazyInit{false};

    /**
     * @brief True if the candidate lies in one of the base packages or below.
     * The default package ("") contains everything.
     */
    bool covers(const std::string& qualifiedName) const;
};

/**
 * @brief Derives a ScanSpec from the resolved ComponentScan attributes.
 *
 * Base packages are the tokenized package strings plus the package of every
 * base-package class; when both are empty the entry point's package is used.
 * The name generator is reported unset while it equals the attribute's default
 * sentinel type. Exclusion filters are the built-ins, in fixed order, followed
 * by every additionally declared filter.
 */
class ScanConfigurationBuilder {
public:
    explicit ScanConfigurationBuilder(const ResolvedAttributes& resolved);

    // The builder keeps a reference; a temporary would not outlive it
    explicit ScanConfigurationBuilder(ResolvedAttributes&&) = delete;

    /**
     * @brief Sets the hook consulted by the TypeExcludeFilter built-in.
     */
    ScanConfigurationBuilder& withExclusionHook(ExclusionHook hook);

    /**
     * @brief Sets the names produced by automatic capability discovery, used
     * by the AutoConfigurationExcludeFilter built-in.
     */
    ScanConfigurationBuilder& withAutoDiscovered(std::vector<std::string> names);

    ScanConfigurationBuilder& addExcludeFilter(ExclusionFilter filter);

    /**
     * @throws std::out_of_range if the resolved model does not contain ComponentScan
     */
    ScanSpec build() const;

    /**
     * @brief Splits a package string on ',', ';', space, tab and newline, dropping blanks.
     */
    static std::vector<std::string> tokenizePackages(const std::string& packages);

private:
    const ResolvedAttributes& resolved_;
    ExclusionHook hook_;
    std::vector<std::string> autoDiscovered_;
    std::vector<ExclusionFilter> additional_;
};

} // namespace core
} // namespace bootscan
