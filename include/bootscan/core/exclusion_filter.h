#pragma once

#include "bootscan/core/attribute.h"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief A class proposed for registration by scanning.
 */
struct Candidate {
    std::string name;                     ///< Fully-qualified name
    std::vector<std::string> supertypes;  ///< All supertypes, transitively
    std::vector<std::string> annotations; ///< Units declared on the candidate

    Candidate() = default;
    explicit Candidate(std::string n,
                       std::vector<std::string> supers = {},
                       std::vector<std::string> annots = {})
        : name(std::move(n)), supertypes(std::move(supers)), annotations(std::move(annots)) {}

    std::string packageName() const;
};

/**
 * @brief Excludes candidates carrying the given annotation unit.
 */
struct ByAnnotationType {
    TypeRef annotation;
};

/**
 * @brief Excludes the given type and every candidate assignable to it.
 */
struct ByAssignableType {
    TypeRef type;
};

/**
 * @brief Excludes candidates whose whole name matches an ECMAScript pattern.
 */
class ByRegexName {
public:
    /**
     * @throws std::invalid_argument if the pattern does not compile
     */
    explicit ByRegexName(std::string pattern);

    const std::string& pattern() const { return pattern_; }
    bool matches(const std::string& name) const;

private:
    std::string pattern_;
    std::shared_ptr<const std::regex> compiled_;
};

/**
 * @brief Excludes candidates for which an opaque predicate returns true.
 */
struct Custom {
    std::string description;
    std::function<bool(const Candidate&)> predicate;
};

using ExclusionFilter = std::variant<ByAnnotationType, ByAssignableType, ByRegexName, Custom>;

/**
 * @brief Evaluates one filter. A Custom filter without predicate never matches.
 */
bool matches(const ExclusionFilter& filter, const Candidate& candidate);

std::string describe(const ExclusionFilter& filter);

/**
 * @brief Ordered, immutable chain of exclusion filters.
 *
 * A candidate is excluded iff any filter matches. Evaluation stops at the
 * first match in declaration order; callers must not rely on later filters
 * being invoked.
 */
class ExclusionFilterChain {
public:
    ExclusionFilterChain() = default;
    explicit ExclusionFilterChain(std::vector<ExclusionFilter> filters)
        : filters_(std::move(filters)) {}

    bool isExcluded(const Candidate& candidate) const;

    /**
     * @brief Index of the first matching filter, for diagnostics.
     */
    std::optional<size_t> firstMatch(const Candidate& candidate) const;

    /**
     * @brief Returns the candidates that are not excluded, in input order.
     */
    std::vector<Candidate> apply(const std::vector<Candidate>& candidates) const;

    const std::vector<ExclusionFilter>& filters() const { return filters_; }
    size_t size() const { return filters_.size(); }
    bool empty() const { return filters_.empty(); }

private:
    std::vector<ExclusionFilter> filters_;
};

using ExclusionHook = std::function<bool(const Candidate&)>;

// Descriptions of the built-in filters, in the order they are installed
extern const char* const kTypeExcludeFilterName;
extern const char* const kAutoConfigurationExcludeFilterName;

/**
 * @brief Built-in filter delegating to an externally registered hook.
 * A null hook never excludes.
 */
Custom makeTypeExcludeFilter(ExclusionHook hook);

/**
 * @brief Built-in filter excluding candidates already produced by automatic
 * capability discovery, so a capability is never registered from two sources.
 */
Custom makeAutoConfigurationExcludeFilter(std::vector<std::string> discovered);

} // namespace core
} // namespace bootscan
