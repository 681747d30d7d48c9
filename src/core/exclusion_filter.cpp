#include "bootscan/core/exclusion_filter.h"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>

namespace bootscan {
namespace core {

const char* const kTypeExcludeFilterName = "TypeExcludeFilter";
const char* const kAutoConfigurationExcludeFilterName = "AutoConfigurationExcludeFilter";

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool containsName(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

std::string Candidate::packageName() const {
    return TypeRef(name).packageName();
}

ByRegexName::ByRegexName(std::string pattern) : pattern_(std::move(pattern)) {
    try {
        compiled_ = std::make_shared<const std::regex>(pattern_, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid exclusion pattern '" + pattern_ + "': " + e.what());
    }
}

bool ByRegexName::matches(const std::string& name) const {
    return std::regex_match(name, *compiled_);
}

bool matches(const ExclusionFilter& filter, const Candidate& candidate) {
    return std::visit(Overloaded{
        [&](const ByAnnotationType& f) {
            return containsName(candidate.annotations, f.annotation.qualifiedName);
        },
        [&](const ByAssignableType& f) {
            return candidate.name == f.type.qualifiedName ||
                   containsName(candidate.supertypes, f.type.qualifiedName);
        },
        [&](const ByRegexName& f) {
            return f.matches(candidate.name);
        },
        [&](const Custom& f) {
            return f.predicate ? f.predicate(candidate) : false;
        },
    }, filter);
}

std::string describe(const ExclusionFilter& filter) {
    return std::visit(Overloaded{
        [](const ByAnnotationType& f) { return "annotation(" + f.annotation.qualifiedName + ")"; },
        [](const ByAssignableType& f) { return "assignable(" + f.type.qualifiedName + ")"; },
        [](const ByRegexName& f) { return "regex(" + f.pattern() + ")"; },
        [](const Custom& f) { return "custom(" + f.description + ")"; },
    }, filter);
}

bool ExclusionFilterChain::isExcluded(const Candidate& candidate) const {
    return firstMatch(candidate).has_value();
}

std::optional<size_t> ExclusionFilterChain::firstMatch(const Candidate& candidate) const {
    for (size_t i = 0; i < filters_.size(); ++i) {
        if (matches(filters_[i], candidate)) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<Candidate> ExclusionFilterChain::apply(const std::vector<Candidate>& candidates) const {
    std::vector<Candidate> kept;
    kept.reserve(candidates.size());
    std::copy_if(candidates.begin(), candidates.end(), std::back_inserter(kept),
                 [this](const Candidate& candidate) { return !isExcluded(candidate); });
    return kept;
}

Custom makeTypeExcludeFilter(ExclusionHook hook) {
    return Custom{kTypeExcludeFilterName, [hook = std::move(hook)](const Candidate& candidate) {
        return hook ? hook(candidate) : false;
    }};
}

Custom makeAutoConfigurationExcludeFilter(std::vector<std::string> discovered) {
    auto names = std::make_shared<const std::unordered_set<std::string>>(
        discovered.begin(), discovered.end());
    return Custom{kAutoConfigurationExcludeFilterName, [names](const Candidate& candidate) {
        return names->count(candidate.name) > 0;
    }};
}

} // namespace core
} // namespace bootscan
