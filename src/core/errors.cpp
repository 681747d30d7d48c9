#include "bootscan/core/errors.h"
#include <sstream>

namespace bootscan {
namespace core {

namespace {

std::string formatCycle(const std::vector<AttributeKey>& cycle) {
    std::ostringstream out;
    out << "Unresolvable alias cycle: ";
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) out << " -> ";
        out << cycle[i].toString();
    }
    return out.str();
}

std::string formatConflicts(const std::vector<ConflictLocation>& locations) {
    std::ostringstream out;
    out << "Aliased attributes explicitly set to different values:";
    for (const auto& location : locations) {
        out << "\n  " << location.key.toString() << " = " << describe(location.value);
    }
    return out.str();
}

} // namespace

AliasCycleError::AliasCycleError(std::vector<AttributeKey> cycle)
    : BootstrapError(formatCycle(cycle)), cycle_(std::move(cycle)) {}

AliasConflictError::AliasConflictError(std::vector<ConflictLocation> locations)
    : BootstrapError(formatConflicts(locations)), locations_(std::move(locations)) {}

} // namespace core
} // namespace bootscan
