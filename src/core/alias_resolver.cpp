#include "bootscan/core/alias_resolver.h"
#include "bootscan/core/errors.h"
#include "bootscan/utils/logging.hpp"
#include <algorithm>
#include <numeric>
#include <queue>
#include <stdexcept>

namespace bootscan {
namespace core {

namespace {

class DisjointSet {
public:
    explicit DisjointSet(size_t size) : parent_(size), rank_(size, 0) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    size_t find(size_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (rank_[a] < rank_[b]) std::swap(a, b);
        parent_[b] = a;
        if (rank_[a] == rank_[b]) rank_[a]++;
    }

private:
    std::vector<size_t> parent_;
    std::vector<size_t> rank_;
};

struct IndexedEdge {
    size_t from;
    size_t to;
    bool sameUnit;
};

// Shortest path from `start` to `goal` that does not use the edge skipFrom -> skipTo.
// Returns the node sequence including both ends, or an empty vector.
std::vector<size_t> findPath(const std::vector<std::vector<size_t>>& adjacency,
                             size_t start, size_t goal,
                             std::optional<std::pair<size_t, size_t>> skip) {
    std::vector<size_t> previous(adjacency.size(), adjacency.size());
    std::vector<bool> seen(adjacency.size(), false);
    std::queue<size_t> frontier;
    frontier.push(start);
    seen[start] = true;

    while (!frontier.empty()) {
        size_t node = frontier.front();
        frontier.pop();
        if (node == goal) {
            std::vector<size_t> path;
            for (size_t at = goal; at != start; at = previous[at]) {
                path.push_back(at);
            }
            path.push_back(start);
            std::reverse(path.begin(), path.end());
            return path;
        }
        for (size_t next : adjacency[node]) {
            if (skip && skip->first == node && skip->second == next) {
                continue;
            }
            if (!seen[next]) {
                seen[next] = true;
                previous[next] = node;
                frontier.push(next);
            }
        }
    }
    return {};
}

} // namespace

AliasGraph AliasGraph::build(UnitModel model) {
    AliasGraph graph(std::move(model));
    graph.partition();
    graph.detectCycles();
    graph.checkDefaults();

    BSLOG_DEBUG("Validated alias graph of " << graph.model_.rootName() << ": "
                << graph.classes_.size() << " alias classes");
    return graph;
}

void AliasGraph::partition() {
    const auto& keys = model_.attributes();
    DisjointSet sets(keys.size());
    for (const auto& edge : model_.aliasEdges()) {
        sets.unite(model_.indexOf(edge.source), model_.indexOf(edge.target));
    }

    std::vector<size_t> rootToClass(keys.size(), keys.size());
    classIndex_.resize(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        size_t root = sets.find(i);
        if (rootToClass[root] == keys.size()) {
            rootToClass[root] = classes_.size();
            classes_.emplace_back();
        }
        classIndex_[i] = rootToClass[root];
        classes_[classIndex_[i]].push_back(keys[i]);
    }
}

void AliasGraph::detectCycles() const {
    const auto& keys = model_.attributes();
    std::vector<std::vector<size_t>> adjacency(keys.size());
    std::vector<IndexedEdge> edges;
    for (const auto& edge : model_.aliasEdges()) {
        IndexedEdge indexed{model_.indexOf(edge.source), model_.indexOf(edge.target), edge.isSameUnit()};
        adjacency[indexed.from].push_back(indexed.to);
        edges.push_back(indexed);
    }

    // A cross-unit edge may not be part of any cycle. A same-unit edge may only
    // be part of the 2-cycle formed with its mirror.
    for (const auto& edge : edges) {
        std::optional<std::pair<size_t, size_t>> skip;
        if (edge.sameUnit) {
            skip = std::make_pair(edge.to, edge.from);
        }
        auto back = findPath(adjacency, edge.to, edge.from, skip);
        if (back.empty()) {
            continue;
        }
        std::vector<AttributeKey> cycle;
        cycle.push_back(keys[edge.from]);
        for (size_t node : back) {
            cycle.push_back(keys[node]);
        }
        BSLOG_ERROR("Alias cycle in " << model_.rootName() << " through " << keys[edge.from].toString());
        throw AliasCycleError(std::move(cycle));
    }
}

void AliasGraph::checkDefaults() const {
    for (const auto& members : classes_) {
        const auto& first = members.front();
        const auto& expected = model_.defaultOf(first);
        for (size_t i = 1; i < members.size(); ++i) {
            const auto& actual = model_.defaultOf(members[i]);
            if (actual != expected) {
                throw MalformedUnitError(members[i].unit,
                    "aliased attributes '" + first.toString() + "' and '" + members[i].toString() +
                    "' declare different defaults (" + describe(expected) + " vs " +
                    describe(actual) + ")");
            }
        }
    }
}

size_t AliasGraph::classOf(const AttributeKey& key) const {
    return classIndex_.at(model_.indexOf(key));
}

const std::vector<AttributeKey>& AliasGraph::aliasesOf(const AttributeKey& key) const {
    return classes_[classOf(key)];
}

InstanceDeclaration& InstanceDeclaration::set(const AttributeKey& key, AttributeValue value) {
    assignments_[key] = std::move(value);
    return *this;
}

InstanceDeclaration& InstanceDeclaration::set(const std::string& unit, const std::string& attribute,
                                              AttributeValue value) {
    return set(AttributeKey(unit, attribute), std::move(value));
}

bool InstanceDeclaration::isExplicitlySet(const AttributeKey& key) const {
    return assignments_.count(key) > 0;
}

const EffectiveValue& ResolvedAttributes::get(const AttributeKey& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        throw std::out_of_range("No effective value for " + key.toString());
    }
    return it->second;
}

const EffectiveValue& ResolvedAttributes::get(const std::string& unit, const std::string& attribute) const {
    return get(AttributeKey(unit, attribute));
}

ResolvedAttributes AliasResolver::resolve(const std::shared_ptr<const AliasGraph>& graph,
                                          const InstanceDeclaration& declaration) {
    if (!graph) {
        throw std::invalid_argument("AliasResolver::resolve requires a validated alias graph");
    }
    const auto& model = graph->model();

    for (const auto& [key, value] : declaration.assignments()) {
        if (!model.contains(key)) {
            throw InvalidAssignmentError(key, "no such attribute in " + model.rootName());
        }
        if (core::typeOf(value) != model.typeOf(key)) {
            throw InvalidAssignmentError(key,
                std::string("expected ") + toString(model.typeOf(key)) + ", got " +
                toString(core::typeOf(value)));
        }
    }

    std::map<AttributeKey, EffectiveValue> values;
    std::vector<ConflictLocation> conflicts;

    for (const auto& members : graph->classes()) {
        std::vector<AttributeKey> explicitMembers;
        for (const auto& member : members) {
            if (declaration.isExplicitlySet(member)) {
                explicitMembers.push_back(member);
            }
        }

        EffectiveValue effective;
        if (explicitMembers.empty()) {
            effective.value = model.defaultOf(members.front());
            effective.origin = ValueOrigin::Default;
            effective.resolvedFrom = members;
        } else {
            const auto& chosen = declaration.assignments().at(explicitMembers.front());
            bool agree = std::all_of(explicitMembers.begin(), explicitMembers.end(),
                                     [&](const AttributeKey& key) {
                                         return declaration.assignments().at(key) == chosen;
                                     });
            if (!agree) {
                for (const auto& key : explicitMembers) {
                    conflicts.push_back({key, declaration.assignments().at(key)});
                }
                continue;
            }
            effective.value = chosen;
            effective.origin = ValueOrigin::Explicit;
            effective.resolvedFrom.push_back(explicitMembers.front());
            for (const auto& member : members) {
                if (member != explicitMembers.front()) {
                    effective.resolvedFrom.push_back(member);
                }
            }
        }

        for (const auto& member : members) {
            values.emplace(member, effective);
        }
    }

    if (!conflicts.empty()) {
        BSLOG_ERROR("Alias conflicts in declaration of " << declaration.entryPoint().qualifiedName
                    << " (" << conflicts.size() << " locations)");
        throw AliasConflictError(std::move(conflicts));
    }

    return ResolvedAttributes(graph, declaration.entryPoint(), std::move(values));
}

} // namespace core
} // namespace bootscan
