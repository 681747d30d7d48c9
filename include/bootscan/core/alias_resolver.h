#pragma once

#include "bootscan/core/attribute.h"
#include "bootscan/core/unit_definition.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Alias structure of a unit model, validated once per definition.
 *
 * Attributes connected by alias edges (in either direction) form equivalence
 * classes. Construction rejects cycles that are not plain same-unit synonym
 * pairs and classes whose members disagree on their default. The graph is
 * immutable and safe to share across threads.
 */
class AliasGraph {
public:
    /**
     * @brief Validates the alias edges of a model and partitions its attributes.
     *
     * @param model The structurally validated model
     * @return The validated graph
     * @throws AliasCycleError on an unresolvable alias cycle
     * @throws MalformedUnitError if members of one alias class declare different defaults
     */
    static AliasGraph build(UnitModel model);

    const UnitModel& model() const { return model_; }

    /**
     * @brief Equivalence classes; each class lists its members in model order.
     * Attributes without aliases form singleton classes.
     */
    const std::vector<std::vector<AttributeKey>>& classes() const { return classes_; }

    /**
     * @brief Index into classes() of the class containing the key.
     * @throws std::out_of_range if the key is not part of the model
     */
    size_t classOf(const AttributeKey& key) const;

    /**
     * @brief Members of the key's class, the key itself included.
     */
    const std::vector<AttributeKey>& aliasesOf(const AttributeKey& key) const;

private:
    explicit AliasGraph(UnitModel model) : model_(std::move(model)) {}

    void partition();
    void detectCycles() const;
    void checkDefaults() const;

    UnitModel model_;
    std::vector<size_t> classIndex_;   // parallel to model_.attributes()
    std::vector<std::vector<AttributeKey>> classes_;
};

/**
 * @brief Explicit attribute assignments of one annotated entry point.
 */
class InstanceDeclaration {
public:
    InstanceDeclaration() = default;
    explicit InstanceDeclaration(TypeRef entryPoint) : entryPoint_(std::move(entryPoint)) {}

    const TypeRef& entryPoint() const { return entryPoint_; }

    /**
     * @brief Explicitly sets an attribute. Setting the same key twice keeps the last value.
     */
    InstanceDeclaration& set(const AttributeKey& key, AttributeValue value);
    InstanceDeclaration& set(const std::string& unit, const std::string& attribute, AttributeValue value);

    bool isExplicitlySet(const AttributeKey& key) const;

    const std::map<AttributeKey, AttributeValue>& assignments() const { return assignments_; }

private:
    TypeRef entryPoint_;
    std::map<AttributeKey, AttributeValue> assignments_;
};

enum class ValueOrigin {
    Explicit,
    Default
};

/**
 * @brief Value of an attribute after alias resolution.
 */
struct EffectiveValue {
    AttributeValue value;
    ValueOrigin origin{ValueOrigin::Default};
    /// Attributes of the alias class; the explicitly set one first, if any
    std::vector<AttributeKey> resolvedFrom;
};

/**
 * @brief Effective values of every attribute of one instance.
 */
class ResolvedAttributes {
public:
    ResolvedAttributes(std::shared_ptr<const AliasGraph> graph, TypeRef entryPoint,
                       std::map<AttributeKey, EffectiveValue> values)
        : graph_(std::move(graph)), entryPoint_(std::move(entryPoint)), values_(std::move(values)) {}

    const TypeRef& entryPoint() const { return entryPoint_; }
    const AliasGraph& graph() const { return *graph_; }

    /**
     * @throws std::out_of_range if the key is not part of the model
     */
    const EffectiveValue& get(const AttributeKey& key) const;
    const EffectiveValue& get(const std::string& unit, const std::string& attribute) const;

    /**
     * @brief Typed accessor.
     * @throws std::out_of_range if the key is unknown
     * @throws std::bad_variant_access if T is not the attribute's type
     */
    template <typename T>
    const T& as(const AttributeKey& key) const {
        return std::get<T>(get(key).value);
    }

    const std::map<AttributeKey, EffectiveValue>& values() const { return values_; }

private:
    std::shared_ptr<const AliasGraph> graph_;
    TypeRef entryPoint_;
    std::map<AttributeKey, EffectiveValue> values_;
};

/**
 * @brief Computes effective values of an instance from its explicit assignments.
 *
 * Per alias class: no explicit member yields the shared default; one explicit
 * member (or several with equal values) propagates to the whole class; members
 * set to different values are a conflict. All conflicts of an instance are
 * collected and reported together. Resolution has no side effects, so resolving
 * the same declaration twice yields identical results.
 */
class AliasResolver {
public:
    /**
     * @throws InvalidAssignmentError for an unknown key or a mistyped value
     * @throws AliasConflictError if aliased attributes are set to different values
     */
    static ResolvedAttributes resolve(const std::shared_ptr<const AliasGraph>& graph,
                                      const InstanceDeclaration& declaration);
};

} // namespace core
} // namespace bootscan
