#pragma once

#include "bootscan/core/attribute.h"
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Declares that an attribute is an alias of another attribute.
 *
 * An empty targetUnit means the declaring unit itself (a synonym within the
 * unit, which must be declared in both directions). An empty targetAttribute
 * means an attribute of the same name on the target unit.
 */
struct AliasDeclaration {
    std::string attribute;
    std::string targetUnit;
    std::string targetAttribute;
};

/**
 * @brief A resolved, directed alias edge between two attributes.
 */
struct AliasEdge {
    AttributeKey source;
    AttributeKey target;

    bool isSameUnit() const { return source.unit == target.unit; }
};

struct UnitDefinition;

/**
 * @brief A meta-level unit aggregated by a composed unit.
 *
 * Presets are attribute values fixed by the composition itself; they replace
 * the aggregated unit's declared defaults within the composed model.
 */
struct ComposedUnit {
    std::shared_ptr<const UnitDefinition> unit;
    std::map<std::string, AttributeValue> presets;
};

/**
 * @brief Static descriptor of a declarative unit.
 *
 * A composed marker holds explicit references to the directives it aggregates
 * instead of inheriting from them. Definitions are plain data built once at
 * startup and shared read-only.
 */
struct UnitDefinition {
    std::string name;                        ///< Stable identity, used as cache key
    std::vector<AttributeDefinition> attributes;
    std::vector<AliasDeclaration> aliases;
    std::vector<ComposedUnit> composes;

    const AttributeDefinition* findAttribute(const std::string& attributeName) const;
};

/**
 * @brief Structured, validated view over a unit and everything it composes.
 *
 * Building the model checks every structural rule of the definitions: unique
 * unit and attribute names, well-typed defaults and presets, and alias targets
 * that exist and agree on type. Alias graph rules that need the whole edge set
 * (cycles, default agreement across a class) are checked by AliasGraph.
 */
class UnitModel {
public:
    /**
     * @brief Walks the root and its composed units depth-first, in declaration order.
     *
     * Each unit is visited once, so cyclic compositions terminate.
     *
     * @param root The unit to model
     * @return The validated model
     * @throws MalformedUnitError if any structural rule is violated
     */
    static UnitModel build(const std::shared_ptr<const UnitDefinition>& root);

    const std::string& rootName() const { return rootName_; }

    /**
     * @brief Names of all units in the closure, root first.
     */
    const std::vector<std::string>& units() const { return units_; }

    /**
     * @brief All attribute keys of the closure, in visiting order.
     */
    const std::vector<AttributeKey>& attributes() const { return attributes_; }

    const std::vector<AliasEdge>& aliasEdges() const { return edges_; }

    bool contains(const AttributeKey& key) const;

    /**
     * @brief Returns the declared type of an attribute.
     * @throws std::out_of_range if the key is not part of the model
     */
    AttributeType typeOf(const AttributeKey& key) const;

    /**
     * @brief Returns the default of an attribute within this composition
     * (preset if the composition declares one, declared default otherwise).
     * @throws std::out_of_range if the key is not part of the model
     */
    const AttributeValue& defaultOf(const AttributeKey& key) const;

    /**
     * @brief Returns the default declared by the attribute's own unit, ignoring presets.
     * @throws std::out_of_range if the key is not part of the model
     */
    const AttributeValue& declaredDefaultOf(const AttributeKey& key) const;

    /**
     * @brief Position of the key in attributes().
     * @throws std::out_of_range if the key is not part of the model
     */
    size_t indexOf(const AttributeKey& key) const;

private:
    struct Slot {
        AttributeType type;
        AttributeValue declaredDefault;
        AttributeValue effectiveDefault;
    };

    const Slot& slot(const AttributeKey& key) const;

    std::string rootName_;
    std::vector<std::string> units_;
    std::vector<AttributeKey> attributes_;
    std::vector<Slot> slots_;
    std::unordered_map<AttributeKey, size_t> index_;
    std::vector<AliasEdge> edges_;
};

} // namespace core
} // namespace bootscan
