#include "bootscan/core/unit_definition.h"
#include "bootscan/core/errors.h"
#include "bootscan/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace bootscan {
namespace core {

const AttributeDefinition* UnitDefinition::findAttribute(const std::string& attributeName) const {
    auto it = std::find_if(attributes.begin(), attributes.end(),
                           [&attributeName](const AttributeDefinition& def) {
                               return def.name == attributeName;
                           });
    return it == attributes.end() ? nullptr : &*it;
}

namespace {

struct VisitedUnit {
    std::shared_ptr<const UnitDefinition> unit;
    std::map<std::string, AttributeValue> presets;
};

class ClosureWalker {
public:
    void visit(const std::shared_ptr<const UnitDefinition>& unit) {
        if (!unit) {
            throw MalformedUnitError("<null>", "composition references a null unit");
        }
        auto seen = byName_.find(unit->name);
        if (seen != byName_.end()) {
            if (order_[seen->second].unit != unit) {
                throw MalformedUnitError(unit->name,
                    "two different units in the composition share this name");
            }
            return;
        }
        byName_.emplace(unit->name, order_.size());
        order_.push_back({unit, {}});

        for (const auto& composed : unit->composes) {
            visit(composed.unit);
            mergePresets(unit->name, composed);
        }
    }

    std::vector<VisitedUnit>& units() { return order_; }

private:
    void mergePresets(const std::string& composer, const ComposedUnit& composed) {
        auto& target = order_[byName_.at(composed.unit->name)];
        for (const auto& [attribute, value] : composed.presets) {
            auto existing = target.presets.find(attribute);
            if (existing != target.presets.end() && existing->second != value) {
                throw MalformedUnitError(composer,
                    "conflicting presets for " + composed.unit->name + "." + attribute +
                    ": " + describe(existing->second) + " vs " + describe(value));
            }
            target.presets.emplace(attribute, value);
        }
    }

    std::unordered_map<std::string, size_t> byName_;
    std::vector<VisitedUnit> order_;
};

} // namespace

UnitModel UnitModel::build(const std::shared_ptr<const UnitDefinition>& root) {
    ClosureWalker walker;
    walker.visit(root);

    UnitModel model;
    model.rootName_ = root->name;

    for (const auto& visited : walker.units()) {
        const auto& unit = *visited.unit;
        model.units_.push_back(unit.name);

        for (const auto& attribute : unit.attributes) {
            AttributeKey key(unit.name, attribute.name);
            if (model.index_.count(key)) {
                throw MalformedUnitError(unit.name, "attribute '" + attribute.name + "' declared twice");
            }
            if (core::typeOf(attribute.defaultValue) != attribute.type) {
                throw MalformedUnitError(unit.name,
                    "default of '" + attribute.name + "' is " +
                    toString(core::typeOf(attribute.defaultValue)) +
                    " but the attribute is declared " + toString(attribute.type));
            }
            model.index_.emplace(key, model.attributes_.size());
            model.attributes_.push_back(key);
            model.slots_.push_back({attribute.type, attribute.defaultValue, attribute.defaultValue});
        }

        for (const auto& [attributeName, value] : visited.presets) {
            const auto* definition = unit.findAttribute(attributeName);
            if (definition == nullptr) {
                throw MalformedUnitError(unit.name, "preset for unknown attribute '" + attributeName + "'");
            }
            if (core::typeOf(value) != definition->type) {
                throw MalformedUnitError(unit.name,
                    "preset for '" + attributeName + "' is " + toString(core::typeOf(value)) +
                    " but the attribute is declared " + toString(definition->type));
            }
            model.slots_[model.index_.at(AttributeKey(unit.name, attributeName))].effectiveDefault = value;
        }
    }

    std::unordered_set<std::string> unitNames(model.units_.begin(), model.units_.end());

    for (const auto& visited : walker.units()) {
        const auto& unit = *visited.unit;
        for (const auto& alias : unit.aliases) {
            AliasEdge edge;
            edge.source = AttributeKey(unit.name, alias.attribute);
            edge.target = AttributeKey(
                alias.targetUnit.empty() ? unit.name : alias.targetUnit,
                alias.targetAttribute.empty() ? alias.attribute : alias.targetAttribute);

            if (!model.contains(edge.source)) {
                throw MalformedUnitError(unit.name,
                    "alias declared on unknown attribute '" + alias.attribute + "'");
            }
            if (!unitNames.count(edge.target.unit)) {
                throw MalformedUnitError(unit.name,
                    "alias target unit '" + edge.target.unit + "' of '" + alias.attribute +
                    "' is not part of the composition");
            }
            if (!model.contains(edge.target)) {
                throw MalformedUnitError(unit.name,
                    "alias target '" + edge.target.toString() + "' does not exist");
            }
            if (edge.source == edge.target) {
                throw MalformedUnitError(unit.name, "attribute '" + alias.attribute + "' aliases itself");
            }
            if (model.typeOf(edge.source) != model.typeOf(edge.target)) {
                throw MalformedUnitError(unit.name,
                    "'" + edge.source.toString() + "' is " + toString(model.typeOf(edge.source)) +
                    " but its alias target '" + edge.target.toString() + "' is " +
                    toString(model.typeOf(edge.target)));
            }
            model.edges_.push_back(std::move(edge));
        }
    }

    // Synonyms within one unit must be declared in both directions
    for (const auto& edge : model.edges_) {
        if (!edge.isSameUnit()) {
            continue;
        }
        bool reciprocated = std::any_of(model.edges_.begin(), model.edges_.end(),
                                        [&edge](const AliasEdge& other) {
                                            return other.source == edge.target && other.target == edge.source;
                                        });
        if (!reciprocated) {
            throw MalformedUnitError(edge.source.unit,
                "'" + edge.source.toString() + "' aliases '" + edge.target.toString() +
                "' but the alias is not declared in the other direction");
        }
    }

    BSLOG_DEBUG("Modelled unit " << model.rootName_ << ": " << model.units_.size() << " units, "
                << model.attributes_.size() << " attributes, " << model.edges_.size() << " alias edges");
    return model;
}

bool UnitModel::contains(const AttributeKey& key) const {
    return index_.count(key) > 0;
}

const UnitModel::Slot& UnitModel::slot(const AttributeKey& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown attribute: " + key.toString());
    }
    return slots_[it->second];
}

AttributeType UnitModel::typeOf(const AttributeKey& key) const {
    return slot(key).type;
}

const AttributeValue& UnitModel::defaultOf(const AttributeKey& key) const {
    return slot(key).effectiveDefault;
}

const AttributeValue& UnitModel::declaredDefaultOf(const AttributeKey& key) const {
    return slot(key).declaredDefault;
}

size_t UnitModel::indexOf(const AttributeKey& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw std::out_of_range("Unknown attribute: " + key.toString());
    }
    return it->second;
}

} // namespace core
} // namespace bootscan
