#include "bootscan/core/definition_cache.h"
#include "bootscan/core/errors.h"
#include "bootscan/utils/logging.hpp"
#include <stdexcept>

namespace bootscan {
namespace core {

DefinitionCache::DefinitionCache(const DefinitionCacheConfig& config)
    : config_(config) {}

std::shared_ptr<DefinitionCache::Slot> DefinitionCache::findOrCreateSlot(const std::string& key) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end()) {
            if (config_.track_stats) {
                std::lock_guard<std::mutex> statsLock(statsMutex_);
                stats_.hits++;
            }
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = slots_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<Slot>();
    }
    if (config_.track_stats) {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        if (inserted) {
            stats_.misses++;
        } else {
            stats_.hits++;
        }
    }
    return it->second;
}

void DefinitionCache::fill(Slot& slot, const std::string& key, const Compute& compute,
                           const std::shared_ptr<const UnitDefinition>& unit) {
    std::call_once(slot.once, [&]() {
        slot.unit = unit;
        if (config_.track_stats) {
            std::lock_guard<std::mutex> statsLock(statsMutex_);
            stats_.computations++;
        }
        try {
            slot.graph = compute();
            if (!slot.graph) {
                throw std::logic_error("Definition validation for '" + key + "' produced no graph");
            }
            slot.ready.store(true, std::memory_order_release);
        } catch (...) {
            // Remembered and rethrown to every caller
            slot.error = std::current_exception();
            if (config_.track_stats) {
                std::lock_guard<std::mutex> statsLock(statsMutex_);
                stats_.failures++;
            }
        }
    });
}

std::shared_ptr<const AliasGraph> DefinitionCache::getOrCompute(const std::string& key, const Compute& compute) {
    auto slot = findOrCreateSlot(key);
    fill(*slot, key, compute, nullptr);

    if (slot->error) {
        std::rethrow_exception(slot->error);
    }
    return slot->graph;
}

std::shared_ptr<const AliasGraph> DefinitionCache::validate(const std::shared_ptr<const UnitDefinition>& unit) {
    if (!unit) {
        throw std::invalid_argument("DefinitionCache::validate requires a unit definition");
    }
    auto slot = findOrCreateSlot(unit->name);
    fill(*slot, unit->name, [&unit]() {
        BSLOG_DEBUG("Validating unit definition " << unit->name);
        return std::make_shared<const AliasGraph>(AliasGraph::build(UnitModel::build(unit)));
    }, unit);

    // The slot is keyed by name; the graph belongs to the definition that filled it
    if (slot->unit != unit) {
        BSLOG_ERROR("Definition cache already holds a different unit named " << unit->name);
        throw MalformedUnitError(unit->name, "two different definitions share this name");
    }
    if (slot->error) {
        std::rethrow_exception(slot->error);
    }
    return slot->graph;
}

bool DefinitionCache::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(key);
    return it != slots_.end() && it->second->ready.load(std::memory_order_acquire);
}

size_t DefinitionCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return slots_.size();
}

void DefinitionCache::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    slots_.clear();
}

DefinitionCacheStats DefinitionCache::get_stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

DefinitionCache& DefinitionCache::shared() {
    static DefinitionCache instance;
    return instance;
}

} // namespace core
} // namespace bootscan
