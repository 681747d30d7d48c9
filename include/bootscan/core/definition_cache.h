#pragma once

#include "bootscan/core/alias_resolver.h"
#include "bootscan/core/unit_definition.h"
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace bootscan {
namespace core {

/**
 * @brief Statistics about cache usage.
 */
struct DefinitionCacheStats {
    size_t hits{0};           ///< Lookups answered by an existing slot
    size_t misses{0};         ///< Lookups that created a slot
    size_t computations{0};   ///< Validations actually run
    size_t failures{0};       ///< Validations that threw
};

/**
 * @brief Configuration for the definition cache.
 */
struct DefinitionCacheConfig {
    /**
     * @brief Whether to track DefinitionCacheStats.
     */
    bool track_stats{false};
};

/**
 * @brief Registry of validated alias graphs, keyed by unit definition name.
 *
 * Validation of a definition is a pure function of the static declaration, so
 * results are shared read-only by every bootstrap in the process, including
 * concurrent ones.
 *
 * Concurrency:
 * - Lookups of filled keys take a shared lock only.
 * - A miss creates the key's slot under a short exclusive lock; the validation
 *   itself runs under that slot's once-flag, so each key is computed at most
 *   once and no lock is held while other keys are validated.
 * - A validation that throws is remembered; every later lookup of the key
 *   rethrows the same error.
 */
class DefinitionCache {
public:
    using Compute = std::function<std::shared_ptr<const AliasGraph>()>;

    explicit DefinitionCache(const DefinitionCacheConfig& config = DefinitionCacheConfig{});

    ~DefinitionCache() = default;

    // Prevent copying
    DefinitionCache(const DefinitionCache&) = delete;
    DefinitionCache& operator=(const DefinitionCache&) = delete;

    /**
     * @brief Returns the cached graph for key, running compute on first use.
     *
     * @param key Stable identity of the definition
     * @param compute Validation to run if the key has never been computed
     * @return The shared, validated graph
     * @throws whatever compute threw, on this and every later call for the key
     */
    std::shared_ptr<const AliasGraph> getOrCompute(const std::string& key, const Compute& compute);

    /**
     * @brief Models and validates a unit definition, caching by its name.
     *
     * @throws MalformedUnitError if a different definition with the same name
     *         was validated before
     */
    std::shared_ptr<const AliasGraph> validate(const std::shared_ptr<const UnitDefinition>& unit);

    /**
     * @brief True if the key has a successfully computed graph.
     */
    bool contains(const std::string& key) const;

    size_t size() const;

    void clear();

    DefinitionCacheStats get_stats() const;

    /**
     * @brief Process-wide cache used by bootstraps that are not given one.
     */
    static DefinitionCache& shared();

private:
    struct Slot {
        std::once_flag once;
        std::atomic<bool> ready{false};   // graph is set and valid
        std::shared_ptr<const UnitDefinition> unit;   // set when filled by validate()
        std::shared_ptr<const AliasGraph> graph;
        std::exception_ptr error;
    };

    std::shared_ptr<Slot> findOrCreateSlot(const std::string& key);
    void fill(Slot& slot, const std::string& key, const Compute& compute,
              const std::shared_ptr<const UnitDefinition>& unit);

    DefinitionCacheConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;

    mutable std::mutex statsMutex_;
    DefinitionCacheStats stats_;
};

} // namespace core
} // namespace bootscan
