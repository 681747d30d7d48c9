#pragma once

#include "bootscan/core/attribute.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Base class of every fatal bootstrap error.
 *
 * All of these are static-configuration errors: they abort the bootstrap before
 * any scanning or registration happens and are never retried.
 */
class BootstrapError : public std::runtime_error {
public:
    explicit BootstrapError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A unit definition is structurally invalid (missing or mistyped alias
 * target, mismatched defaults, duplicate names).
 */
class MalformedUnitError : public BootstrapError {
public:
    MalformedUnitError(std::string unit, const std::string& message)
        : BootstrapError("Malformed unit '" + unit + "': " + message),
          unit_(std::move(unit)) {}

    const std::string& unit() const { return unit_; }

private:
    std::string unit_;
};

/**
 * @brief Alias edges form a cycle that cannot collapse into a single
 * equivalence class.
 */
class AliasCycleError : public BootstrapError {
public:
    explicit AliasCycleError(std::vector<AttributeKey> cycle);

    /**
     * @brief The cycle path; the first key is repeated at the end.
     */
    const std::vector<AttributeKey>& cycle() const { return cycle_; }

private:
    std::vector<AttributeKey> cycle_;
};

/**
 * @brief One explicitly set attribute taking part in an alias conflict.
 */
struct ConflictLocation {
    AttributeKey key;
    AttributeValue value;
};

/**
 * @brief Two or more aliased attributes were explicitly set to different values.
 */
class AliasConflictError : public BootstrapError {
public:
    explicit AliasConflictError(std::vector<ConflictLocation> locations);

    /**
     * @brief Every conflicting location, across all alias classes.
     */
    const std::vector<ConflictLocation>& locations() const { return locations_; }

private:
    std::vector<ConflictLocation> locations_;
};

/**
 * @brief An instance assigns an attribute that does not exist or gives it a
 * value of the wrong type.
 */
class InvalidAssignmentError : public BootstrapError {
public:
    InvalidAssignmentError(AttributeKey key, const std::string& message)
        : BootstrapError("Invalid assignment to '" + key.toString() + "': " + message),
          key_(std::move(key)) {}

    const AttributeKey& key() const { return key_; }

private:
    AttributeKey key_;
};

/**
 * @brief The automatic capability discovery collaborator failed or was cancelled.
 */
class DiscoveryError : public BootstrapError {
public:
    DiscoveryError(const std::string& message, bool cancelled)
        : BootstrapError((cancelled ? "Capability discovery cancelled: "
                                    : "Capability discovery failed: ") + message),
          cancelled_(cancelled) {}

    bool cancelled() const { return cancelled_; }

private:
    bool cancelled_;
};

} // namespace core
} // namespace bootscan
