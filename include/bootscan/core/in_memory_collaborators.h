#pragma once

#include "bootscan/core/collaborators.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace bootscan {
namespace core {

/**
 * @brief Scanner over a fixed list of candidates.
 *
 * Returns the registered candidates covered by the ScanSpec's base packages, in
 * registration order.
 */
class InMemoryComponentScanner : public ComponentScanner {
public:
    InMemoryComponentScanner() = default;
    explicit InMemoryComponentScanner(std::vector<Candidate> candidates);

    void addCandidate(Candidate candidate);

    std::vector<Candidate> scan(const ScanSpec& spec) override;

    /**
     * @brief Number of scan() calls so far.
     */
    size_t scanCount() const;

private:
    mutable std::mutex mutex_;
    std::vector<Candidate> candidates_;
    size_t scans_{0};
};

/**
 * @brief Discovery over a fixed, ordered list of names.
 *
 * Duplicate names are dropped, keeping the first occurrence. The discovery can
 * be set to fail or to report cancellation.
 */
class StaticCapabilityDiscovery : public CapabilityDiscovery {
public:
    StaticCapabilityDiscovery() = default;
    explicit StaticCapabilityDiscovery(std::vector<std::string> names);

    void addCandidate(const std::string& name);
    void failWith(const std::string& message);
    void cancelWith(const std::string& message);

    Result<std::vector<std::string>> discover() override;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> names_;
    std::optional<utils::Error> error_;
};

/**
 * @brief Container that records every call, in order.
 */
class RecordingContainer : public RegistrationContainer {
public:
    enum class Phase {
        Explicit,
        Deferred
    };

    struct Registration {
        std::string name;
        Phase phase;
    };

    void registerExplicit(const std::vector<std::string>& names, RegistrationMode mode) override;
    void applyDeferredImports(const std::vector<std::string>& names) override;

    std::vector<Registration> registrations() const;

    /**
     * @brief Name-to-registration map in which an explicit registration is
     * never replaced by a deferred one.
     */
    std::map<std::string, Phase> effectiveRegistrations() const;

    std::optional<RegistrationMode> mode() const;

private:
    mutable std::mutex mutex_;
    std::vector<Registration> registrations_;
    std::optional<RegistrationMode> mode_;
};

} // namespace core
} // namespace bootscan
