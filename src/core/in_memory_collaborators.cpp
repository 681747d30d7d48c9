#include "bootscan/core/in_memory_collaborators.h"
#include <algorithm>
#include <unordered_set>

namespace bootscan {
namespace core {

InMemoryComponentScanner::InMemoryComponentScanner(std::vector<Candidate> candidates)
    : candidates_(std::move(candidates)) {}

void InMemoryComponentScanner::addCandidate(Candidate candidate) {
    std::lock_guard<std::mutex> lock(mutex_);
    candidates_.push_back(std::move(candidate));
}

std::vector<Candidate> InMemoryComponentScanner::scan(const ScanSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    scans_++;
    std::vector<Candidate> found;
    for (const auto& candidate : candidates_) {
        if (spec.covers(candidate.name)) {
            found.push_back(candidate);
        }
    }
    return found;
}

size_t InMemoryComponentScanner::scanCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scans_;
}

StaticCapabilityDiscovery::StaticCapabilityDiscovery(std::vector<std::string> names)
    : names_(std::move(names)) {}

void StaticCapabilityDiscovery::addCandidate(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    names_.push_back(name);
}

void StaticCapabilityDiscovery::failWith(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = utils::Error{message, false};
}

void StaticCapabilityDiscovery::cancelWith(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = utils::Error::cancellation(message);
}

Result<std::vector<std::string>> StaticCapabilityDiscovery::discover() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error_) {
        return *error_;
    }
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& name : names_) {
        if (seen.insert(name).second) {
            unique.push_back(name);
        }
    }
    return unique;
}

void RecordingContainer::registerExplicit(const std::vector<std::string>& names, RegistrationMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
    for (const auto& name : names) {
        registrations_.push_back({name, Phase::Explicit});
    }
}

void RecordingContainer::applyDeferredImports(const std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& name : names) {
        registrations_.push_back({name, Phase::Deferred});
    }
}

std::vector<RecordingContainer::Registration> RecordingContainer::registrations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_;
}

std::map<std::string, RecordingContainer::Phase> RecordingContainer::effectiveRegistrations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Phase> effective;
    for (const auto& registration : registrations_) {
        // First registration of a name wins
        effective.emplace(registration.name, registration.phase);
    }
    return effective;
}

std::optional<RegistrationMode> RecordingContainer::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

} // namespace core
} // namespace bootscan
