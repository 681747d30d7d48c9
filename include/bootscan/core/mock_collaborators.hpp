#pragma once

#include <gmock/gmock.h>
#include "bootscan/core/collaborators.h"

namespace bootscan {
namespace core {

class MockComponentScanner : public ComponentScanner {
public:
    MOCK_METHOD(std::vector<Candidate>, scan, (const ScanSpec& spec), (override));
};

class MockCapabilityDiscovery : public CapabilityDiscovery {
public:
    MOCK_METHOD(Result<std::vector<std::string>>, discover, (), (override));
};

class MockRegistrationContainer : public RegistrationContainer {
public:
    MOCK_METHOD(void, registerExplicit, (const std::vector<std::string>& names, RegistrationMode mode), (override));
    MOCK_METHOD(void, applyDeferredImports, (const std::vector<std::string>& names), (override));
};

} // namespace core
} // namespace bootscan
