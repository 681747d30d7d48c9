#include "bootscan/core/bootstrap_coordinator.h"
#include "bootscan/core/errors.h"
#include "bootscan/core/in_memory_collaborators.h"
#include "bootscan/core/standard_units.h"
#include "bootscan/utils/serialization.h"
#include <fstream>
#include <iostream>

using namespace bootscan::core;

namespace {

nlohmann::json loadJson(const char* path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("Failed to open ") + path);
    }
    return nlohmann::json::parse(in);
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Usage: bootscan_basic_example [declaration.json [config.json]]
        auto marker = units::bootApplication();
        auto graph = DefinitionCache::shared().validate(marker);

        InstanceDeclaration declaration(TypeRef("com.example.shop.ShopApplication"));
        if (argc > 1) {
            declaration = bootscan::utils::parseDeclaration(loadJson(argv[1]), graph->model());
        } else {
            declaration.set(units::bootKey(units::kExclude),
                            std::vector<TypeRef>{TypeRef("com.acme.autoconfigure.MetricsAutoConfiguration")});
        }

        BootstrapConfig config;
        if (argc > 2) {
            config = BootstrapConfig::fromJson(loadJson(argv[2]));
        }
        if (config.log_level) {
            bootscan::utils::setLogLevel(*config.log_level);
        }

        auto scanner = std::make_shared<InMemoryComponentScanner>(std::vector<Candidate>{
            Candidate("com.example.shop.ShopApplication"),
            Candidate("com.example.shop.web.CartController", {}, {"bootscan.Component"}),
            Candidate("com.example.shop.billing.InvoiceService", {"com.example.shop.billing.Billing"}),
            Candidate("com.example.shop.support.GeneratedStub", {}, {"com.example.Generated"}),
            Candidate("com.example.other.Unrelated"),
        });
        auto discovery = std::make_shared<StaticCapabilityDiscovery>(std::vector<std::string>{
            "com.acme.autoconfigure.DataSourceAutoConfiguration",
            "com.acme.autoconfigure.MetricsAutoConfiguration",
            "com.acme.autoconfigure.WebAutoConfiguration",
        });
        auto container = std::make_shared<RecordingContainer>();

        BootstrapCoordinator coordinator(marker, declaration, scanner, discovery, container, config);
        coordinator.setExclusionHook([](const Candidate& candidate) {
            return candidate.name.find("Generated") != std::string::npos;
        });

        const auto& plan = coordinator.bootstrap();
        std::cout << bootscan::utils::toJson(plan).dump(2) << "\n";
        return 0;
    } catch (const BootstrapError& e) {
        std::cerr << "Bootstrap failed: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
