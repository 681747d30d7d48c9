#include "bootscan/core/alias_resolver.h"
#include "bootscan/core/definition_cache.h"
#include "bootscan/core/exclusion_filter.h"
#include "bootscan/core/standard_units.h"
#include <benchmark/benchmark.h>
#include <random>
#include <string>
#include <vector>

using namespace bootscan::core;

namespace {

// Helper to generate candidates spread over a handful of packages
class CandidateGenerator {
public:
    CandidateGenerator() : rng_(42) {}

    Candidate generate() {
        static const char* const packages[] = {
            "com.example.web", "com.example.billing", "com.example.support", "com.acme.autoconfigure",
        };
        std::string name = std::string(packages[packageDist_(rng_)]) + ".Type" + std::to_string(nameDist_(rng_));
        if (flagDist_(rng_) == 0) {
            name += "Test";
        }
        Candidate candidate(name);
        if (flagDist_(rng_) == 1) {
            candidate.annotations.push_back("com.example.Generated");
        }
        if (flagDist_(rng_) == 2) {
            candidate.supertypes.push_back("com.example.Legacy");
        }
        return candidate;
    }

private:
    std::mt19937 rng_;
    std::uniform_int_distribution<> packageDist_{0, 3};
    std::uniform_int_distribution<> nameDist_{1, 10000};
    std::uniform_int_distribution<> flagDist_{0, 9};
};

class ExclusionFilterBenchmark : public benchmark::Fixture {
protected:
    void SetUp(const benchmark::State& state) override {
        CandidateGenerator generator;
        candidates_.clear();
        for (int i = 0; i < state.range(0); ++i) {
            candidates_.push_back(generator.generate());
        }

        std::vector<std::string> discovered;
        for (int i = 0; i < 200; ++i) {
            discovered.push_back("com.acme.autoconfigure.Type" + std::to_string(i));
        }
        chain_ = ExclusionFilterChain({
            makeTypeExcludeFilter(nullptr),
            makeAutoConfigurationExcludeFilter(discovered),
            ByAnnotationType{TypeRef("com.example.Generated")},
            ByAssignableType{TypeRef("com.example.Legacy")},
            ByRegexName(".*Test"),
        });
    }

    std::vector<Candidate> candidates_;
    ExclusionFilterChain chain_;
};

} // namespace

// Benchmark filtering a scan result
BENCHMARK_DEFINE_F(ExclusionFilterBenchmark, ApplyChain)(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(chain_.apply(candidates_));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(ExclusionFilterBenchmark, ApplyChain)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(benchmark::kMicrosecond);

// Benchmark resolving a declaration against a cached definition
static void BM_ResolveDeclaration(benchmark::State& state) {
    auto graph = DefinitionCache::shared().validate(units::bootApplication());
    InstanceDeclaration declaration(TypeRef("com.example.Application"));
    declaration.set(units::bootKey(units::kScanBasePackages), std::vector<std::string>{"com.example.web"});
    declaration.set(units::bootKey(units::kProxyBeanMethods), false);

    for (auto _ : state) {
        benchmark::DoNotOptimize(AliasResolver::resolve(graph, declaration));
    }
}
BENCHMARK(BM_ResolveDeclaration)->Unit(benchmark::kMicrosecond);

// Benchmark cached definition lookups
static void BM_CachedValidate(benchmark::State& state) {
    auto marker = units::bootApplication();
    DefinitionCache cache;
    cache.validate(marker);

    for (auto _ : state) {
        benchmark::DoNotOptimize(cache.validate(marker));
    }
}
BENCHMARK(BM_CachedValidate)->ThreadRange(1, 8);

BENCHMARK_MAIN();
