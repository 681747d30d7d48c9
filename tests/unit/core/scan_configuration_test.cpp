#include <gtest/gtest.h>
#include "bootscan/core/scan_configuration.h"
#include "bootscan/core/standard_units.h"
#include <type_traits>

using namespace bootscan::core;

namespace {

using StringList = std::vector<std::string>;
using TypeRefList = std::vector<TypeRef>;

} // namespace

class ScanConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph = std::make_shared<const AliasGraph>(
            AliasGraph::build(UnitModel::build(units::bootApplication())));
    }

    ScanSpec build(const InstanceDeclaration& declaration) {
        auto resolved = AliasResolver::resolve(graph, declaration);
        return ScanConfigurationBuilder(resolved).build();
    }

    std::shared_ptr<const AliasGraph> graph;
};

TEST_F(ScanConfigurationTest, DefaultsToEntryPointPackage) {
    InstanceDeclaration declaration(TypeRef("com.example.Application"));
    auto spec = build(declaration);

    EXPECT_EQ(spec.basePackages, std::set<std::string>{"com.example"});
    EXPECT_FALSE(spec.nameGenerator.has_value());
    EXPECT_FALSE(spec.lazyInit);
    ASSERT_EQ(spec.excludeFilters.size(), 2u);
    EXPECT_EQ(describe(spec.excludeFilters.filters()[0]), std::string("custom(") + kTypeExcludeFilterName + ")");
    EXPECT_EQ(describe(spec.excludeFilters.filters()[1]),
              std::string("custom(") + kAutoConfigurationExcludeFilterName + ")");
}

TEST_F(ScanConfigurationTest, DefaultPackageEntryPointCoversEverything) {
    InstanceDeclaration declaration(TypeRef("Application"));
    auto spec = build(declaration);
    EXPECT_EQ(spec.basePackages, std::set<std::string>{""});
    EXPECT_TRUE(spec.covers("anything.At.All"));
}

TEST_F(ScanConfigurationTest, PackagesAndClassPackagesAreUnited) {
    InstanceDeclaration declaration(TypeRef("com.example.Application"));
    declaration.set(units::bootKey(units::kScanBasePackages), StringList{"com.example.web, com.example.api"});
    declaration.set(units::bootKey(units::kScanBasePackageClasses),
                    TypeRefList{TypeRef("com.other.Marker"), TypeRef("com.example.web.Root")});
    auto spec = build(declaration);

    std::set<std::string> expected{"com.example.web", "com.example.api", "com.other"};
    EXPECT_EQ(spec.basePackages, expected);
}

TEST_F(ScanConfigurationTest, ExplicitNameGeneratorIsReported) {
    InstanceDeclaration declaration(TypeRef("com.example.Application"));
    declaration.set(units::bootKey(units::kNameGenerator), TypeRef("com.example.FullNames"));
    declaration.set(AttributeKey(units::kComponentScan, units::kLazyInit), true);
    auto spec = build(declaration);

    ASSERT_TRUE(spec.nameGenerator.has_value());
    EXPECT_EQ(*spec.nameGenerator, TypeRef("com.example.FullNames"));
    EXPECT_TRUE(spec.lazyInit);
}

TEST_F(ScanConfigurationTest, AdditionalFiltersFollowBuiltIns) {
    InstanceDeclaration declaration(TypeRef("com.example.Application"));
    auto resolved = AliasResolver::resolve(graph, declaration);
    auto spec = ScanConfigurationBuilder(resolved)
        .withExclusionHook([](const Candidate& c) { return c.name == "com.example.Hidden"; })
        .withAutoDiscovered({"com.example.config.WebAutoConfiguration"})
        .addExcludeFilter(ByRegexName(".*Test"))
        .build();

    ASSERT_EQ(spec.excludeFilters.size(), 3u);
    EXPECT_EQ(describe(spec.excludeFilters.filters()[2]), "regex(.*Test)");
    EXPECT_EQ(spec.excludeFilters.firstMatch(Candidate("com.example.Hidden")), std::optional<size_t>(0));
    EXPECT_EQ(spec.excludeFilters.firstMatch(Candidate("com.example.config.WebAutoConfiguration")),
              std::optional<size_t>(1));
    EXPECT_EQ(spec.excludeFilters.firstMatch(Candidate("com.example.CartTest")), std::optional<size_t>(2));
    EXPECT_FALSE(spec.excludeFilters.isExcluded(Candidate("com.example.Cart")));
}

TEST_F(ScanConfigurationTest, ModelWithoutComponentScanIsRejected) {
    auto plain = std::make_shared<const AliasGraph>(
        AliasGraph::build(UnitModel::build(units::configuration())));
    auto resolved = AliasResolver::resolve(plain, InstanceDeclaration(TypeRef("com.example.Config")));
    EXPECT_THROW(ScanConfigurationBuilder(resolved).build(), std::out_of_range);
}

TEST(ScanSpecTest, CoversPackageAndSubpackages) {
    ScanSpec spec;
    spec.basePackages = {"com.example"};
    EXPECT_TRUE(spec.covers("com.example.Application"));
    EXPECT_TRUE(spec.covers("com.example.web.CartController"));
    EXPECT_FALSE(spec.covers("com.examples.Other"));
    EXPECT_FALSE(spec.covers("com.example"));
    EXPECT_FALSE(spec.covers("org.example.Thing"));
}

TEST(PackageTokenizerTest, SplitsOnAllDelimiters) {
    auto tokens = ScanConfigurationBuilder::tokenizePackages(" a.b, c.d;e.f\tg.h\n\ni.j ;, ");
    StringList expected{"a.b", "c.d", "e.f", "g.h", "i.j"};
    EXPECT_EQ(tokens, expected);
    EXPECT_TRUE(ScanConfigurationBuilder::tokenizePackages(" ,; ").empty());
}

TEST(ScanConfigurationBuilderTest, RequiresResolvedValuesThatOutliveIt) {
    static_assert(std::is_constructible<ScanConfigurationBuilder, const ResolvedAttributes&>::value,
                  "builder reads resolved values it does not own");
    static_assert(!std::is_constructible<ScanConfigurationBuilder, ResolvedAttributes&&>::value,
                  "a temporary would leave the builder dangling");
    SUCCEED();
}
