#include <gtest/gtest.h>
#include "bootscan/core/exclusion_filter.h"
#include <algorithm>
#include <stdexcept>

using namespace bootscan::core;

class ExclusionFilterTest : public ::testing::Test {
protected:
    Candidate controller{"com.example.web.CartController", {}, {"bootscan.Component"}};
    Candidate generated{"com.example.GeneratedStub", {}, {"com.example.Generated"}};
    Candidate legacy{"com.example.billing.OldInvoices", {"com.example.Legacy", "java.lang.Object"}};
    Candidate legacyBase{"com.example.Legacy"};
    Candidate fixture{"com.example.web.CartControllerTest"};
};

TEST_F(ExclusionFilterTest, ByAnnotationType) {
    ExclusionFilter filter = ByAnnotationType{TypeRef("com.example.Generated")};
    EXPECT_TRUE(matches(filter, generated));
    EXPECT_FALSE(matches(filter, controller));
    EXPECT_EQ(describe(filter), "annotation(com.example.Generated)");
}

TEST_F(ExclusionFilterTest, ByAssignableTypeIncludesTheTypeItself) {
    ExclusionFilter filter = ByAssignableType{TypeRef("com.example.Legacy")};
    EXPECT_TRUE(matches(filter, legacy));
    EXPECT_TRUE(matches(filter, legacyBase));
    EXPECT_FALSE(matches(filter, controller));
}

TEST_F(ExclusionFilterTest, ByRegexNameMatchesWholeName) {
    ExclusionFilter suffix = ByRegexName(".*Test");
    EXPECT_TRUE(matches(suffix, fixture));
    EXPECT_FALSE(matches(suffix, controller));

    // A partial match is not enough
    ExclusionFilter partial = ByRegexName("Cart");
    EXPECT_FALSE(matches(partial, controller));
    EXPECT_EQ(describe(suffix), "regex(.*Test)");
}

TEST_F(ExclusionFilterTest, InvalidPatternIsRejected) {
    EXPECT_THROW(ByRegexName("com.example.(web"), std::invalid_argument);
}

TEST_F(ExclusionFilterTest, CustomPredicate) {
    ExclusionFilter filter = Custom{"short names", [](const Candidate& c) { return c.name.size() < 20; }};
    EXPECT_TRUE(matches(filter, legacyBase));
    EXPECT_FALSE(matches(filter, controller));
    EXPECT_EQ(describe(filter), "custom(short names)");

    ExclusionFilter empty = Custom{"nothing", nullptr};
    EXPECT_FALSE(matches(empty, legacyBase));
}

TEST_F(ExclusionFilterTest, ChainExcludesWhenAnyFilterMatches) {
    ExclusionFilterChain chain({
        ByAnnotationType{TypeRef("com.example.Generated")},
        ByRegexName(".*Test"),
    });
    EXPECT_TRUE(chain.isExcluded(generated));
    EXPECT_TRUE(chain.isExcluded(fixture));
    EXPECT_FALSE(chain.isExcluded(controller));
    EXPECT_EQ(chain.firstMatch(fixture), std::optional<size_t>(1));
    EXPECT_FALSE(chain.firstMatch(controller).has_value());

    auto kept = chain.apply({controller, generated, legacy, fixture});
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].name, controller.name);
    EXPECT_EQ(kept[1].name, legacy.name);
}

TEST_F(ExclusionFilterTest, EmptyChainExcludesNothing) {
    ExclusionFilterChain chain;
    EXPECT_TRUE(chain.empty());
    EXPECT_FALSE(chain.isExcluded(generated));
}

TEST_F(ExclusionFilterTest, OutcomeIndependentOfFilterOrder) {
    std::vector<ExclusionFilter> filters = {
        ByAnnotationType{TypeRef("com.example.Generated")},
        ByAssignableType{TypeRef("com.example.Legacy")},
        ByRegexName(".*Test"),
        Custom{"web", [](const Candidate& c) { return c.packageName() == "com.example.web"; }},
    };
    std::vector<Candidate> candidates = {controller, generated, legacy, legacyBase, fixture,
                                         Candidate("com.example.Plain")};

    std::vector<size_t> order = {0, 1, 2, 3};
    std::vector<bool> reference;
    for (const auto& candidate : candidates) {
        reference.push_back(ExclusionFilterChain(filters).isExcluded(candidate));
    }

    do {
        std::vector<ExclusionFilter> permuted;
        for (size_t index : order) {
            permuted.push_back(filters[index]);
        }
        ExclusionFilterChain chain(permuted);
        for (size_t i = 0; i < candidates.size(); ++i) {
            EXPECT_EQ(chain.isExcluded(candidates[i]), reference[i]) << candidates[i].name;
        }
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST_F(ExclusionFilterTest, ChainStopsAtFirstMatch) {
    int calls = 0;
    ExclusionFilterChain chain({
        ByRegexName(".*Stub"),
        Custom{"counting", [&calls](const Candidate&) { ++calls; return false; }},
    });
    EXPECT_TRUE(chain.isExcluded(generated));
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(chain.isExcluded(controller));
    EXPECT_EQ(calls, 1);
}

TEST_F(ExclusionFilterTest, TypeExcludeFilterDelegatesToHook) {
    auto filter = makeTypeExcludeFilter([](const Candidate& c) { return c.name == "com.example.GeneratedStub"; });
    EXPECT_EQ(filter.description, kTypeExcludeFilterName);
    EXPECT_TRUE(matches(ExclusionFilter(filter), generated));
    EXPECT_FALSE(matches(ExclusionFilter(filter), controller));

    auto unhooked = makeTypeExcludeFilter(nullptr);
    EXPECT_FALSE(matches(ExclusionFilter(unhooked), generated));
}

TEST_F(ExclusionFilterTest, AutoConfigurationExcludeFilterMatchesDiscoveredNames) {
    auto filter = makeAutoConfigurationExcludeFilter({"com.acme.WebAutoConfiguration"});
    EXPECT_EQ(filter.description, kAutoConfigurationExcludeFilterName);
    EXPECT_TRUE(matches(ExclusionFilter(filter), Candidate("com.acme.WebAutoConfiguration")));
    EXPECT_FALSE(matches(ExclusionFilter(filter), Candidate("com.acme.DataAutoConfiguration")));
}

TEST_F(ExclusionFilterTest, CandidatePackage) {
    EXPECT_EQ(controller.packageName(), "com.example.web");
    EXPECT_EQ(Candidate("Main").packageName(), "");
}
