#include <gtest/gtest.h>
#include "bootscan/core/bootstrap_config.h"
#include "bootscan/core/errors.h"
#include "bootscan/core/standard_units.h"
#include "bootscan/utils/serialization.h"

using namespace bootscan::core;
using namespace bootscan::utils;
using json = nlohmann::json;

namespace {

using StringList = std::vector<std::string>;

} // namespace

TEST(SerializationTest, ParseAttributeValues) {
    EXPECT_EQ(parseAttributeValue(json("x"), AttributeType::String), AttributeValue(std::string("x")));
    EXPECT_EQ(parseAttributeValue(json::array({"a", "b"}), AttributeType::StringList),
              AttributeValue(StringList{"a", "b"}));
    // A single string stands for a one-element list
    EXPECT_EQ(parseAttributeValue(json("a"), AttributeType::StringList), AttributeValue(StringList{"a"}));
    EXPECT_EQ(parseAttributeValue(json("x.Y"), AttributeType::TypeRef), AttributeValue(TypeRef("x.Y")));
    EXPECT_EQ(parseAttributeValue(json(false), AttributeType::Boolean), AttributeValue(false));
    EXPECT_EQ(parseAttributeValue(json("ScopedProxyMode.NO"), AttributeType::Enum),
              AttributeValue(EnumValue{"ScopedProxyMode", "NO"}));
}

TEST(SerializationTest, RejectValuesOfWrongShape) {
    EXPECT_THROW(parseAttributeValue(json("true"), AttributeType::Boolean), std::invalid_argument);
    EXPECT_THROW(parseAttributeValue(json::array({1, 2}), AttributeType::StringList), std::invalid_argument);
    EXPECT_THROW(parseAttributeValue(json("NOTANENUM"), AttributeType::Enum), std::invalid_argument);
    EXPECT_THROW(parseAttributeValue(json(3), AttributeType::TypeRef), std::invalid_argument);
}

TEST(SerializationTest, AttributeValueToJson) {
    EXPECT_EQ(toJson(AttributeValue(std::vector<TypeRef>{TypeRef("a.B")})), json::array({"a.B"}));
    EXPECT_EQ(toJson(AttributeValue(EnumValue{"Mode", "ON"})), json("Mode.ON"));
    EXPECT_EQ(toJson(AttributeValue(true)), json(true));
}

TEST(SerializationTest, ExclusionFilters) {
    auto regex = parseExclusionFilter(json{{"type", "regex"}, {"pattern", ".*Test"}});
    EXPECT_TRUE(matches(regex, Candidate("com.example.CartTest")));
    EXPECT_EQ(toJson(regex), (json{{"type", "regex"}, {"pattern", ".*Test"}}));

    auto annotation = parseExclusionFilter(json{{"type", "annotation"}, {"class", "com.example.Generated"}});
    EXPECT_TRUE(std::holds_alternative<ByAnnotationType>(annotation));

    auto assignable = parseExclusionFilter(json{{"type", "assignable"}, {"class", "com.example.Legacy"}});
    EXPECT_TRUE(matches(assignable, Candidate("com.example.Legacy")));

    ExclusionFilter custom = Custom{"hook", nullptr};
    EXPECT_EQ(toJson(custom)["type"], "custom");

    EXPECT_THROW(parseExclusionFilter(json{{"type", "aspectj"}, {"pattern", "*"}}), std::invalid_argument);
    EXPECT_THROW(parseExclusionFilter(json{{"type", "regex"}}), std::invalid_argument);
    EXPECT_THROW(parseExclusionFilter(json{{"type", "regex"}, {"pattern", "("}}), std::invalid_argument);
}

TEST(SerializationTest, ParseDeclaration) {
    auto model = UnitModel::build(units::bootApplication());
    auto declaration = parseDeclaration(json::parse(R"({
        "entry_point": "com.example.Application",
        "attributes": {"scanBasePackages": ["com.example.web"], "proxyBeanMethods": false},
        "units": {"bootscan.ComponentScan": {"lazyInit": true}}
    })"), model);

    EXPECT_EQ(declaration.entryPoint(), TypeRef("com.example.Application"));
    EXPECT_TRUE(declaration.isExplicitlySet(units::bootKey(units::kScanBasePackages)));
    EXPECT_TRUE(declaration.isExplicitlySet(AttributeKey(units::kComponentScan, units::kLazyInit)));
    EXPECT_EQ(declaration.assignments().size(), 3u);
}

TEST(SerializationTest, DeclarationErrors) {
    auto model = UnitModel::build(units::bootApplication());
    EXPECT_THROW(parseDeclaration(json::parse(R"({"attributes": {}})"), model), std::invalid_argument);
    EXPECT_THROW(parseDeclaration(json::parse(R"({"entry_point": "a.B", "attributes": {"scanAll": true}})"), model),
                 InvalidAssignmentError);
    EXPECT_THROW(parseDeclaration(json::parse(R"({"entry_point": "a.B", "attributes": {"proxyBeanMethods": "no"}})"),
                                  model),
                 std::invalid_argument);
}

TEST(SerializationTest, ScanSpecToJson) {
    ScanSpec spec;
    spec.basePackages = {"com.example"};
    spec.lazyInit = true;
    spec.excludeFilters = ExclusionFilterChain({ByRegexName(".*Test")});

    auto encoded = toJson(spec);
    EXPECT_EQ(encoded["base_packages"], json::array({"com.example"}));
    EXPECT_TRUE(encoded["name_generator"].is_null());
    EXPECT_EQ(encoded["lazy_init"], true);
    EXPECT_EQ(encoded["exclude_filters"].size(), 1u);
}

TEST(BootstrapConfigTest, ParsesEveryKey) {
    auto config = BootstrapConfig::fromJson(json::parse(R"({
        "log_level": "debug",
        "enable_auto_configuration": false,
        "autoconfigure.exclude": ["com.acme.A, com.acme.B", "com.acme.C"],
        "warn_unmatched_excludes": false,
        "exclude_filters": [{"type": "regex", "pattern": ".*Test"}]
    })"));

    ASSERT_TRUE(config.log_level.has_value());
    EXPECT_EQ(*config.log_level, LogLevel::Debug);
    EXPECT_FALSE(config.enable_auto_configuration);
    EXPECT_FALSE(config.warn_unmatched_excludes);
    EXPECT_EQ(config.exclude_names, (StringList{"com.acme.A", "com.acme.B", "com.acme.C"}));
    EXPECT_EQ(config.exclude_filters.size(), 1u);
}

TEST(BootstrapConfigTest, DefaultsWhenEmpty) {
    auto config = BootstrapConfig::fromJson(json::object());
    EXPECT_FALSE(config.log_level.has_value());
    EXPECT_TRUE(config.enable_auto_configuration);
    EXPECT_TRUE(config.warn_unmatched_excludes);
    EXPECT_TRUE(config.exclude_names.empty());
}

TEST(BootstrapConfigTest, RejectsBadValues) {
    EXPECT_THROW(BootstrapConfig::fromJson(json::array()), std::invalid_argument);
    EXPECT_THROW(BootstrapConfig::fromJson(json{{"enable_auto_configuration", "yes"}}), std::invalid_argument);
    EXPECT_THROW(BootstrapConfig::fromJson(json{{"log_level", "verbose"}}), std::invalid_argument);
    EXPECT_THROW(BootstrapConfig::fromJson(json{{"exclude_filters", json::object()}}), std::invalid_argument);
}
