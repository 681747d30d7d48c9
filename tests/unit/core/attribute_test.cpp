#include <gtest/gtest.h>
#include "bootscan/core/attribute.h"
#include <unordered_set>

using namespace bootscan::core;

TEST(TypeRefTest, PackageAndSimpleName) {
    TypeRef type("com.example.web.CartController");
    EXPECT_EQ(type.packageName(), "com.example.web");
    EXPECT_EQ(type.simpleName(), "CartController");
}

TEST(TypeRefTest, DefaultPackage) {
    TypeRef type("Main");
    EXPECT_EQ(type.packageName(), "");
    EXPECT_EQ(type.simpleName(), "Main");
}

TEST(TypeRefTest, IdentityIsNameIdentity) {
    EXPECT_EQ(TypeRef("a.B"), TypeRef("a.B"));
    EXPECT_NE(TypeRef("a.B"), TypeRef("a.C"));
}

TEST(AttributeValueTest, TypeOfFollowsAlternative) {
    EXPECT_EQ(typeOf(AttributeValue(std::string("x"))), AttributeType::String);
    EXPECT_EQ(typeOf(AttributeValue(std::vector<std::string>{})), AttributeType::StringList);
    EXPECT_EQ(typeOf(AttributeValue(TypeRef("a.B"))), AttributeType::TypeRef);
    EXPECT_EQ(typeOf(AttributeValue(std::vector<TypeRef>{})), AttributeType::TypeRefList);
    EXPECT_EQ(typeOf(AttributeValue(false)), AttributeType::Boolean);
    EXPECT_EQ(typeOf(AttributeValue(EnumValue{"Mode", "ON"})), AttributeType::Enum);
}

TEST(AttributeValueTest, Describe) {
    EXPECT_EQ(describe(AttributeValue(std::vector<std::string>{"a", "b"})), "{\"a\", \"b\"}");
    EXPECT_EQ(describe(AttributeValue(std::vector<TypeRef>{TypeRef("x.Y")})), "{x.Y}");
    EXPECT_EQ(describe(AttributeValue(true)), "true");
    EXPECT_EQ(describe(AttributeValue(EnumValue{"Mode", "ON"})), "Mode.ON");
}

TEST(AttributeKeyTest, HashAndOrdering) {
    std::unordered_set<AttributeKey> keys;
    keys.insert(AttributeKey("U", "a"));
    keys.insert(AttributeKey("U", "a"));
    keys.insert(AttributeKey("U", "b"));
    EXPECT_EQ(keys.size(), 2u);
    EXPECT_LT(AttributeKey("A", "z"), AttributeKey("B", "a"));
    EXPECT_EQ(AttributeKey("U", "a").toString(), "U.a");
}
