/**
 * @file CacheKeyNormalizerTest.cpp
 * @brief Unit tests for CacheKeyNormalizer
 */

#include <gtest/gtest.h>
#include "domain/CacheKeyNormalizer.hpp"
#include "domain/exceptions/InvalidKeyException.hpp"
#include "utils/HashUtils.hpp"

using namespace depcache;
using domain::CacheKeyNormalizer;
using json = nlohmann::json;

class CacheKeyNormalizerTest : public ::testing::Test {
protected:
    static bool isMd5(const std::string& value) {
        return value.size() == 32
            && value.find_first_not_of("0123456789abcdef") == std::string::npos;
    }

    CacheKeyNormalizer normalizer_;
};

// ============================================================================
// Строки и целые числа
// ============================================================================

TEST_F(CacheKeyNormalizerTest, ShortAlphanumericString_ReturnedAsIs) {
    EXPECT_EQ(normalizer_.normalize("abc"), "abc");
    EXPECT_EQ(normalizer_.normalize("User42"), "User42");
}

TEST_F(CacheKeyNormalizerTest, ThirtyTwoCharString_ReturnedAsIs) {
    std::string key(32, 'k');

    EXPECT_EQ(normalizer_.normalize(key), key);
}

TEST_F(CacheKeyNormalizerTest, ThirtyThreeCharString_Hashed) {
    std::string key = "abcdefghijklmnopqrstuvwxyz0123456";

    EXPECT_EQ(normalizer_.normalize(key), "2e34e06618c6dc00a857b09cd22e3ab2");
}

TEST_F(CacheKeyNormalizerTest, NonAlphanumericString_HashedWithoutJsonQuoting) {
    EXPECT_EQ(normalizer_.normalize("a-b"), "8ca2ed590cf2ea2404f2e67641bcdf50");
}

TEST_F(CacheKeyNormalizerTest, EmptyString_Hashed) {
    EXPECT_EQ(normalizer_.normalize(""), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(CacheKeyNormalizerTest, NonAsciiString_Hashed) {
    auto result = normalizer_.normalize("ключ");

    EXPECT_TRUE(isMd5(result));
    EXPECT_EQ(result, utils::HashUtils::md5Hex("ключ"));
}

TEST_F(CacheKeyNormalizerTest, PositiveInteger_ConvertedToString) {
    EXPECT_EQ(normalizer_.normalize(123), "123");
    EXPECT_EQ(normalizer_.normalize(json(18446744073709551615ULL)), "18446744073709551615");
}

TEST_F(CacheKeyNormalizerTest, NegativeInteger_HashedAsDecimalString) {
    EXPECT_EQ(normalizer_.normalize(-5), "47c1b025fa18ea96c33fbb6718688c0f");
}

// ============================================================================
// Составные ключи
// ============================================================================

TEST_F(CacheKeyNormalizerTest, Object_HashOfCanonicalJson) {
    json key = {{"a", 1}, {"b", 2}};

    EXPECT_EQ(normalizer_.normalize(key), "608de49a4600dbb5b173492759792e4a");
}

TEST_F(CacheKeyNormalizerTest, Object_MemberOrderDoesNotMatter) {
    json first = json::object();
    first["a"] = 1;
    first["b"] = 2;

    json second = json::object();
    second["b"] = 2;
    second["a"] = 1;

    EXPECT_EQ(normalizer_.normalize(first), normalizer_.normalize(second));
}

TEST_F(CacheKeyNormalizerTest, Array_HashOfCanonicalJson) {
    json key = json::array({"top", 10});

    EXPECT_EQ(normalizer_.normalize(key), "d80c85bc73ebfa15006496bdeb15a6de");
}

TEST_F(CacheKeyNormalizerTest, FloatKey_TreatedAsComposite) {
    EXPECT_EQ(normalizer_.normalize(1.5), "6008647277c4454cecd97d33c069f0ca");
}

TEST_F(CacheKeyNormalizerTest, DistinctComposites_DistinctKeys) {
    EXPECT_NE(
        normalizer_.normalize(json::array({"top", 10})),
        normalizer_.normalize(json::array({"top", 11}))
    );
}

TEST_F(CacheKeyNormalizerTest, DigestLength_IndependentOfInputSize) {
    json small = json::array({1});
    json large = json::array();
    for (int i = 0; i < 1000; ++i) {
        large.push_back("item" + std::to_string(i));
    }

    EXPECT_TRUE(isMd5(normalizer_.normalize(small)));
    EXPECT_TRUE(isMd5(normalizer_.normalize(large)));
}

TEST_F(CacheKeyNormalizerTest, CompositeWithInvalidUtf8_ThrowsInvalidKey) {
    json key = json::array({std::string("\xff\xfe", 2)});

    EXPECT_THROW(normalizer_.normalize(key), domain::exceptions::InvalidKeyException);
}

// ============================================================================
// Свойства
// ============================================================================

TEST_F(CacheKeyNormalizerTest, Normalize_IsDeterministic) {
    json key = {{"user", 7}, {"page", "profile"}};

    EXPECT_EQ(normalizer_.normalize(key), normalizer_.normalize(key));
}

TEST_F(CacheKeyNormalizerTest, Normalize_AppliedTwice_IsStable) {
    for (const json& key : {json("abc"), json("a-b"), json({{"a", 1}})}) {
        auto once = normalizer_.normalize(key);
        EXPECT_EQ(normalizer_.normalize(once), once);
    }
}

TEST(CacheKeyNormalizerStaticTest, IsAlphanumeric) {
    EXPECT_TRUE(CacheKeyNormalizer::isAlphanumeric("abc123XYZ"));
    EXPECT_FALSE(CacheKeyNormalizer::isAlphanumeric(""));
    EXPECT_FALSE(CacheKeyNormalizer::isAlphanumeric("app_"));
    EXPECT_FALSE(CacheKeyNormalizer::isAlphanumeric("a b"));
}

TEST(CacheKeyNormalizerStaticTest, ToKeyString_PlainForms) {
    EXPECT_EQ(CacheKeyNormalizer::toKeyString("a-b"), "a-b");
    EXPECT_EQ(CacheKeyNormalizer::toKeyString(-5), "-5");
    EXPECT_EQ(CacheKeyNormalizer::toKeyString(json::array({"top", 10})), "[\"top\",10]");
}
