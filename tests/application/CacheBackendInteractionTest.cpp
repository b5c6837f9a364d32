/**
 * @file CacheBackendInteractionTest.cpp
 * @brief Что именно Cache передаёт в ICachePort
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "application/Cache.hpp"
#include "dependencies/ValueDependency.hpp"
#include "domain/exceptions/SetCacheException.hpp"
#include "../mocks/MockCachePort.hpp"

using namespace depcache;
using namespace depcache::application;
using namespace depcache::tests;
using json = nlohmann::json;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Key;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::StrictMock;
using ::testing::Throw;
using ::testing::UnorderedElementsAre;

namespace {

MATCHER_P(IsPlainEntry, expected, "") {
    const auto* plain = std::get_if<domain::PlainEntry>(&arg);
    return plain && plain->value == json(expected);
}

MATCHER_P(IsTaggedEntryWith, dependency, "") {
    const auto* tagged = std::get_if<domain::TaggedEntry>(&arg);
    return tagged && tagged->dependency == dependency;
}

} // namespace

class CacheBackendInteractionTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler_ = std::make_shared<StrictMock<MockCachePort>>();
        cache_ = std::make_shared<Cache>(handler_);
    }

    std::shared_ptr<StrictMock<MockCachePort>> handler_;
    std::shared_ptr<Cache> cache_;
};

// ============================================================================
// ТЕСТЫ: ключи
// ============================================================================

TEST_F(CacheBackendInteractionTest, Set_PrefixedShortKey_PassedAsIs) {
    cache_->setKeyPrefix("app");

    EXPECT_CALL(*handler_, set("appabc", IsPlainEntry("v"), _))
        .WillOnce(Return(true));

    EXPECT_TRUE(cache_->set("abc", "v"));
}

TEST_F(CacheBackendInteractionTest, Set_PrefixedCompositeKey_Hashed) {
    cache_->setKeyPrefix("app");

    EXPECT_CALL(*handler_, set("app608de49a4600dbb5b173492759792e4a", _, _))
        .WillOnce(Return(true));

    cache_->set(json({{"a", 1}, {"b", 2}}), "v");
}

TEST_F(CacheBackendInteractionTest, Has_DelegatesToExists) {
    EXPECT_CALL(*handler_, exists("abc")).WillOnce(Return(true));

    EXPECT_TRUE(cache_->has("abc"));
}

// ============================================================================
// ТЕСТЫ: TTL
// ============================================================================

TEST_F(CacheBackendInteractionTest, Set_NoTtl_DefaultTtlForwarded) {
    cache_->setDefaultTtl(std::chrono::seconds(60));

    EXPECT_CALL(*handler_, set("abc", _, Eq(domain::Ttl(std::chrono::seconds(60)))))
        .WillOnce(Return(true));

    cache_->set("abc", 1);
}

TEST_F(CacheBackendInteractionTest, Set_ExplicitTtl_WinsOverDefault) {
    cache_->setDefaultTtl(std::chrono::seconds(60));

    EXPECT_CALL(*handler_, set("abc", _, Eq(domain::Ttl(std::chrono::seconds(5)))))
        .WillOnce(Return(true));

    cache_->set("abc", 1, std::chrono::seconds(5));
}

TEST_F(CacheBackendInteractionTest, Set_NoTtlNoDefault_Infinite) {
    EXPECT_CALL(*handler_, set("abc", _, Eq(domain::Ttl())))
        .WillOnce(Return(true));

    cache_->set("abc", 1);
}

TEST_F(CacheBackendInteractionTest, Set_DurationTtl_ConvertedToSeconds) {
    EXPECT_CALL(*handler_, set("abc", _, Eq(domain::Ttl(std::chrono::seconds(7200)))))
        .WillOnce(Return(true));

    cache_->set("abc", 1, std::chrono::hours(2));
}

TEST_F(CacheBackendInteractionTest, Set_NegativeTtl_ForwardedUnchanged) {
    cache_->setDefaultTtl(std::chrono::seconds(60));

    EXPECT_CALL(*handler_, set("abc", _, Eq(domain::Ttl(std::chrono::seconds(-1)))))
        .WillOnce(Return(true));

    cache_->set("abc", 1, std::chrono::seconds(-1));
}

TEST_F(CacheBackendInteractionTest, SetMultiple_UniformTtlSingleCall) {
    cache_->setDefaultTtl(std::chrono::seconds(30));
    Cache::KeyValueMap values;
    values["a"] = 1;
    values["b"] = 2;

    EXPECT_CALL(*handler_, setMultiple(
            UnorderedElementsAre(Key("a"), Key("b")),
            Eq(domain::Ttl(std::chrono::seconds(30)))))
        .WillOnce(Return(true));

    EXPECT_TRUE(cache_->setMultiple(values));
}

// ============================================================================
// ТЕСТЫ: зависимости
// ============================================================================

TEST_F(CacheBackendInteractionTest, Set_WithDependency_StoresTaggedEntry) {
    auto dependency = std::make_shared<dependencies::ValueDependency>(42);

    EXPECT_CALL(*handler_, set("abc", IsTaggedEntryWith(dependency), _))
        .WillOnce(Return(true));

    cache_->set("abc", "v", std::nullopt, dependency);

    EXPECT_TRUE(dependency->isEvaluated());
    EXPECT_EQ(dependency->getSnapshot(), 42);
}

TEST_F(CacheBackendInteractionTest, Get_TaggedEntryUnwrapped) {
    auto dependency = std::make_shared<dependencies::ValueDependency>(1);
    dependency->evaluateDependency(*cache_);

    EXPECT_CALL(*handler_, get("abc"))
        .WillOnce(Return(domain::CacheEntry(domain::TaggedEntry{"v", dependency})));

    EXPECT_EQ(cache_->get("abc"), "v");
}

// ============================================================================
// ТЕСТЫ: add / addMultiple
// ============================================================================

TEST_F(CacheBackendInteractionTest, Add_Existing_NoWrite) {
    EXPECT_CALL(*handler_, exists("abc")).WillOnce(Return(true));

    EXPECT_FALSE(cache_->add("abc", 1));
}

TEST_F(CacheBackendInteractionTest, Add_Absent_Writes) {
    EXPECT_CALL(*handler_, exists("abc")).WillOnce(Return(false));
    EXPECT_CALL(*handler_, set("abc", IsPlainEntry(1), _)).WillOnce(Return(true));

    EXPECT_TRUE(cache_->add("abc", 1));
}

TEST_F(CacheBackendInteractionTest, AddMultiple_ExistingDroppedSilently) {
    Cache::KeyValueMap values;
    values["a"] = 1;
    values["b"] = 2;

    ports::output::ICachePort::OptionalEntryMap existing;
    existing["a"] = domain::CacheEntry(domain::PlainEntry{"old"});
    existing["b"] = std::nullopt;

    EXPECT_CALL(*handler_, getMultiple(ElementsAre("a", "b")))
        .WillOnce(Return(existing));
    EXPECT_CALL(*handler_, setMultiple(ElementsAre(Key("b")), _))
        .WillOnce(Return(false));

    EXPECT_FALSE(cache_->addMultiple(values));
}

TEST_F(CacheBackendInteractionTest, AddMultiple_StoredNullCountsAsAbsent) {
    Cache::KeyValueMap values;
    values["a"] = 1;
    values["b"] = 2;

    ports::output::ICachePort::OptionalEntryMap existing;
    existing["a"] = domain::CacheEntry(domain::PlainEntry{nullptr});
    existing["b"] = domain::CacheEntry(domain::PlainEntry{"old"});

    EXPECT_CALL(*handler_, getMultiple(ElementsAre("a", "b")))
        .WillOnce(Return(existing));
    EXPECT_CALL(*handler_, setMultiple(ElementsAre(Key("a")), _))
        .WillOnce(Return(true));

    EXPECT_TRUE(cache_->addMultiple(values));
}

// ============================================================================
// ТЕСТЫ: батчи
// ============================================================================

TEST_F(CacheBackendInteractionTest, GetMultiple_SingleBackendCall) {
    json composite = {{"a", 1}, {"b", 2}};
    ports::output::ICachePort::OptionalEntryMap stored;
    stored["608de49a4600dbb5b173492759792e4a"] = domain::CacheEntry(domain::PlainEntry{"c"});
    stored["x"] = std::nullopt;

    EXPECT_CALL(*handler_, getMultiple(UnorderedElementsAre("608de49a4600dbb5b173492759792e4a", "x")))
        .WillOnce(Return(stored));

    auto values = cache_->getMultiple({composite, json("x")}, 0);

    EXPECT_EQ(values.at(composite), "c");
    EXPECT_EQ(values.at("x"), 0);
}

TEST_F(CacheBackendInteractionTest, RemoveMultiple_NormalizedKeys) {
    EXPECT_CALL(*handler_, removeMultiple(UnorderedElementsAre("abc", "8ca2ed590cf2ea2404f2e67641bcdf50")))
        .WillOnce(Return(true));

    EXPECT_TRUE(cache_->removeMultiple({json("abc"), json("a-b")}));
}

TEST_F(CacheBackendInteractionTest, Clear_Delegates) {
    EXPECT_CALL(*handler_, clear()).WillOnce(Return(false));

    EXPECT_FALSE(cache_->clear());
}

// ============================================================================
// ТЕСТЫ: ошибки
// ============================================================================

TEST_F(CacheBackendInteractionTest, GetOrSet_WriteFails_ThrowsWithComputedValue) {
    EXPECT_CALL(*handler_, get("abc")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*handler_, set("abc", _, _)).WillOnce(Return(false));

    try {
        cache_->getOrSet("abc", [](ports::input::ICache&) { return json("computed"); });
        FAIL() << "Expected SetCacheException";
    } catch (const domain::exceptions::SetCacheException& e) {
        EXPECT_EQ(e.getKey(), "abc");
        EXPECT_EQ(e.getValue(), "computed");
        EXPECT_EQ(&e.getCache(), cache_.get());
    }
}

TEST_F(CacheBackendInteractionTest, GetOrSet_WarmKey_NoWrite) {
    EXPECT_CALL(*handler_, get("abc"))
        .WillOnce(Return(domain::CacheEntry(domain::PlainEntry{"cached"})));

    auto value = cache_->getOrSet("abc", [](ports::input::ICache&) -> json {
        ADD_FAILURE() << "factory must not be called";
        return nullptr;
    });

    EXPECT_EQ(value, "cached");
}

TEST_F(CacheBackendInteractionTest, BackendException_PassesThrough) {
    EXPECT_CALL(*handler_, get("abc"))
        .WillOnce(Throw(std::runtime_error("storage unavailable")));

    EXPECT_THROW(cache_->get("abc"), std::runtime_error);
}
