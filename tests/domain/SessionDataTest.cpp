#include <gtest/gtest.h>

#include "domain/SessionData.hpp"
#include <nlohmann/json.hpp>

using namespace slsession::domain;
using nlohmann::json;

// ============================================================================
// Создание
// ============================================================================

TEST(SessionDataTest, NewEmptySession_IsEmptyAndUnchanged) {
    auto session = SessionData::newEmptySession();

    EXPECT_TRUE(session.isEmpty());
    EXPECT_FALSE(session.hasChanged());
    EXPECT_EQ(session.toJson(), json::object());
}

TEST(SessionDataTest, FromClaimData_LoadsValuesWithoutMarkingChanged) {
    auto session = SessionData::fromClaimData({{"foo", "bar"}, {"count", 3}});

    EXPECT_FALSE(session.isEmpty());
    EXPECT_FALSE(session.hasChanged());
    EXPECT_EQ(session.get("foo"), "bar");
    EXPECT_EQ(session.get("count"), 3);
}

TEST(SessionDataTest, FromClaimData_NonObjectGivesEmptySession) {
    auto session = SessionData::fromClaimData(json::array({1, 2, 3}));

    EXPECT_TRUE(session.isEmpty());
    EXPECT_FALSE(session.hasChanged());
}

// ============================================================================
// Чтение
// ============================================================================

TEST(SessionDataTest, Get_MissingKeyReturnsDefault) {
    auto session = SessionData::newEmptySession();

    EXPECT_TRUE(session.get("missing").is_null());
    EXPECT_EQ(session.get("missing", "fallback"), "fallback");
    EXPECT_FALSE(session.has("missing"));
}

TEST(SessionDataTest, Get_KeepsNestedValues) {
    json cart = {{"items", {1, 2, 3}}, {"total", 42.5}};
    auto session = SessionData::fromClaimData({{"cart", cart}});

    EXPECT_EQ(session.get("cart"), cart);
    EXPECT_FALSE(session.hasChanged());
}

// ============================================================================
// Отслеживание изменений
// ============================================================================

TEST(SessionDataTest, Set_MarksChanged) {
    auto session = SessionData::newEmptySession();

    session.set("foo", "bar");

    EXPECT_TRUE(session.hasChanged());
    EXPECT_TRUE(session.has("foo"));
    EXPECT_EQ(session.get("foo"), "bar");
}

TEST(SessionDataTest, Set_SameValueStillMarksChanged) {
    auto session = SessionData::fromClaimData({{"foo", "bar"}});

    session.set("foo", "bar");

    EXPECT_TRUE(session.hasChanged());
}

TEST(SessionDataTest, Set_OverwritesValue) {
    auto session = SessionData::fromClaimData({{"foo", "bar"}});

    session.set("foo", "baz");

    EXPECT_EQ(session.get("foo"), "baz");
}

TEST(SessionDataTest, Remove_MarksChanged) {
    auto session = SessionData::fromClaimData({{"foo", "bar"}, {"other", 1}});

    session.remove("foo");

    EXPECT_TRUE(session.hasChanged());
    EXPECT_FALSE(session.has("foo"));
    EXPECT_FALSE(session.isEmpty());
}

TEST(SessionDataTest, Clear_RemovesAllAndMarksChanged) {
    auto session = SessionData::fromClaimData({{"foo", "bar"}});

    session.clear();

    EXPECT_TRUE(session.isEmpty());
    EXPECT_TRUE(session.hasChanged());
}

TEST(SessionDataTest, Clear_OnEmptySessionStillMarksChanged) {
    auto session = SessionData::newEmptySession();

    session.clear();

    EXPECT_TRUE(session.isEmpty());
    EXPECT_TRUE(session.hasChanged());
}

TEST(SessionDataTest, ChangedFlag_NeverResets) {
    auto session = SessionData::newEmptySession();

    session.set("foo", "bar");
    session.remove("foo");

    EXPECT_TRUE(session.isEmpty());
    EXPECT_TRUE(session.hasChanged());
}

TEST(SessionDataTest, ToJson_ReturnsAllEntries) {
    auto session = SessionData::newEmptySession();
    session.set("a", 1);
    session.set("b", json::array({"x", "y"}));

    json expected = {{"a", 1}, {"b", {"x", "y"}}};
    EXPECT_EQ(session.toJson(), expected);
}
