#include "oddity/core/TemporalState.hh"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace oddity;

class TemporalStateTest : public ::testing::Test {
  protected:
    EntityState makeState(float x, const std::string& anim) {
        EntityState state;
        state.x = x;
        state.y = x * 2.0f;
        state.velocityX = 10.0f;
        state.animation = anim;
        return state;
    }
};

TEST_F(TemporalStateTest, FieldAccessIsTypeExact) {
    EntityState state;
    state.set("direction", int64_t{-1});
    state.set("angle", 1.5);
    state.set("isFrozen", true);
    state.set("movementType", std::string("linear"));

    EXPECT_EQ(state.get<int64_t>("direction"), -1);
    EXPECT_FALSE(state.get<double>("direction").has_value());
    EXPECT_DOUBLE_EQ(*state.getNumber("direction"), -1.0);
    EXPECT_DOUBLE_EQ(*state.getNumber("angle"), 1.5);
    EXPECT_EQ(state.get<bool>("isFrozen"), true);
    EXPECT_EQ(state.get<std::string>("movementType"), "linear");
    EXPECT_FALSE(state.getNumber("movementType").has_value());
    EXPECT_FALSE(state.get<bool>("missing").has_value());

    EXPECT_TRUE(state.has("angle"));
    state.erase("angle");
    EXPECT_FALSE(state.has("angle"));
}

TEST_F(TemporalStateTest, WellFormedRejectsNonFinite) {
    EntityState state;
    EXPECT_TRUE(isWellFormed(state));

    state.velocityY = std::numeric_limits<float>::infinity();
    EXPECT_FALSE(isWellFormed(state));

    state.velocityY = 0.0f;
    state.set("angle", std::nan(""));
    EXPECT_FALSE(isWellFormed(state));
}

TEST_F(TemporalStateTest, InterpolateLerpsContinuousFields) {
    EntityState a = makeState(0.0f, "run");
    EntityState b = makeState(100.0f, "jump");
    a.set("angle", 0.0);
    b.set("angle", 2.0);

    EntityState mid = interpolateState(a, b, 0.25);
    EXPECT_FLOAT_EQ(mid.x, 25.0f);
    EXPECT_FLOAT_EQ(mid.y, 50.0f);
    EXPECT_FLOAT_EQ(mid.velocityX, 10.0f);
    EXPECT_DOUBLE_EQ(*mid.get<double>("angle"), 0.5);
    EXPECT_EQ(mid.animation, "run");
}

TEST_F(TemporalStateTest, InterpolateEndpointsAreExact) {
    EntityState a = makeState(3.0f, "run");
    EntityState b = makeState(7.0f, "jump");
    a.isVisible = false;

    EXPECT_EQ(interpolateState(a, b, 0.0), a);
    EXPECT_EQ(interpolateState(a, b, 1.0), b);
}

TEST_F(TemporalStateTest, DiscreteFieldsTieFavoursLater) {
    EntityState a = makeState(0.0f, "run");
    EntityState b = makeState(10.0f, "jump");
    a.isAlive = true;
    b.isAlive = false;
    a.set("direction", int64_t{1});
    b.set("direction", int64_t{-1});

    EntityState tie = interpolateState(a, b, 0.5);
    EXPECT_EQ(tie.animation, "jump");
    EXPECT_FALSE(tie.isAlive);
    EXPECT_EQ(tie.get<int64_t>("direction"), -1);

    EntityState early = interpolateState(a, b, 0.49);
    EXPECT_EQ(early.animation, "run");
    EXPECT_TRUE(early.isAlive);
    EXPECT_EQ(early.get<int64_t>("direction"), 1);
}

TEST_F(TemporalStateTest, FieldsFromOneSideAreKept) {
    EntityState a = makeState(0.0f, "run");
    EntityState b = makeState(10.0f, "run");
    a.set("onlyEarlier", 4.0);
    b.set("onlyLater", std::string("yes"));

    EntityState mid = interpolateState(a, b, 0.5);
    EXPECT_DOUBLE_EQ(*mid.get<double>("onlyEarlier"), 4.0);
    EXPECT_EQ(mid.get<std::string>("onlyLater"), "yes");
}

TEST_F(TemporalStateTest, JsonUsesFlatSchema) {
    EntityState state = makeState(5.0f, "enemy_patrol");
    state.set("direction", int64_t{-1});
    state.set("isFrozen", false);

    nlohmann::json j = state;
    EXPECT_FLOAT_EQ(j["x"].get<float>(), 5.0f);
    EXPECT_EQ(j["animation"], "enemy_patrol");
    EXPECT_EQ(j["isAlive"], true);
    EXPECT_EQ(j["direction"], -1);
    EXPECT_EQ(j["isFrozen"], false);
    EXPECT_FALSE(j.contains("fields"));

    state.animation.reset();
    nlohmann::json noAnim = state;
    EXPECT_TRUE(noAnim["animation"].is_null());
}

TEST_F(TemporalStateTest, JsonRoundTripPreservesState) {
    EntityState state = makeState(5.5f, "platform");
    state.set("segmentCount", int64_t{3});
    state.set("width", 192.0);
    state.set("movementType", std::string("path"));
    state.set("isMoving", true);

    auto parsed = parseEntityState(nlohmann::json(state));
    ASSERT_TRUE(parsed.isOk()) << parsed.message();
    EXPECT_EQ(parsed.value(), state);
}

TEST_F(TemporalStateTest, ParseToleratesMissingOptionalFields) {
    auto json = nlohmann::json::parse(R"({
        "x": 1, "y": 2, "velocityX": 0, "velocityY": 0,
        "animation": null, "isAlive": true, "isVisible": true
    })");
    auto parsed = parseEntityState(json);
    ASSERT_TRUE(parsed.isOk());
    EXPECT_FLOAT_EQ(parsed.value().x, 1.0f);
    EXPECT_FALSE(parsed.value().animation.has_value());
    EXPECT_TRUE(parsed.value().fields.empty());
}

TEST_F(TemporalStateTest, ParseRejectsMissingCommonField) {
    auto json = nlohmann::json::parse(R"({"x": 1, "y": 2, "animation": null})");
    auto parsed = parseEntityState(json);
    ASSERT_TRUE(parsed.isError());
    EXPECT_EQ(parsed.code(), ErrorCode::MalformedState);

    auto notObject = parseEntityState(nlohmann::json::array());
    EXPECT_EQ(notObject.code(), ErrorCode::MalformedState);
}

TEST_F(TemporalStateTest, ParseRejectsWrongType) {
    auto json = nlohmann::json::parse(R"({
        "x": "left", "y": 2, "velocityX": 0, "velocityY": 0,
        "animation": null, "isAlive": true, "isVisible": true
    })");
    EXPECT_EQ(parseEntityState(json).code(), ErrorCode::MalformedState);
}
