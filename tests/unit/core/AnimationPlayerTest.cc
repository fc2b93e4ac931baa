#include "oddity/core/AnimationPlayer.hh"
#include "oddity/utils/ErrorHandling.hh"

#include <gtest/gtest.h>

using namespace oddity;

class AnimationPlayerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        player.addClip("walk", {10.0f, 4, true});
        player.addClip("hit", {10.0f, 3, false});
    }

    AnimationPlayer player;
};

TEST_F(AnimationPlayerTest, NothingPlayingInitially) {
    EXPECT_FALSE(player.isPlaying());
    EXPECT_FALSE(player.currentKey().has_value());
    EXPECT_EQ(player.clipCount(), 2u);
    EXPECT_TRUE(player.hasClip("walk"));
    EXPECT_FALSE(player.hasClip("swim"));
}

TEST_F(AnimationPlayerTest, PlayUnknownKeyThrows) {
    EXPECT_THROW(player.play("swim"), OddityException);
    EXPECT_FALSE(player.currentKey().has_value());
}

TEST_F(AnimationPlayerTest, LoopingClipWraps) {
    player.play("walk");
    player.update(250.0f); // 2.5 frames
    EXPECT_EQ(player.currentFrame(), 2u);
    player.update(200.0f); // 4.5 frames total
    EXPECT_EQ(player.currentFrame(), 0u);
    EXPECT_TRUE(player.isPlaying());
}

TEST_F(AnimationPlayerTest, OneShotClipStopsOnLastFrame) {
    player.play("hit");
    player.update(1000.0f);
    EXPECT_EQ(player.currentFrame(), 2u);
    EXPECT_FALSE(player.isPlaying());
    EXPECT_EQ(player.currentKey(), "hit");
}

TEST_F(AnimationPlayerTest, IgnoreIfPlayingKeepsFrame) {
    player.play("walk");
    player.update(250.0f);
    player.play("walk", true);
    EXPECT_EQ(player.currentFrame(), 2u);

    player.play("walk", false);
    EXPECT_EQ(player.currentFrame(), 0u);
}

TEST_F(AnimationPlayerTest, StopKeepsKey) {
    player.play("walk");
    player.stop();
    EXPECT_FALSE(player.isPlaying());
    EXPECT_EQ(player.currentKey(), "walk");

    player.update(500.0f);
    EXPECT_EQ(player.currentFrame(), 0u);
}
