#include "oddity/core/TimeManager.hh"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace oddity;

namespace {

// Rewindable test double: one position and an animation key.
class Tracked : public TemporalObject {
  public:
    EntityState captureState() const override {
        ++captures;
        EntityState state;
        state.x = x;
        state.y = y;
        state.animation = animation;
        state.set("label", label);
        return state;
    }

    void applyState(const EntityState& state) override {
        x = state.x;
        y = state.y;
        animation = state.animation.value_or("");
        if (auto l = state.get<std::string>("label")) {
            label = *l;
        }
        ++applies;
    }

    void onRewindToggled(bool rewinding) override { toggles.push_back(rewinding); }

    float x = 0.0f;
    float y = 0.0f;
    std::string animation = "idle";
    std::string label = "tracked";
    mutable int captures = 0;
    int applies = 0;
    std::vector<bool> toggles;
};

// Unregisters another object when captured
class Saboteur : public Tracked {
  public:
    Saboteur(TimeManager& tm, TemporalObject& victim) : tm_(tm), victim_(victim) {}

    EntityState captureState() const override {
        tm_.unregisterObject(victim_);
        return Tracked::captureState();
    }

  private:
    TimeManager& tm_;
    TemporalObject& victim_;
};

// Unregisters itself when its state is applied
class SelfRemover : public Tracked {
  public:
    explicit SelfRemover(TimeManager& tm) : tm_(tm) {}

    void applyState(const EntityState& state) override {
        Tracked::applyState(state);
        tm_.unregisterObject(*this);
    }

  private:
    TimeManager& tm_;
};

// Calls back into the manager from inside the contract
class Reentrant : public Tracked {
  public:
    explicit Reentrant(TimeManager& tm) : tm_(tm) {}

    EntityState captureState() const override {
        tm_.toggleRewind(true);
        return Tracked::captureState();
    }

    void applyState(const EntityState& state) override {
        Tracked::applyState(state);
        tm_.update(0.0, 1000.0);
        tm_.toggleRewind(false);
    }

  private:
    TimeManager& tm_;
};

class ThrowingTracked : public Tracked {
  public:
    EntityState captureState() const override { throw std::runtime_error("capture failed"); }
};

} // namespace

class TimeManagerTest : public ::testing::Test {
  protected:
    // Record `values` for tracked.x at the given timestamps
    void recordAt(TimeManager& tm, Tracked& tracked, const std::vector<std::pair<double, float>>& samples) {
        double last = samples.empty() ? 0.0 : samples.front().first;
        for (const auto& [t, value] : samples) {
            tracked.x = value;
            tm.update(t, t - last);
            last = t;
        }
    }

    std::vector<double> timestamps(const TimeManager& tm) {
        std::vector<double> out;
        for (const auto& snapshot : tm.history().snapshots()) {
            out.push_back(snapshot.timestamp);
        }
        return out;
    }
};

// --- Registry ---

TEST_F(TimeManagerTest, RegisterIsIdempotent) {
    TimeManager tm;
    Tracked tracked;
    ObjectId first = tm.registerObject(tracked);
    ObjectId second = tm.registerObject(tracked);
    EXPECT_EQ(first, second);
    EXPECT_EQ(tm.objectCount(), 1u);
    EXPECT_TRUE(tm.isRegistered(tracked));
    EXPECT_EQ(tm.idOf(tracked), first);
}

TEST_F(TimeManagerTest, RegisterDoesNotCapture) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    EXPECT_EQ(tracked.captures, 0);
    EXPECT_TRUE(tm.history().empty());
}

TEST_F(TimeManagerTest, IdsAreNeverReused) {
    TimeManager tm;
    Tracked a;
    ObjectId idA = tm.registerObject(a);
    EXPECT_TRUE(tm.unregisterObject(a));
    EXPECT_FALSE(tm.unregisterObject(a));
    EXPECT_FALSE(tm.isRegistered(a));

    ObjectId idAgain = tm.registerObject(a);
    EXPECT_NE(idA, idAgain);
}

// --- Recording ---

TEST_F(TimeManagerTest, UpdateRecordsOneSnapshotPerFrame) {
    TimeManager tm;
    Tracked a;
    Tracked b;
    ObjectId idA = tm.registerObject(a);
    ObjectId idB = tm.registerObject(b);

    tm.update(0.0, 0.0);
    tm.update(16.0, 16.0);

    ASSERT_EQ(tm.history().size(), 2u);
    const auto& entries = tm.history().latest()->entries;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, idA);
    EXPECT_EQ(entries[1].id, idB);
}

TEST_F(TimeManagerTest, EmptyRegistryStillRecordsSnapshot) {
    TimeManager tm;
    tm.update(5.0, 5.0);
    ASSERT_EQ(tm.history().size(), 1u);
    EXPECT_TRUE(tm.history().latest()->entries.empty());
}

TEST_F(TimeManagerTest, HistoryBoundedByDuration) {
    TimeManager tm(TimeManagerConfig{1000.0, 0.0, 1.0});
    Tracked tracked;
    tm.registerObject(tracked);

    constexpr double kDelta = 16.0;
    double now = 0.0;
    while (now < 5000.0) {
        now += kDelta;
        tm.update(now, kDelta);
    }

    double oldest = tm.history().earliest()->timestamp;
    EXPECT_GE(oldest, now - 1000.0);
    EXPECT_LT(oldest, now - 1000.0 + kDelta);
}

TEST_F(TimeManagerTest, RecordIntervalThrottlesCapture) {
    TimeManager tm(TimeManagerConfig{10000.0, 50.0, 1.0});
    Tracked tracked;
    tm.registerObject(tracked);

    for (double t : {0.0, 16.0, 32.0, 48.0, 64.0, 80.0}) {
        tm.update(t, 16.0);
    }
    EXPECT_EQ(timestamps(tm), (std::vector<double>{0.0, 64.0}));
}

TEST_F(TimeManagerTest, PauseAndResumeRecording) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);

    tm.update(0.0, 0.0);
    tm.pauseRecording();
    EXPECT_TRUE(tm.isRecordingPaused());
    tm.update(16.0, 16.0);
    tm.update(32.0, 16.0);
    EXPECT_EQ(tm.history().size(), 1u);

    tm.resumeRecording();
    tm.update(48.0, 16.0);
    EXPECT_EQ(timestamps(tm), (std::vector<double>{0.0, 48.0}));
}

TEST_F(TimeManagerTest, ThrowingCaptureIsSkipped) {
    TimeManager tm;
    ThrowingTracked bad;
    Tracked good;
    tm.registerObject(bad);
    ObjectId goodId = tm.registerObject(good);

    EXPECT_NO_THROW(tm.update(0.0, 0.0));
    ASSERT_EQ(tm.history().size(), 1u);
    const auto& entries = tm.history().latest()->entries;
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].id, goodId);
}

TEST_F(TimeManagerTest, UnregisterDuringCaptureSkipsOnlyVictim) {
    TimeManager tm;
    Tracked victim;
    Tracked tail;
    Saboteur saboteur(tm, victim);
    ObjectId sabId = tm.registerObject(saboteur);
    tm.registerObject(victim);
    ObjectId tailId = tm.registerObject(tail);

    tm.update(0.0, 0.0);

    const auto& entries = tm.history().latest()->entries;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, sabId);
    EXPECT_EQ(entries[1].id, tailId);
    EXPECT_EQ(victim.captures, 0);
    EXPECT_EQ(tail.captures, 1);
    EXPECT_EQ(tm.objectCount(), 2u);
}

// --- Playback ---

TEST_F(TimeManagerTest, InterpolatesBetweenSnapshots) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    recordAt(tm, tracked, {{0.0, 0.0f}, {100.0, 100.0f}});

    tm.toggleRewind(true);
    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 100.0);
    tm.update(175.0, 75.0);

    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 25.0);
    EXPECT_FLOAT_EQ(tracked.x, 25.0f);
}

TEST_F(TimeManagerTest, DiscreteFieldsTakeNearerSnapshot) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);

    tracked.animation = "run";
    tracked.label = "old";
    tm.update(0.0, 0.0);
    tracked.animation = "jump";
    tracked.label = "new";
    tm.update(100.0, 100.0);

    tm.toggleRewind(true);
    tm.update(130.0, 30.0); // cursor 70, nearer to t=100
    EXPECT_EQ(tracked.animation, "jump");

    tm.update(150.0, 20.0); // cursor 50, tie favours the later snapshot
    EXPECT_EQ(tracked.animation, "jump");
    EXPECT_EQ(tracked.label, "new");

    tm.update(160.0, 10.0); // cursor 40, nearer to t=0
    EXPECT_EQ(tracked.animation, "run");
    EXPECT_EQ(tracked.label, "old");
}

TEST_F(TimeManagerTest, ClampsAtEarliestSnapshot) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    recordAt(tm, tracked, {{0.0, 10.0f}, {100.0, 100.0f}});

    tm.toggleRewind(true);
    tm.update(1100.0, 1000.0);
    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 0.0);
    EXPECT_FLOAT_EQ(tracked.x, 10.0f);

    // Idles at the horizon without error
    tracked.x = -1.0f;
    EXPECT_NO_THROW(tm.update(1200.0, 100.0));
    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 0.0);
    EXPECT_FLOAT_EQ(tracked.x, 10.0f);
    EXPECT_TRUE(tm.isRewinding());
}

TEST_F(TimeManagerTest, CursorDecreasesMonotonicallyThenHolds) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    for (int i = 0; i <= 10; ++i) {
        tracked.x = static_cast<float>(i);
        tm.update(i * 100.0, 100.0);
    }

    tm.toggleRewind(true);
    double previous = tm.playbackCursor();
    bool clamped = false;
    for (int frame = 0; frame < 60; ++frame) {
        tm.update(1000.0 + frame * 30.0, 30.0);
        double cursor = tm.playbackCursor();
        if (clamped) {
            EXPECT_DOUBLE_EQ(cursor, previous);
        } else if (cursor == 0.0) {
            clamped = true;
        } else {
            EXPECT_LT(cursor, previous);
        }
        previous = cursor;
    }
    EXPECT_TRUE(clamped);
}

TEST_F(TimeManagerTest, RewindSpeedScalesCursor) {
    TimeManager tm(TimeManagerConfig{10000.0, 0.0, 2.0});
    Tracked tracked;
    tm.registerObject(tracked);
    recordAt(tm, tracked, {{0.0, 0.0f}, {100.0, 100.0f}});

    tm.toggleRewind(true);
    tm.update(120.0, 20.0);
    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 60.0);
    EXPECT_FLOAT_EQ(tracked.x, 60.0f);
}

TEST_F(TimeManagerTest, EmptyHistoryRewindIsNoOp) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);

    tm.toggleRewind(true);
    EXPECT_NO_THROW(tm.update(16.0, 16.0));
    EXPECT_NO_THROW(tm.update(32.0, 16.0));
    EXPECT_EQ(tracked.applies, 0);
    EXPECT_TRUE(tm.history().empty());

    tm.toggleRewind(false);
    tm.update(48.0, 16.0);
    EXPECT_EQ(tm.history().size(), 1u);
}

TEST_F(TimeManagerTest, EnteringRewindLeavesBufferUntouched) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    recordAt(tm, tracked, {{0.0, 0.0f}, {10.0, 1.0f}, {20.0, 2.0f}});

    tm.toggleRewind(true);
    EXPECT_EQ(timestamps(tm), (std::vector<double>{0.0, 10.0, 20.0}));
    EXPECT_EQ(tracked.applies, 0);
}

TEST_F(TimeManagerTest, ResumeAfterRewindTruncatesFuture) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    recordAt(tm, tracked, {{0.0, 0.0f}, {1.0, 10.0f}, {2.0, 20.0f}, {3.0, 30.0f}, {4.0, 40.0f}});

    tm.toggleRewind(true);
    tm.update(6.0, 2.0);
    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 2.0);
    EXPECT_FLOAT_EQ(tracked.x, 20.0f);

    tm.toggleRewind(false);
    EXPECT_EQ(timestamps(tm), (std::vector<double>{0.0, 1.0, 2.0}));

    tracked.x = 25.0f;
    tm.update(2.5, 0.5);
    EXPECT_EQ(timestamps(tm), (std::vector<double>{0.0, 1.0, 2.0, 2.5}));
    EXPECT_FLOAT_EQ(tm.history().latest()->entries[0].state.x, 25.0f);
}

TEST_F(TimeManagerTest, ToggleRewindIsIdempotent) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    recordAt(tm, tracked, {{0.0, 0.0f}, {100.0, 100.0f}});

    tm.toggleRewind(true);
    tm.update(150.0, 50.0);
    tm.toggleRewind(true);
    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 50.0);
    EXPECT_EQ(tracked.toggles, (std::vector<bool>{true}));

    tm.toggleRewind(false);
    tm.toggleRewind(false);
    EXPECT_EQ(tm.mode(), TimeMode::Recording);
    EXPECT_EQ(tracked.toggles, (std::vector<bool>{true, false}));
}

TEST_F(TimeManagerTest, UnregisteredObjectSkippedDuringPlayback) {
    TimeManager tm;
    auto gone = std::make_unique<Tracked>();
    Tracked kept;
    tm.registerObject(*gone);
    tm.registerObject(kept);
    tm.update(0.0, 0.0);
    tm.update(100.0, 100.0);

    tm.unregisterObject(*gone);
    gone.reset();

    tm.toggleRewind(true);
    EXPECT_NO_THROW(tm.update(150.0, 50.0));
    EXPECT_EQ(kept.applies, 1);
}

TEST_F(TimeManagerTest, ObjectRegisteredMidHistoryOnlyRestoredWhereRecorded) {
    TimeManager tm;
    Tracked early;
    Tracked late;
    tm.registerObject(early);
    tm.update(0.0, 0.0);
    tm.registerObject(late);
    late.x = 50.0f;
    tm.update(100.0, 100.0);

    tm.toggleRewind(true);
    tm.update(150.0, 50.0);
    // Not present in both bracketing snapshots
    EXPECT_EQ(late.applies, 0);
    EXPECT_EQ(early.applies, 1);

    tm.update(250.0, 100.0);
    EXPECT_EQ(late.applies, 0);
}

TEST_F(TimeManagerTest, SelfUnregisterDuringApplyIsTolerated) {
    TimeManager tm;
    SelfRemover remover(tm);
    Tracked other;
    tm.registerObject(remover);
    tm.registerObject(other);
    recordAt(tm, other, {{0.0, 0.0f}, {100.0, 100.0f}});

    tm.toggleRewind(true);
    EXPECT_NO_THROW(tm.update(150.0, 50.0));
    EXPECT_EQ(remover.applies, 1);
    EXPECT_EQ(other.applies, 1);
    EXPECT_FALSE(tm.isRegistered(remover));
    EXPECT_EQ(tm.objectCount(), 1u);

    tm.update(175.0, 25.0);
    EXPECT_EQ(remover.applies, 1);
    EXPECT_EQ(other.applies, 2);
}

TEST_F(TimeManagerTest, ReentrantCallsAreIgnored) {
    TimeManager tm;
    Reentrant reentrant(tm);
    tm.registerObject(reentrant);

    tm.update(0.0, 0.0);
    EXPECT_FALSE(tm.isRewinding());
    reentrant.x = 100.0f;
    tm.update(100.0, 100.0);
    EXPECT_EQ(tm.history().size(), 2u);

    tm.toggleRewind(true);
    tm.update(150.0, 50.0);
    EXPECT_TRUE(tm.isRewinding());
    EXPECT_DOUBLE_EQ(tm.playbackCursor(), 50.0);
    EXPECT_FLOAT_EQ(reentrant.x, 50.0f);
}

TEST_F(TimeManagerTest, ClearHistoryKeepsRegistry) {
    TimeManager tm;
    Tracked tracked;
    tm.registerObject(tracked);
    tm.update(0.0, 0.0);
    tm.update(16.0, 16.0);

    tm.clearHistory();
    EXPECT_TRUE(tm.history().empty());
    EXPECT_EQ(tm.objectCount(), 1u);
}

TEST_F(TimeManagerTest, HistoryToJsonDumpsEntries) {
    TimeManager tm;
    Tracked tracked;
    ObjectId id = tm.registerObject(tracked);
    tracked.x = 12.0f;
    tm.update(0.0, 0.0);

    auto dump = tm.historyToJson();
    ASSERT_TRUE(dump.is_array());
    ASSERT_EQ(dump.size(), 1u);
    EXPECT_DOUBLE_EQ(dump[0]["timestamp"].get<double>(), 0.0);
    ASSERT_EQ(dump[0]["entries"].size(), 1u);
    EXPECT_EQ(dump[0]["entries"][0]["id"].get<ObjectId>(), id);
    EXPECT_FLOAT_EQ(dump[0]["entries"][0]["state"]["x"].get<float>(), 12.0f);
    EXPECT_EQ(dump[0]["entries"][0]["state"]["label"].get<std::string>(), "tracked");
}
