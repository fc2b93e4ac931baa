#pragma once

#include "oddity/core/HistoryBuffer.hh"
#include "oddity/core/TemporalState.hh"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oddity {

struct TimeManagerConfig {
    double maxHistoryMs = 10000.0;  // history window, in game-clock milliseconds
    double recordIntervalMs = 0.0;  // 0 records every frame
    double rewindSpeed = 1.0;       // playback cursor moves delta * rewindSpeed per frame
};

enum class TimeMode : uint8_t {
    Recording,
    Rewinding
};

/**
 * @brief Central recorder and player for rewindable objects
 *
 * Owns the registry and the history buffer. Driven once per frame through
 * update(). In Recording mode every registered object is captured into a
 * new snapshot; in Rewinding mode a playback cursor walks backwards through
 * the buffer and interpolated states are pushed back into the objects.
 *
 * Single-threaded. Objects must not call update() or toggleRewind() from
 * inside captureState()/applyState().
 */
class TimeManager {
  public:
    explicit TimeManager(TimeManagerConfig config = {});
    ~TimeManager();

    TimeManager(const TimeManager&) = delete;
    TimeManager& operator=(const TimeManager&) = delete;

    // --- Registry ---

    /// Add an object. Returns its id; registering twice returns the same id.
    /// The first capture happens on the next recording update.
    ObjectId registerObject(TemporalObject& object);

    /// Remove an object. History entries referring to it stay in the buffer
    /// and are skipped during playback. Returns false if it was not registered.
    bool unregisterObject(const TemporalObject& object);

    bool isRegistered(const TemporalObject& object) const;
    std::optional<ObjectId> idOf(const TemporalObject& object) const;
    size_t objectCount() const;

    // --- Mode control ---

    /// Enter or leave rewind mode. Repeated calls with the same value are no-ops.
    /// Leaving rewind drops every snapshot newer than the playback cursor.
    void toggleRewind(bool enable);

    bool isRewinding() const;
    TimeMode mode() const;

    /// Per-frame entry point. `now` and `deltaMs` come from the game clock.
    void update(double now, double deltaMs);

    // --- Recording control ---

    void pauseRecording();
    void resumeRecording();
    bool isRecordingPaused() const;

    /// Drop all history (scene teardown). The registry is kept.
    void clearHistory();

    // --- Introspection ---

    double playbackCursor() const;
    const HistoryBuffer& history() const;
    const TimeManagerConfig& config() const;

    /// Debug dump: [{timestamp, entries: [{id, state}]}]
    nlohmann::json historyToJson() const;

  private:
    struct Registration {
        ObjectId id;
        TemporalObject* object;
    };

    void record(double now);
    void playback(double deltaMs);
    void applyBracket(const SnapshotBracket& bracket);
    void applyTo(ObjectId id, const EntityState& state);

    // Defensive copy of the live registry in registration order.
    std::vector<Registration> liveObjects() const;
    TemporalObject* lookup(ObjectId id) const;
    void compactOrder();
    void notifyRewindToggled(bool rewinding);
    bool rejectReentrant(const char* operation) const;

    TimeManagerConfig config_;
    HistoryBuffer history_;
    TimeMode mode_ = TimeMode::Recording;
    double playbackCursor_ = 0.0;

    bool recordingPaused_ = false;
    bool hasRecorded_ = false;
    double lastRecordTime_ = 0.0;

    // Registry: O(1) add/remove, ordered iteration through order_ with
    // lazy removal of ids that are no longer in objects_.
    ObjectId nextId_ = 1;
    std::vector<ObjectId> order_;
    std::unordered_map<ObjectId, TemporalObject*> objects_;
    std::unordered_map<const TemporalObject*, ObjectId> ids_;
    size_t staleOrderEntries_ = 0;

    // Set while objects are being called back (update, rewind notifications)
    bool dispatching_ = false;
};

} // namespace oddity
