#include "oddity/core/TimeManager.hh"
#include "oddity/core/Log.hh"

#include <algorithm>
#include <cassert>
#include <exception>

namespace oddity {

namespace {

// Clears the dispatch flag on every exit path of update()/toggleRewind().
class DispatchScope {
  public:
    explicit DispatchScope(bool& flag) : flag_(flag) { flag_ = true; }
    ~DispatchScope() { flag_ = false; }

    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

  private:
    bool& flag_;
};

} // namespace

TimeManager::TimeManager(TimeManagerConfig config) : config_(config), history_(config.maxHistoryMs) {
    ODDITY_TEMPORAL_DEBUG("TimeManager initialized (history={}ms, interval={}ms, rewindSpeed={})",
                          config_.maxHistoryMs, config_.recordIntervalMs, config_.rewindSpeed);
}

TimeManager::~TimeManager() {
    ODDITY_TEMPORAL_DEBUG("TimeManager destroyed ({} objects still registered, {} snapshots)", objects_.size(),
                          history_.size());
}

// --- Registry ---

ObjectId TimeManager::registerObject(TemporalObject& object) {
    auto it = ids_.find(&object);
    if (it != ids_.end()) {
        return it->second;
    }

    ObjectId id = nextId_++;
    ids_.emplace(&object, id);
    objects_.emplace(id, &object);
    order_.push_back(id);
    ODDITY_TEMPORAL_DEBUG("Registered object #{} (total={})", id, objects_.size());
    return id;
}

bool TimeManager::unregisterObject(const TemporalObject& object) {
    auto it = ids_.find(&object);
    if (it == ids_.end()) {
        return false;
    }

    ObjectId id = it->second;
    objects_.erase(id);
    ids_.erase(it);
    ++staleOrderEntries_;
    if (!dispatching_) {
        compactOrder();
    }
    ODDITY_TEMPORAL_DEBUG("Unregistered object #{} (remaining={})", id, objects_.size());
    return true;
}

bool TimeManager::isRegistered(const TemporalObject& object) const {
    return ids_.find(&object) != ids_.end();
}

std::optional<ObjectId> TimeManager::idOf(const TemporalObject& object) const {
    auto it = ids_.find(&object);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t TimeManager::objectCount() const {
    return objects_.size();
}

std::vector<TimeManager::Registration> TimeManager::liveObjects() const {
    std::vector<Registration> result;
    result.reserve(objects_.size());
    for (ObjectId id : order_) {
        auto it = objects_.find(id);
        if (it != objects_.end()) {
            result.push_back(Registration{id, it->second});
        }
    }
    return result;
}

TemporalObject* TimeManager::lookup(ObjectId id) const {
    auto it = objects_.find(id);
    return it == objects_.end() ? nullptr : it->second;
}

void TimeManager::compactOrder() {
    if (staleOrderEntries_ == 0) {
        return;
    }
    std::erase_if(order_, [this](ObjectId id) { return objects_.find(id) == objects_.end(); });
    staleOrderEntries_ = 0;
}

bool TimeManager::rejectReentrant(const char* operation) const {
    if (!dispatching_) {
        return false;
    }
    ODDITY_TEMPORAL_ERROR("{} called from inside an object callback; ignored", operation);
    return true;
}

// --- Mode control ---

void TimeManager::toggleRewind(bool enable) {
    if (rejectReentrant("toggleRewind")) {
        return;
    }
    if (isRewinding() == enable) {
        return;
    }

    if (enable) {
        playbackCursor_ = history_.empty() ? 0.0 : history_.latest()->timestamp;
        mode_ = TimeMode::Rewinding;
        ODDITY_TEMPORAL_INFO("Rewind started at t={} ({} snapshots buffered)", playbackCursor_, history_.size());
    } else {
        size_t dropped = history_.truncateAfter(playbackCursor_);
        mode_ = TimeMode::Recording;
        hasRecorded_ = false;
        ODDITY_TEMPORAL_INFO("Rewind stopped at t={} ({} future snapshots dropped, {} kept)", playbackCursor_,
                             dropped, history_.size());
    }

    DispatchScope scope(dispatching_);
    notifyRewindToggled(enable);
}

bool TimeManager::isRewinding() const {
    return mode_ == TimeMode::Rewinding;
}

TimeMode TimeManager::mode() const {
    return mode_;
}

void TimeManager::update(double now, double deltaMs) {
    if (rejectReentrant("update")) {
        return;
    }

    {
        DispatchScope scope(dispatching_);
        if (mode_ == TimeMode::Rewinding) {
            playback(deltaMs);
        } else {
            record(now);
        }
    }
    compactOrder();
}

// --- Recording ---

void TimeManager::record(double now) {
    if (recordingPaused_) {
        return;
    }
    if (config_.recordIntervalMs > 0.0 && hasRecorded_ && now - lastRecordTime_ < config_.recordIntervalMs) {
        return;
    }

    Snapshot snapshot;
    snapshot.timestamp = now;
    snapshot.entries.reserve(objects_.size());

    for (const auto& reg : liveObjects()) {
        // An earlier capture may have unregistered (and destroyed) this object
        TemporalObject* object = lookup(reg.id);
        if (!object) {
            continue;
        }
        try {
            EntityState state = object->captureState();
            assert(isWellFormed(state) && "captureState() produced non-finite values");
            if (!isWellFormed(state)) {
                ODDITY_TEMPORAL_ERROR("Object #{} produced a malformed state; entry skipped", reg.id);
                continue;
            }
            snapshot.entries.push_back(SnapshotEntry{reg.id, std::move(state)});
        } catch (const std::exception& e) {
            ODDITY_TEMPORAL_WARN("Error recording state for object #{}: {}", reg.id, e.what());
        }
    }

    if (!history_.push(std::move(snapshot))) {
        return;
    }
    lastRecordTime_ = now;
    hasRecorded_ = true;

    size_t trimmed = history_.trimOlderThan(now - history_.maxDuration());
    if (trimmed > 0) {
        ODDITY_TEMPORAL_DEBUG("Trimmed {} snapshots older than t={}", trimmed, now - history_.maxDuration());
    }
}

// --- Playback ---

void TimeManager::playback(double deltaMs) {
    if (history_.empty()) {
        return;
    }

    double horizon = history_.earliest()->timestamp;
    if (playbackCursor_ > horizon) {
        playbackCursor_ = std::max(horizon, playbackCursor_ - deltaMs * config_.rewindSpeed);
        if (playbackCursor_ == horizon) {
            ODDITY_TEMPORAL_DEBUG("Rewind reached recorded horizon t={}", horizon);
        }
    } else {
        playbackCursor_ = horizon;
    }

    auto bracket = history_.bracket(playbackCursor_);
    if (!bracket) {
        return;
    }
    applyBracket(*bracket);
}

void TimeManager::applyBracket(const SnapshotBracket& bracket) {
    if (bracket.isExact()) {
        for (const auto& entry : bracket.later->entries) {
            applyTo(entry.id, entry.state);
        }
        return;
    }

    const auto& earlierEntries = bracket.earlier->entries;
    std::unordered_map<ObjectId, const EntityState*> earlierById;
    earlierById.reserve(earlierEntries.size());
    for (const auto& entry : earlierEntries) {
        earlierById.emplace(entry.id, &entry.state);
    }

    for (const auto& entry : bracket.later->entries) {
        auto it = earlierById.find(entry.id);
        if (it == earlierById.end()) {
            continue;
        }
        applyTo(entry.id, interpolateState(*it->second, entry.state, bracket.fraction));
    }
}

void TimeManager::applyTo(ObjectId id, const EntityState& state) {
    // Destroyed or unregistered objects are skipped
    TemporalObject* object = lookup(id);
    if (!object) {
        return;
    }
    try {
        object->applyState(state);
    } catch (const std::exception& e) {
        ODDITY_TEMPORAL_WARN("Error restoring state for object #{}: {}", id, e.what());
    }
}

void TimeManager::notifyRewindToggled(bool rewinding) {
    for (const auto& reg : liveObjects()) {
        TemporalObject* object = lookup(reg.id);
        if (!object) {
            continue;
        }
        try {
            object->onRewindToggled(rewinding);
        } catch (const std::exception& e) {
            ODDITY_TEMPORAL_WARN("Error notifying object #{} of rewind toggle: {}", reg.id, e.what());
        }
    }
}

// --- Recording control ---

void TimeManager::pauseRecording() {
    recordingPaused_ = true;
    ODDITY_TEMPORAL_DEBUG("Recording paused");
}

void TimeManager::resumeRecording() {
    recordingPaused_ = false;
    ODDITY_TEMPORAL_DEBUG("Recording resumed");
}

bool TimeManager::isRecordingPaused() const {
    return recordingPaused_;
}

void TimeManager::clearHistory() {
    history_.clear();
    playbackCursor_ = 0.0;
    hasRecorded_ = false;
    ODDITY_TEMPORAL_DEBUG("History cleared");
}

// --- Introspection ---

double TimeManager::playbackCursor() const {
    return playbackCursor_;
}

const HistoryBuffer& TimeManager::history() const {
    return history_;
}

const TimeManagerConfig& TimeManager::config() const {
    return config_;
}

nlohmann::json TimeManager::historyToJson() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& snapshot : history_.snapshots()) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : snapshot.entries) {
            entries.push_back(nlohmann::json{{"id", entry.id}, {"state", entry.state}});
        }
        out.push_back(nlohmann::json{{"timestamp", snapshot.timestamp}, {"entries", std::move(entries)}});
    }
    return out;
}

} // namespace oddity
