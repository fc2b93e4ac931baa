#include "oddity/core/HistoryBuffer.hh"
#include "oddity/core/Log.hh"
#include "oddity/utils/ErrorHandling.hh"

#include <algorithm>

namespace oddity {

const SnapshotEntry* Snapshot::find(ObjectId id) const {
    for (const auto& entry : entries) {
        if (entry.id == id)
            return &entry;
    }
    return nullptr;
}

HistoryBuffer::HistoryBuffer(double maxDurationMs) : maxDurationMs_(maxDurationMs) {}

bool HistoryBuffer::push(Snapshot snapshot) {
    if (!snapshots_.empty()) {
        double newest = snapshots_.back().timestamp;
        if (snapshot.timestamp < newest) {
            ODDITY_TEMPORAL_WARN("Snapshot at t={} rejected: older than newest t={}", snapshot.timestamp, newest);
            return false;
        }
        if (snapshot.timestamp == newest) {
            snapshots_.back() = std::move(snapshot);
            return true;
        }
    }
    snapshots_.push_back(std::move(snapshot));
    return true;
}

size_t HistoryBuffer::trimOlderThan(double horizon) {
    size_t removed = 0;
    while (!snapshots_.empty() && snapshots_.front().timestamp < horizon) {
        snapshots_.pop_front();
        ++removed;
    }
    return removed;
}

size_t HistoryBuffer::truncateAfter(double timestamp) {
    size_t removed = 0;
    while (!snapshots_.empty() && snapshots_.back().timestamp > timestamp) {
        snapshots_.pop_back();
        ++removed;
    }
    return removed;
}

std::optional<SnapshotBracket> HistoryBuffer::bracket(double cursor) const {
    if (snapshots_.empty()) {
        return std::nullopt;
    }

    auto it = std::lower_bound(snapshots_.begin(), snapshots_.end(), cursor,
                               [](const Snapshot& s, double t) { return s.timestamp < t; });

    SnapshotBracket result;
    if (it == snapshots_.end()) {
        result.earlier = result.later = &snapshots_.back();
        return result;
    }
    if (it == snapshots_.begin() || it->timestamp == cursor) {
        result.earlier = result.later = &*it;
        return result;
    }

    const Snapshot& later = *it;
    const Snapshot& earlier = *(it - 1);
    double span = later.timestamp - earlier.timestamp;

    result.earlier = &earlier;
    result.later = &later;
    result.fraction = span > 0.0 ? (cursor - earlier.timestamp) / span : 1.0;
    return result;
}

const Snapshot* HistoryBuffer::earliest() const {
    return snapshots_.empty() ? nullptr : &snapshots_.front();
}

const Snapshot* HistoryBuffer::latest() const {
    return snapshots_.empty() ? nullptr : &snapshots_.back();
}

const Snapshot& HistoryBuffer::at(size_t index) const {
    if (index >= snapshots_.size()) {
        throwError("HistoryBuffer::at: index " + std::to_string(index) + " out of range (size " +
                   std::to_string(snapshots_.size()) + ")");
    }
    return snapshots_[index];
}

size_t HistoryBuffer::size() const {
    return snapshots_.size();
}

bool HistoryBuffer::empty() const {
    return snapshots_.empty();
}

void HistoryBuffer::clear() {
    snapshots_.clear();
}

double HistoryBuffer::maxDuration() const {
    return maxDurationMs_;
}

void HistoryBuffer::setMaxDuration(double maxDurationMs) {
    maxDurationMs_ = maxDurationMs;
}

double HistoryBuffer::span() const {
    if (snapshots_.size() < 2) {
        return 0.0;
    }
    return snapshots_.back().timestamp - snapshots_.front().timestamp;
}

const std::deque<Snapshot>& HistoryBuffer::snapshots() const {
    return snapshots_;
}

} // namespace oddity
