#pragma once

#include "oddity/core/TemporalState.hh"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace oddity {

struct SnapshotEntry {
    ObjectId id = 0;
    EntityState state;
};

/// One timestamped set of per-object states captured in a single frame.
/// Entries keep registry order at capture time.
struct Snapshot {
    double timestamp = 0.0;
    std::vector<SnapshotEntry> entries;

    const SnapshotEntry* find(ObjectId id) const;
};

/// The two snapshots around a playback cursor.
/// `earlier == later` when the cursor sits exactly on a snapshot or outside
/// the recorded range; `fraction` is then 1.
struct SnapshotBracket {
    const Snapshot* earlier = nullptr;
    const Snapshot* later = nullptr;
    double fraction = 1.0;

    bool isExact() const { return earlier == later; }
};

/**
 * @brief Time-ordered snapshot history bounded by duration
 *
 * Timestamps are non-decreasing. The bound is a duration, not a count: the
 * frame delta varies, so trimming drops every snapshot older than
 * `newest - maxDuration`.
 */
class HistoryBuffer {
  public:
    explicit HistoryBuffer(double maxDurationMs);

    /// Append a snapshot. A snapshot with the same timestamp as the newest one
    /// replaces it; an older timestamp is rejected (returns false).
    bool push(Snapshot snapshot);

    /// Drop snapshots from the front whose timestamp is older than `horizon`.
    /// Returns the number removed.
    size_t trimOlderThan(double horizon);

    /// Drop every snapshot newer than `timestamp`. Returns the number removed.
    size_t truncateAfter(double timestamp);

    /// Locate the snapshots bracketing `cursor`. Cursors before the earliest
    /// snapshot clamp to it, cursors past the newest clamp to the newest.
    /// std::nullopt only when the buffer is empty.
    std::optional<SnapshotBracket> bracket(double cursor) const;

    const Snapshot* earliest() const;
    const Snapshot* latest() const;
    const Snapshot& at(size_t index) const;

    size_t size() const;
    bool empty() const;
    void clear();

    double maxDuration() const;
    void setMaxDuration(double maxDurationMs);

    /// Timestamp span covered by the buffer (newest - earliest).
    double span() const;

    const std::deque<Snapshot>& snapshots() const;

  private:
    std::deque<Snapshot> snapshots_;
    double maxDurationMs_;
};

} // namespace oddity
