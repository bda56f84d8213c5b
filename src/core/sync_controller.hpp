#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include "core/playback_engine.hpp"
#include "core/player_types.hpp"
#include "core/transcription_engine.hpp"

namespace voxplay::core {

// Binds transcript segments to playback position. Lookups are a no-op
// until transcription is Complete; completion installs the segments and
// immediately recomputes the active one for the current position.
class SyncController {
public:
    SyncController(PlaybackEngine& playback, TranscriptionEngine& transcription);
    ~SyncController();

    SyncController(const SyncController&) = delete;
    SyncController& operator=(const SyncController&) = delete;

    // Index of the segment whose [start, end) contains `position`.
    static std::optional<size_t> find_segment(const Transcript& segments, double position);

    std::optional<size_t> active_index(double position) const;
    std::optional<TranscriptSegment> active_segment(double position) const;

    // Snapshot from the last refresh(); lock-free.
    std::optional<size_t> current_index() const;
    std::optional<TranscriptSegment> current_segment() const;

    // Recomputes the snapshot for the engine's current position. Call once
    // per render tick.
    void refresh();

    // Seeks to the segment start. Returns false (and does nothing) unless
    // transcription is Complete and playback is Ready, Playing or Paused.
    bool on_segment_activated(const TranscriptSegment& segment);
    bool activate_index(size_t index);

    // Installed segments, or nullptr before completion.
    std::shared_ptr<const Transcript> segments() const;

    // Drops installed segments; used when a new source loads.
    void reset();

private:
    void on_transcription_finished(TranscriptionState state);
    std::shared_ptr<const Transcript> installed() const;

    PlaybackEngine& playback_;
    TranscriptionEngine& transcription_;

    mutable std::mutex mutex_;
    mutable std::shared_ptr<const Transcript> segments_;
    std::atomic<int64_t> current_index_{-1};
    size_t listener_id_ = 0;
};

} // namespace voxplay::core
