#include "core/sync_controller.hpp"
#include <algorithm>
#include <iostream>

namespace voxplay::core {

SyncController::SyncController(PlaybackEngine& playback, TranscriptionEngine& transcription)
    : playback_(playback), transcription_(transcription) {
    this->listener_id_ = this->transcription_.add_listener(
        [this](TranscriptionState state) { this->on_transcription_finished(state); });
}

SyncController::~SyncController() {
    this->transcription_.remove_listener(this->listener_id_);
}

std::optional<size_t> SyncController::find_segment(const Transcript& segments, double position) {
    // First segment starting after `position`; the candidate is the one before it.
    auto it = std::upper_bound(segments.begin(), segments.end(), position,
                               [](double pos, const TranscriptSegment& seg) { return pos < seg.start; });
    if (it == segments.begin()) return std::nullopt;
    --it;
    if (position >= it->start && position < it->end) {
        return static_cast<size_t>(it - segments.begin());
    }
    return std::nullopt;
}

std::shared_ptr<const Transcript> SyncController::installed() const {
    if (this->transcription_.state() != TranscriptionState::Complete) return nullptr;
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (!this->segments_) {
        // Cached result from before this controller saw the completion.
        this->segments_ = this->transcription_.transcript();
    }
    return this->segments_;
}

std::optional<size_t> SyncController::active_index(double position) const {
    auto segments = this->installed();
    if (!segments) return std::nullopt;
    return find_segment(*segments, position);
}

std::optional<TranscriptSegment> SyncController::active_segment(double position) const {
    auto segments = this->installed();
    if (!segments) return std::nullopt;
    auto index = find_segment(*segments, position);
    if (!index) return std::nullopt;
    return (*segments)[*index];
}

std::optional<size_t> SyncController::current_index() const {
    int64_t index = this->current_index_.load(std::memory_order_acquire);
    if (index < 0) return std::nullopt;
    return static_cast<size_t>(index);
}

std::optional<TranscriptSegment> SyncController::current_segment() const {
    auto index = this->current_index();
    auto segments = this->segments();
    if (!index || !segments || *index >= segments->size()) return std::nullopt;
    return (*segments)[*index];
}

void SyncController::refresh() {
    auto index = this->active_index(this->playback_.position());
    this->current_index_.store(index ? static_cast<int64_t>(*index) : -1, std::memory_order_release);
}

bool SyncController::on_segment_activated(const TranscriptSegment& segment) {
    if (!this->installed()) return false;
    PlaybackState state = this->playback_.state();
    if (state != PlaybackState::Ready && state != PlaybackState::Playing && state != PlaybackState::Paused) {
        return false;
    }
    this->playback_.seek(segment.start);
    this->refresh();
    return true;
}

bool SyncController::activate_index(size_t index) {
    auto segments = this->installed();
    if (!segments || index >= segments->size()) return false;
    return this->on_segment_activated((*segments)[index]);
}

std::shared_ptr<const Transcript> SyncController::segments() const {
    return this->installed();
}

void SyncController::reset() {
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->segments_.reset();
    this->current_index_.store(-1, std::memory_order_release);
}

void SyncController::on_transcription_finished(TranscriptionState state) {
    if (state != TranscriptionState::Complete) {
        this->current_index_.store(-1, std::memory_order_release);
        return;
    }
    auto segments = this->transcription_.transcript();
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->segments_ = segments;
    }
    // Playback may already be past the first words; do not wait for the
    // next tick to show the active one.
    this->refresh();
    std::cout << "[Sync] Installed " << (segments ? segments->size() : 0) << " segments\n";
}

} // namespace voxplay::core
