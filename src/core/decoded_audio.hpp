#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include "modules/media_types.hpp"

namespace voxplay::core {

// Interleaved S16 PCM for one source, filled incrementally by the decode
// thread. While decoding, readers copy ranges under the lock; after
// finish() the buffer never changes and samples() may be read without
// locking from any thread.
class DecodedAudio {
public:
    DecodedAudio(modules::PcmFormat format, double estimated_duration_sec);

    DecodedAudio(const DecodedAudio&) = delete;
    DecodedAudio& operator=(const DecodedAudio&) = delete;

    const modules::PcmFormat& format() const { return this->format_; }

    // Decode thread only.
    void append(const modules::PcmBlock& block);
    // Marks the buffer complete; `error` records a truncated decode.
    void finish(std::optional<modules::MediaError> error);

    bool is_complete() const { return this->complete_.load(std::memory_order_acquire); }
    std::optional<modules::MediaError> decode_error() const;

    int64_t frames_available() const { return this->frames_.load(std::memory_order_acquire); }

    // Appends up to `max_frames` frames starting at `first_frame` to `out`.
    // Returns the number of frames copied.
    int64_t copy_frames(int64_t first_frame, int64_t max_frames, std::vector<int16_t>& out) const;

    // Waits until at least `frame` frames exist or decoding finished.
    // Returns true if the condition holds.
    bool wait_for_frames(int64_t frame, std::chrono::milliseconds timeout) const;
    bool wait_complete(std::chrono::milliseconds timeout) const;

    // Valid only once is_complete() is true.
    const std::vector<int16_t>& samples() const { return this->samples_; }

    // Header estimate while decoding, exact frame count afterwards.
    double duration_seconds() const;
    int64_t sample_count() const { return this->frames_available() * this->format_.channels; }

private:
    const modules::PcmFormat format_;
    const double estimated_duration_sec_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<int16_t> samples_;
    std::atomic<int64_t> frames_{0};
    std::atomic<bool> complete_{false};
    std::optional<modules::MediaError> error_;
};

} // namespace voxplay::core
