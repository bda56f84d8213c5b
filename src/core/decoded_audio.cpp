#include "core/decoded_audio.hpp"
#include <algorithm>
#include <cmath>

namespace voxplay::core {

namespace {

// Header durations beyond this are treated as unknown.
constexpr double kMaxEstimateSeconds = 48.0 * 3600.0;
// Up-front reservation is capped; longer sources grow the buffer as they decode.
constexpr double kMaxReserveSeconds = 600.0;

double sanitize_estimate(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0 || seconds > kMaxEstimateSeconds) return 0.0;
    return seconds;
}

} // namespace

DecodedAudio::DecodedAudio(modules::PcmFormat format, double estimated_duration_sec)
    : format_(format), estimated_duration_sec_(sanitize_estimate(estimated_duration_sec)) {
    if (this->estimated_duration_sec_ > 0.0 && format.sample_rate > 0 && format.channels > 0) {
        double seconds = std::min(this->estimated_duration_sec_ * 1.05, kMaxReserveSeconds);
        this->samples_.reserve(static_cast<size_t>(seconds * format.sample_rate * format.channels));
    }
}

void DecodedAudio::append(const modules::PcmBlock& block) {
    if (block.samples.empty() || this->format_.channels <= 0) return;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (this->complete_.load(std::memory_order_relaxed)) return;
        this->samples_.insert(this->samples_.end(), block.samples.begin(), block.samples.end());
        this->frames_.store(static_cast<int64_t>(this->samples_.size()) / this->format_.channels,
                            std::memory_order_release);
    }
    this->cv_.notify_all();
}

void DecodedAudio::finish(std::optional<modules::MediaError> error) {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (this->complete_.load(std::memory_order_relaxed)) return;
        // Drop a trailing partial frame so sample_count stays a multiple of channels.
        if (this->format_.channels > 0) {
            this->samples_.resize(this->samples_.size() - this->samples_.size() % this->format_.channels);
        }
        this->samples_.shrink_to_fit();
        this->error_ = error;
        this->complete_.store(true, std::memory_order_release);
    }
    this->cv_.notify_all();
}

std::optional<modules::MediaError> DecodedAudio::decode_error() const {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->error_;
}

int64_t DecodedAudio::copy_frames(int64_t first_frame, int64_t max_frames, std::vector<int16_t>& out) const {
    if (first_frame < 0 || max_frames <= 0) return 0;
    const int channels = this->format_.channels;

    auto copy = [&]() -> int64_t {
        int64_t available = static_cast<int64_t>(this->samples_.size()) / channels;
        if (first_frame >= available) return 0;
        int64_t n = std::min(max_frames, available - first_frame);
        auto begin = this->samples_.begin() + first_frame * channels;
        out.insert(out.end(), begin, begin + n * channels);
        return n;
    };

    if (this->is_complete()) {
        return copy();
    }
    std::lock_guard<std::mutex> lock(this->mutex_);
    return copy();
}

bool DecodedAudio::wait_for_frames(int64_t frame, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(this->mutex_);
    return this->cv_.wait_for(lock, timeout, [&] {
        return this->complete_.load(std::memory_order_relaxed) || this->frames_.load(std::memory_order_relaxed) >= frame;
    });
}

bool DecodedAudio::wait_complete(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(this->mutex_);
    return this->cv_.wait_for(lock, timeout, [&] { return this->complete_.load(std::memory_order_relaxed); });
}

double DecodedAudio::duration_seconds() const {
    if (this->format_.sample_rate <= 0) return 0.0;
    double decoded = static_cast<double>(this->frames_available()) / this->format_.sample_rate;
    if (this->is_complete()) return decoded;
    return std::max(decoded, this->estimated_duration_sec_);
}

} // namespace voxplay::core
