#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "core/decoded_audio.hpp"
#include "core/player_types.hpp"
#include "modules/audio_output.hpp"
#include "modules/config_module.hpp"
#include "modules/media_types.hpp"
#include "modules/sample_converter.hpp"
#include "modules/source_loader.hpp"
#include "utils/ring_buffer.hpp"

namespace voxplay::core {

// Transport state machine for a single source.
//
// Threads: the caller (transport calls, position polling), a decode thread
// filling DecodedAudio, a feeder thread converting decoded frames into the
// device format ahead of playback, and the output device thread whose
// render callback only pops from a lock-free ring.
//
// State and position are written only by this class. Transport calls are
// serialized by control_mutex_; position() takes a short-lived lock that
// transport calls never hold across device or thread operations.
class PlaybackEngine {
public:
    PlaybackEngine(modules::OutputFactory output_factory, modules::AudioOutputConfig output_config,
                   modules::PlaybackConfig config);
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    // Cancels the previous session, then decodes until the prebuffer is
    // full. Errors leave the engine in Errored.
    std::expected<void, modules::MediaError> load(std::shared_ptr<const modules::Source> source);

    // Ready/Paused/Stopped -> Playing. Acquires the output device on first
    // use; device errors are returned here and leave the engine Errored.
    std::expected<void, modules::MediaError> play();
    void pause();
    // Clamped to [0, duration]. Ignored outside Ready/Playing/Paused.
    void seek(double seconds);
    // Releases the output device; position returns to 0.
    void stop();
    // Stops and drops the session entirely (Idle).
    void unload();

    double position() const;
    double duration() const;
    PlaybackState state() const { return this->state_.load(std::memory_order_acquire); }
    bool is_at_end() const { return this->at_end_.load(); }
    std::optional<modules::MediaError> last_error() const;
    uint64_t underrun_count() const { return this->underruns_.load(std::memory_order_relaxed); }

    void set_volume(int volume);
    int volume() const { return this->volume_.load(std::memory_order_relaxed); }

    std::shared_ptr<const DecodedAudio> decoded_audio() const;
    std::optional<modules::AudioFormat> source_format() const;
    modules::PcmFormat device_format() const;

private:
    enum class FeedResult { Progress, Starved, Full, Drained };
    enum class FinishReason { EndOfMedia, DeviceLost };

    // All *_locked helpers require control_mutex_.
    void release_session_locked();
    void halt_feed_locked();
    void release_output_locked();
    std::expected<void, modules::MediaError> acquire_output_locked();
    std::expected<void, modules::MediaError> start_feed_locked();
    void reanchor_locked(double seconds);
    void fail_locked(modules::MediaError error);

    void decode_loop(std::unique_ptr<modules::AudioDecoder> decoder, std::shared_ptr<DecodedAudio> audio,
                     std::shared_ptr<std::atomic<bool>> cancel);
    void feeder_loop(std::shared_ptr<DecodedAudio> audio);
    FeedResult feed_step(const DecodedAudio& audio, std::vector<int16_t>& src, std::vector<int16_t>& dst);
    bool try_finish_playback(FinishReason reason);
    int64_t unplayed_device_frames() const;

    // Output device thread. Bounded time, no allocation, no locks.
    void render(int16_t* out, size_t frames);

    modules::OutputFactory output_factory_;
    modules::AudioOutputConfig output_config_;
    modules::PlaybackConfig config_;
    modules::SourceLoader loader_;

    std::mutex control_mutex_;
    std::atomic<PlaybackState> state_{PlaybackState::Idle};
    std::atomic<bool> at_end_{false};

    // Session; pointer swaps guarded by status_mutex_ for readers.
    mutable std::mutex status_mutex_;
    std::shared_ptr<DecodedAudio> audio_;
    std::optional<modules::AudioFormat> format_;
    std::optional<modules::MediaError> last_error_;
    std::thread decode_thread_;
    std::shared_ptr<std::atomic<bool>> decode_cancel_;

    // Output side. output_/ring_ only change while the device thread and
    // feeder are stopped; position_mutex_ guards them for position().
    std::unique_ptr<modules::AudioOutput> output_;
    std::unique_ptr<utils::RingBufferI16> ring_;
    modules::PcmFormat device_format_;
    std::thread feeder_thread_;
    std::atomic<bool> feeder_stop_{false};

    // Feed cursor, in source frames.
    std::mutex feed_mutex_;
    modules::SampleConverter converter_;
    int64_t feed_frame_ = 0;
    std::atomic<bool> drained_{false};

    // Position anchor: playback was at anchor_sec_ when the ring's write
    // index was anchor_index_.
    mutable std::mutex position_mutex_;
    double anchor_sec_ = 0.0;
    size_t anchor_index_ = 0;
    mutable double last_reported_ = 0.0;
    std::atomic<size_t> discard_before_{0};

    std::atomic<int> volume_{100};
    std::atomic<uint64_t> underruns_{0};
    std::atomic<int64_t> trailing_silence_{0};
};

} // namespace voxplay::core
