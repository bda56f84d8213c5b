#pragma once

#include <alsa/asoundlib.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "modules/audio_output.hpp"
#include "modules/config_module.hpp"

namespace voxplay::modules {

// ALSA playback stream driven by its own thread. Each period the thread
// pulls one block through the render callback and writes it with
// snd_pcm_writei, recovering from underruns and suspends in place.
class AlsaOutput : public AudioOutput {
public:
    explicit AlsaOutput(AudioOutputConfig config);
    ~AlsaOutput() override;

    std::expected<PcmFormat, MediaError> open(const PcmFormat& requested) override;
    std::expected<void, MediaError> start(RenderCallback render) override;
    void stop() override;
    void flush() override;
    void close() override;
    int64_t queued_frames() const override { return this->queued_frames_.load(std::memory_order_acquire); }
    bool is_running() const override { return this->running_.load(); }
    bool failed() const override { return this->failed_.load(); }

    const std::string& device_name() const { return this->device_name_; }
    size_t period_frames() const { return this->period_frames_; }
    uint64_t xrun_count() const { return this->xruns_.load(); }

private:
    bool open_device(const std::string& name);
    std::expected<PcmFormat, MediaError> configure(const PcmFormat& requested);
    void playback_loop();
    // Returns false when the device is lost.
    bool write_period(const int16_t* data, snd_pcm_uframes_t frames);
    void update_delay();

    AudioOutputConfig config_;
    snd_pcm_t* pcm_handle_ = nullptr;
    std::string device_name_;
    PcmFormat format_;
    snd_pcm_uframes_t period_frames_ = 0;
    std::vector<int16_t> period_buffer_;

    RenderCallback render_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::atomic<bool> flush_requested_{false};
    std::atomic<int64_t> queued_frames_{0};
    std::atomic<uint64_t> xruns_{0};

    int error_count_ = 0;
    std::chrono::steady_clock::time_point last_error_log_{};
};

} // namespace voxplay::modules
