#include "modules/alsa_output.hpp"
#include <algorithm>
#include <cerrno>
#include <iostream>

namespace voxplay::modules {

namespace {
constexpr int kMaxWriteFailures = 10;
}

AlsaOutput::AlsaOutput(AudioOutputConfig config) : config_(std::move(config)) {}

AlsaOutput::~AlsaOutput() {
    this->close();
}

bool AlsaOutput::open_device(const std::string& name) {
    int err = snd_pcm_open(&this->pcm_handle_, name.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        std::cerr << "[ALSA] Cannot open audio device " << name << ": " << snd_strerror(err) << "\n";
        this->pcm_handle_ = nullptr;
        return false;
    }
    this->device_name_ = name;
    return true;
}

std::expected<PcmFormat, MediaError> AlsaOutput::open(const PcmFormat& requested) {
    this->close();

    if (!this->open_device(this->config_.device)) {
        bool opened = false;
        for (const auto& fb : this->config_.fallback_devices) {
            if (fb == this->config_.device) continue;
            std::cout << "[ALSA] Trying fallback device '" << fb << "'...\n";
            if (this->open_device(fb)) {
                opened = true;
                break;
            }
        }
        if (!opened) {
            return std::unexpected(MediaError::OutputDeviceError);
        }
    }

    auto negotiated = this->configure(requested);
    if (!negotiated) {
        snd_pcm_close(this->pcm_handle_);
        this->pcm_handle_ = nullptr;
        return std::unexpected(negotiated.error());
    }

    std::cout << "[ALSA] Opened '" << this->device_name_ << "' at " << negotiated->sample_rate << " Hz, "
              << negotiated->channels << " ch, period " << this->period_frames_ << " frames\n";
    return negotiated;
}

std::expected<PcmFormat, MediaError> AlsaOutput::configure(const PcmFormat& requested) {
    unsigned int rate = static_cast<unsigned int>(requested.sample_rate > 0 ? requested.sample_rate : 48000);
    unsigned int channels = static_cast<unsigned int>(requested.channels > 0 ? requested.channels : 2);
    int dir = 0;

    snd_pcm_hw_params_t* params;
    snd_pcm_hw_params_alloca(&params);
    if (snd_pcm_hw_params_any(this->pcm_handle_, params) < 0 ||
        snd_pcm_hw_params_set_access(this->pcm_handle_, params, SND_PCM_ACCESS_RW_INTERLEAVED) < 0 ||
        snd_pcm_hw_params_set_format(this->pcm_handle_, params, SND_PCM_FORMAT_S16_LE) < 0) {
        std::cerr << "[ALSA] Device does not support interleaved S16_LE\n";
        return std::unexpected(MediaError::OutputDeviceError);
    }
    if (snd_pcm_hw_params_set_channels(this->pcm_handle_, params, channels) < 0) {
        // Most devices take stereo; the engine downmixes or upmixes to it.
        channels = 2;
        if (snd_pcm_hw_params_set_channels(this->pcm_handle_, params, channels) < 0) {
            std::cerr << "[ALSA] Device rejects " << requested.channels << " and 2 channels\n";
            return std::unexpected(MediaError::OutputDeviceError);
        }
    }
    if (snd_pcm_hw_params_set_rate_near(this->pcm_handle_, params, &rate, &dir) < 0) {
        return std::unexpected(MediaError::OutputDeviceError);
    }

    snd_pcm_uframes_t buffer_size = static_cast<snd_pcm_uframes_t>(rate) * this->config_.buffer_ms / 1000;
    snd_pcm_hw_params_set_buffer_size_near(this->pcm_handle_, params, &buffer_size);

    snd_pcm_uframes_t period_size = static_cast<snd_pcm_uframes_t>(rate) * this->config_.period_ms / 1000;
    if (period_size == 0) period_size = 256;
    snd_pcm_hw_params_set_period_size_near(this->pcm_handle_, params, &period_size, &dir);

    int err = snd_pcm_hw_params(this->pcm_handle_, params);
    if (err < 0) {
        std::cerr << "[ALSA] Cannot apply hardware parameters: " << snd_strerror(err) << "\n";
        return std::unexpected(MediaError::OutputDeviceError);
    }

    snd_pcm_sw_params_t* sw_params;
    snd_pcm_sw_params_alloca(&sw_params);
    if (snd_pcm_sw_params_current(this->pcm_handle_, sw_params) == 0) {
        // Start as soon as one period is queued.
        snd_pcm_sw_params_set_start_threshold(this->pcm_handle_, sw_params, period_size);
        snd_pcm_sw_params_set_avail_min(this->pcm_handle_, sw_params, period_size);
        snd_pcm_sw_params(this->pcm_handle_, sw_params);
    }

    this->format_ = PcmFormat{static_cast<int>(rate), static_cast<int>(channels)};
    this->period_frames_ = period_size;
    this->period_buffer_.assign(period_size * channels, 0);
    return this->format_;
}

std::expected<void, MediaError> AlsaOutput::start(RenderCallback render) {
    if (!this->pcm_handle_) return std::unexpected(MediaError::OutputDeviceError);
    if (this->running_) return {};
    if (!render) return std::unexpected(MediaError::InternalError);

    int err = snd_pcm_prepare(this->pcm_handle_);
    if (err < 0) {
        std::cerr << "[ALSA] Prepare failed: " << snd_strerror(err) << "\n";
        return std::unexpected(MediaError::OutputDeviceError);
    }

    this->render_ = std::move(render);
    this->error_count_ = 0;
    this->failed_ = false;
    this->flush_requested_ = false;
    this->running_ = true;
    this->thread_ = std::thread(&AlsaOutput::playback_loop, this);
    return {};
}

void AlsaOutput::stop() {
    this->running_ = false;
    if (this->thread_.joinable()) {
        this->thread_.join();
    }
    if (this->pcm_handle_) {
        snd_pcm_drop(this->pcm_handle_);
    }
    this->queued_frames_ = 0;
}

void AlsaOutput::flush() {
    this->flush_requested_ = true;
}

void AlsaOutput::close() {
    this->stop();
    if (this->pcm_handle_) {
        snd_pcm_close(this->pcm_handle_);
        this->pcm_handle_ = nullptr;
        std::cout << "[ALSA] Closed '" << this->device_name_ << "'\n";
    }
    this->render_ = nullptr;
}

void AlsaOutput::update_delay() {
    snd_pcm_sframes_t delay = 0;
    if (snd_pcm_delay(this->pcm_handle_, &delay) == 0) {
        this->queued_frames_.store(std::max<snd_pcm_sframes_t>(0, delay), std::memory_order_release);
    }
}

void AlsaOutput::playback_loop() {
    while (this->running_) {
        if (this->flush_requested_.exchange(false)) {
            snd_pcm_drop(this->pcm_handle_);
            snd_pcm_prepare(this->pcm_handle_);
            this->queued_frames_ = 0;
        }

        this->render_(this->period_buffer_.data(), this->period_frames_);
        if (!this->write_period(this->period_buffer_.data(), this->period_frames_)) {
            this->failed_ = true;
            this->running_ = false;
            return;
        }
        this->update_delay();
    }
}

bool AlsaOutput::write_period(const int16_t* data, snd_pcm_uframes_t frames) {
    snd_pcm_uframes_t offset = 0;
    while (offset < frames && this->running_) {
        snd_pcm_sframes_t written = snd_pcm_writei(this->pcm_handle_,
                                                   data + offset * static_cast<size_t>(this->format_.channels),
                                                   frames - offset);
        if (written > 0) {
            this->error_count_ = 0;
            offset += static_cast<snd_pcm_uframes_t>(written);
        } else if (written == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        } else if (written == -EPIPE) {
            ++this->xruns_;
            std::cerr << "[ALSA] Underrun (EPIPE). Preparing stream...\n";
            snd_pcm_prepare(this->pcm_handle_);
        } else if (written == -ESTRPIPE) {
            std::cerr << "[ALSA] Suspended (ESTRPIPE). Resuming...\n";
            int res;
            while ((res = snd_pcm_resume(this->pcm_handle_)) == -EAGAIN && this->running_) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
            if (res < 0) {
                snd_pcm_prepare(this->pcm_handle_);
            }
        } else {
            auto now = std::chrono::steady_clock::now();
            if (now - this->last_error_log_ >= std::chrono::seconds(5)) {
                std::cerr << "[ALSA] Write error: " << snd_strerror(static_cast<int>(written)) << " (" << written
                          << "). Recovering (Count: " << this->error_count_ << ")...\n";
                this->last_error_log_ = now;
            }
            int res = snd_pcm_recover(this->pcm_handle_, static_cast<int>(written), 0);
            if (res < 0 && ++this->error_count_ > kMaxWriteFailures) {
                std::cerr << "[ALSA] Persistent failure on '" << this->device_name_ << "'. Giving up.\n";
                return false;
            }
        }
    }
    return true;
}

} // namespace voxplay::modules
