#include "core/playback_engine.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <new>

namespace voxplay::core {

namespace {
constexpr int64_t kFeedChunkFrames = 2048;
// Room left in the ring for resampler delay when sizing a chunk.
constexpr int64_t kResamplerHeadroomFrames = 256;
constexpr auto kFeederIdle = std::chrono::milliseconds(2);
constexpr auto kPrebufferTimeout = std::chrono::seconds(10);
}

PlaybackEngine::PlaybackEngine(modules::OutputFactory output_factory, modules::AudioOutputConfig output_config,
                               modules::PlaybackConfig config)
    : output_factory_(std::move(output_factory)),
      output_config_(std::move(output_config)),
      config_(config) {
    this->set_volume(config.volume);
}

PlaybackEngine::~PlaybackEngine() {
    std::lock_guard<std::mutex> lock(this->control_mutex_);
    this->release_session_locked();
}

// --- session lifecycle ---

std::expected<void, modules::MediaError> PlaybackEngine::load(std::shared_ptr<const modules::Source> source) {
    std::lock_guard<std::mutex> lock(this->control_mutex_);
    this->release_session_locked();

    this->state_ = PlaybackState::Loading;
    this->at_end_ = false;
    this->underruns_ = 0;
    {
        std::lock_guard<std::mutex> status(this->status_mutex_);
        this->last_error_.reset();
    }
    if (!source) {
        this->fail_locked(modules::MediaError::InternalError);
        return std::unexpected(modules::MediaError::InternalError);
    }

    std::cout << "[Playback] Loading " << source->describe() << "\n";
    auto decoder = this->loader_.open(source);
    if (!decoder) {
        this->fail_locked(decoder.error());
        return std::unexpected(decoder.error());
    }

    const modules::DecoderMetadata meta = (*decoder)->metadata();
    std::shared_ptr<DecodedAudio> audio;
    try {
        audio = std::make_shared<DecodedAudio>(meta.format, meta.estimated_duration_sec);
    } catch (const std::bad_alloc&) {
        std::cerr << "[Playback] Out of memory allocating decode buffer\n";
        this->fail_locked(modules::MediaError::DecodeError);
        return std::unexpected(modules::MediaError::DecodeError);
    }
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> status(this->status_mutex_);
        this->audio_ = audio;
        this->format_ = (*decoder)->format();
    }
    this->decode_cancel_ = cancel;
    this->decode_thread_ = std::thread(&PlaybackEngine::decode_loop, this, std::move(*decoder), audio, cancel);

    int64_t prebuffer = static_cast<int64_t>(meta.format.sample_rate) * this->config_.prebuffer_ms / 1000;
    audio->wait_for_frames(std::max<int64_t>(prebuffer, 1), kPrebufferTimeout);

    if (audio->frames_available() == 0) {
        // Nothing playable yet: either the stream is empty/corrupt or the
        // decoder is stalled.
        if (!audio->is_complete()) {
            std::cerr << "[Playback] Decoder produced no audio within " << kPrebufferTimeout.count() << " s\n";
        }
        auto error = audio->decode_error().value_or(modules::MediaError::DecodeError);
        this->fail_locked(error);
        return std::unexpected(error);
    }

    this->reanchor_locked(0.0);
    this->state_ = PlaybackState::Ready;
    std::cout << "[Playback] Ready: " << meta.format.sample_rate << " Hz, " << meta.format.channels << " ch\n";
    return {};
}

void PlaybackEngine::unload() {
    std::lock_guard<std::mutex> lock(this->control_mutex_);
    this->release_session_locked();
    this->at_end_ = false;
    this->state_ = PlaybackState::Idle;
}

void PlaybackEngine::release_session_locked() {
    // Output first so no render callback outlives the buffers it reads.
    this->halt_feed_locked();
    this->release_output_locked();

    if (this->decode_cancel_) {
        this->decode_cancel_->store(true);
    }
    if (this->decode_thread_.joinable()) {
        this->decode_thread_.join();
    }
    this->decode_cancel_.reset();

    std::lock_guard<std::mutex> status(this->status_mutex_);
    this->audio_.reset();
    this->format_.reset();
}

void PlaybackEngine::decode_loop(std::unique_ptr<modules::AudioDecoder> decoder, std::shared_ptr<DecodedAudio> audio,
                                 std::shared_ptr<std::atomic<bool>> cancel) {
    std::optional<modules::MediaError> error;
    while (!cancel->load()) {
        auto block = decoder->next_block();
        if (!block) {
            error = block.error();
            break;
        }
        if (!*block) break;
        try {
            audio->append(**block);
        } catch (const std::bad_alloc&) {
            error = modules::MediaError::DecodeError;
            break;
        }
    }
    decoder->close();
    audio->finish(error);

    if (cancel->load()) return;
    if (error) {
        std::cerr << "[Playback] Decode stopped after " << audio->duration_seconds()
                  << " s: " << modules::error_to_string(*error) << "\n";
        std::lock_guard<std::mutex> status(this->status_mutex_);
        if (this->audio_ == audio) this->last_error_ = *error;
    } else {
        std::cout << "[Playback] Decoded " << audio->frames_available() << " frames ("
                  << audio->duration_seconds() << " s)\n";
    }
}

void PlaybackEngine::fail_locked(modules::MediaError error) {
    std::cerr << "[Playback] Error: " << modules::error_to_string(error) << "\n";
    {
        std::lock_guard<std::mutex> status(this->status_mutex_);
        this->last_error_ = error;
    }
    this->state_ = PlaybackState::Errored;
}

// --- transport ---

std::expected<void, modules::MediaError> PlaybackEngine::play() {
    std::lock_guard<std::mutex> lock(this->control_mutex_);
    PlaybackState current = this->state_.load();
    if (current == PlaybackState::Playing) return {};
    if (current != PlaybackState::Ready && current != PlaybackState::Paused && current != PlaybackState::Stopped) {
        return std::unexpected(modules::MediaError::InvalidState);
    }
    if (!this->audio_) return std::unexpected(modules::MediaError::InvalidState);

    if (this->output_ && this->output_->failed()) {
        this->release_output_locked();
    }
    if (!this->output_) {
        auto acquired = this->acquire_output_locked();
        if (!acquired) {
            this->fail_locked(acquired.error());
            return std::unexpected(acquired.error());
        }
    }
    if (this->at_end_.exchange(false)) {
        this->reanchor_locked(0.0);
    }

    auto started = this->start_feed_locked();
    if (!started) {
        this->halt_feed_locked();
        this->release_output_locked();
        this->fail_locked(started.error());
        return std::unexpected(started.error());
    }
    this->state_ = PlaybackState::Playing;
    return {};
}

void PlaybackEngine::pause() {
    std::lock_guard<std::mutex> lock(this->control_mutex_);
    if (this->state_.load() != PlaybackState::Playing) return;

    // Sample the position while the device still reports its queue.
    double at = this->position();
    this->halt_feed_locked();
    this->reanchor_locked(at);
    this->state_ = PlaybackState::Paused;
}

void PlaybackEngine::seek(double seconds) {
    std::lock_guard<std::mutex> lock(this->control_mutex_);
    PlaybackState prior = this->state_.load();
    if (prior != PlaybackState::Ready && prior != PlaybackState::Playing && prior != PlaybackState::Paused) return;
    if (!this->audio_) return;

    double target = std::isfinite(seconds) ? std::clamp(seconds, 0.0, this->duration()) : 0.0;
    this->state_ = PlaybackState::Seeking;
    this->at_end_ = false;
    // A newer seek simply re-anchors again; queued audio from any earlier
    // target is discarded by the render callback.
    this->reanchor_locked(target);
    if (prior == PlaybackState::Playing && this->output_) {
        this->output_->flush();
    }
    this->state_ = prior;
}

void PlaybackEngine::stop() {
    std::lock_guard<std::mutex> lock(this->control_mutex_);
    this->halt_feed_locked();
    this->release_output_locked();
    if (this->audio_) {
        this->reanchor_locked(0.0);
    }
    this->at_end_ = false;
    this->state_ = PlaybackState::Stopped;
}

void PlaybackEngine::set_volume(int volume) {
    this->volume_.store(std::clamp(volume, 0, 100), std::memory_order_relaxed);
}

// --- output and feeder management ---

std::expected<void, modules::MediaError> PlaybackEngine::acquire_output_locked() {
    auto output = this->output_factory_ ? this->output_factory_() : nullptr;
    if (!output) return std::unexpected(modules::MediaError::OutputDeviceError);

    const modules::PcmFormat source = this->audio_->format();
    modules::PcmFormat requested{
        this->output_config_.sample_rate > 0 ? this->output_config_.sample_rate : source.sample_rate,
        this->output_config_.channels > 0 ? this->output_config_.channels : source.channels};

    auto negotiated = output->open(requested);
    if (!negotiated) {
        return std::unexpected(modules::MediaError::OutputDeviceError);
    }

    {
        std::lock_guard<std::mutex> feed(this->feed_mutex_);
        auto configured = this->converter_.configure_s16(source, negotiated->channels, AV_SAMPLE_FMT_S16,
                                                         negotiated->sample_rate);
        if (!configured) {
            output->close();
            return std::unexpected(configured.error());
        }
    }

    size_t ring_frames = static_cast<size_t>(negotiated->sample_rate) * this->config_.ring_buffer_ms / 1000;
    ring_frames = std::max<size_t>(ring_frames, kFeedChunkFrames * 2);
    {
        std::lock_guard<std::mutex> pos(this->position_mutex_);
        this->output_ = std::move(output);
        this->ring_ = std::make_unique<utils::RingBufferI16>(ring_frames * negotiated->channels);
        this->device_format_ = *negotiated;
    }
    if (*negotiated != source) {
        std::cout << "[Playback] Converting " << source.sample_rate << " Hz/" << source.channels << " ch to "
                  << negotiated->sample_rate << " Hz/" << negotiated->channels << " ch\n";
    }

    double at = 0.0;
    {
        std::lock_guard<std::mutex> pos(this->position_mutex_);
        at = this->anchor_sec_;
    }
    this->reanchor_locked(at);
    return {};
}

void PlaybackEngine::release_output_locked() {
    std::unique_ptr<modules::AudioOutput> output;
    {
        std::lock_guard<std::mutex> pos(this->position_mutex_);
        output = std::move(this->output_);
        this->ring_.reset();
        this->device_format_ = modules::PcmFormat{};
    }
    if (output) {
        output->close();
    }
}

std::expected<void, modules::MediaError> PlaybackEngine::start_feed_locked() {
    if (this->feeder_thread_.joinable()) {
        this->feeder_thread_.join();
    }

    // Prefill so the first periods are not silence.
    std::vector<int16_t> src;
    std::vector<int16_t> dst;
    for (int i = 0; i < 64; ++i) {
        if (this->feed_step(*this->audio_, src, dst) != FeedResult::Progress) break;
    }

    this->feeder_stop_ = false;
    this->feeder_thread_ = std::thread(&PlaybackEngine::feeder_loop, this, this->audio_);

    auto started = this->output_->start([this](int16_t* out, size_t frames) { this->render(out, frames); });
    if (!started) {
        return std::unexpected(modules::MediaError::OutputDeviceError);
    }
    return {};
}

void PlaybackEngine::halt_feed_locked() {
    if (this->output_) {
        this->output_->stop();
    }
    this->feeder_stop_ = true;
    if (this->feeder_thread_.joinable()) {
        this->feeder_thread_.join();
    }
}

void PlaybackEngine::reanchor_locked(double seconds) {
    std::lock_guard<std::mutex> feed(this->feed_mutex_);
    int rate = this->audio_ ? this->audio_->format().sample_rate : 0;
    this->feed_frame_ = static_cast<int64_t>(std::llround(seconds * rate));
    this->drained_ = false;
    this->converter_.reset();
    this->trailing_silence_ = 0;

    std::lock_guard<std::mutex> pos(this->position_mutex_);
    this->anchor_sec_ = seconds;
    this->last_reported_ = seconds;
    this->anchor_index_ = this->ring_ ? this->ring_->write_index() : 0;
    this->discard_before_.store(this->anchor_index_, std::memory_order_release);
    // With the device thread halted there is no consumer, so stale audio
    // can be dropped here and the next prefill has the whole ring.
    if (this->ring_ && !(this->output_ && this->output_->is_running())) {
        this->ring_->discard_until(this->anchor_index_);
    }
}

PlaybackEngine::FeedResult PlaybackEngine::feed_step(const DecodedAudio& audio, std::vector<int16_t>& src,
                                                     std::vector<int16_t>& dst) {
    std::lock_guard<std::mutex> feed(this->feed_mutex_);
    if (this->drained_.load()) return FeedResult::Drained;

    const int64_t src_rate = audio.format().sample_rate;
    const int64_t dev_rate = this->device_format_.sample_rate;
    const int64_t dev_channels = this->device_format_.channels;

    int64_t free_frames = static_cast<int64_t>(this->ring_->free_space()) / dev_channels - kResamplerHeadroomFrames;
    int64_t fit = free_frames * src_rate / dev_rate;
    if (fit < 64) return FeedResult::Full;

    src.clear();
    int64_t n = audio.copy_frames(this->feed_frame_, std::min(fit, kFeedChunkFrames), src);
    if (n == 0) {
        if (audio.is_complete() && this->feed_frame_ >= audio.frames_available()) {
            dst.clear();
            this->converter_.flush(dst);
            this->ring_->push(dst.data(), dst.size() - dst.size() % dev_channels);
            this->drained_ = true;
            return FeedResult::Drained;
        }
        return FeedResult::Starved;
    }

    if (this->converter_.is_passthrough()) {
        this->ring_->push(src.data(), src.size());
    } else {
        dst.clear();
        const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(src.data())};
        int produced = this->converter_.convert(in, static_cast<int>(n), dst);
        if (produced > 0) {
            this->ring_->push(dst.data(), static_cast<size_t>(produced) * dev_channels);
        }
    }
    this->feed_frame_ += n;
    return FeedResult::Progress;
}

void PlaybackEngine::feeder_loop(std::shared_ptr<DecodedAudio> audio) {
    std::vector<int16_t> src;
    std::vector<int16_t> dst;
    src.reserve(static_cast<size_t>(kFeedChunkFrames) * audio->format().channels);

    while (!this->feeder_stop_.load()) {
        if (this->output_->failed()) {
            if (this->try_finish_playback(FinishReason::DeviceLost)) return;
            std::this_thread::sleep_for(kFeederIdle);
            continue;
        }

        FeedResult result = this->feed_step(*audio, src, dst);
        if (result == FeedResult::Progress) continue;

        if (result == FeedResult::Drained && this->ring_->size() == 0 && this->unplayed_device_frames() == 0) {
            if (this->try_finish_playback(FinishReason::EndOfMedia)) return;
        }
        std::this_thread::sleep_for(kFeederIdle);
    }
}

bool PlaybackEngine::try_finish_playback(FinishReason reason) {
    // A transport call holding the lock will stop this thread itself.
    std::unique_lock<std::mutex> lock(this->control_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return false;
    if (this->feeder_stop_.load() || this->state_.load() != PlaybackState::Playing) return false;

    if (reason == FinishReason::EndOfMedia) {
        if (!this->drained_.load()) return false; // a seek got in first
        this->output_->stop();
        this->feeder_stop_ = true;
        this->reanchor_locked(this->duration());
        this->at_end_ = true;
        this->state_ = PlaybackState::Paused;
        std::cout << "[Playback] End of media\n";
    } else {
        std::cerr << "[Playback] Output device lost\n";
        this->output_->stop();
        this->feeder_stop_ = true;
        this->fail_locked(modules::MediaError::OutputDeviceError);
    }
    return true;
}

int64_t PlaybackEngine::unplayed_device_frames() const {
    int64_t queued = this->output_ ? this->output_->queued_frames() : 0;
    // Silence rendered after the last data sits at the tail of the device queue.
    return std::max<int64_t>(0, queued - this->trailing_silence_.load(std::memory_order_acquire));
}

void PlaybackEngine::render(int16_t* out, size_t frames) {
    utils::RingBufferI16& ring = *this->ring_;
    const size_t channels = static_cast<size_t>(this->device_format_.channels);
    const size_t wanted = frames * channels;

    size_t discard = this->discard_before_.load(std::memory_order_acquire);
    if (ring.read_index() < discard) {
        ring.discard_until(discard);
    }

    size_t got = ring.pop(out, wanted);

    int volume = this->volume_.load(std::memory_order_relaxed);
    if (volume < 100) {
        float gain = static_cast<float>(volume) / 100.0f;
        for (size_t i = 0; i < got; ++i) {
            out[i] = static_cast<int16_t>(static_cast<float>(out[i]) * gain);
        }
    }

    if (got < wanted) {
        std::fill(out + got, out + wanted, static_cast<int16_t>(0));
        int64_t silent = static_cast<int64_t>((wanted - got) / channels);
        if (got == 0) {
            this->trailing_silence_.fetch_add(silent, std::memory_order_release);
        } else {
            this->trailing_silence_.store(silent, std::memory_order_release);
        }
        if (!this->drained_.load(std::memory_order_acquire)) {
            this->underruns_.fetch_add(1, std::memory_order_relaxed);
        }
    } else {
        this->trailing_silence_.store(0, std::memory_order_release);
    }
}

// --- snapshots ---

double PlaybackEngine::position() const {
    PlaybackState current = this->state_.load(std::memory_order_acquire);
    if (current == PlaybackState::Idle || current == PlaybackState::Loading || current == PlaybackState::Stopped ||
        current == PlaybackState::Errored) {
        return 0.0;
    }
    double total = this->duration();

    std::lock_guard<std::mutex> pos(this->position_mutex_);
    double at = this->anchor_sec_;
    if (this->ring_ && this->output_ && this->output_->is_running() && this->device_format_.sample_rate > 0) {
        size_t read = this->ring_->read_index();
        if (read > this->anchor_index_) {
            int64_t consumed = static_cast<int64_t>((read - this->anchor_index_) / this->device_format_.channels);
            int64_t played = std::max<int64_t>(0, consumed - this->unplayed_device_frames());
            at += static_cast<double>(played) / this->device_format_.sample_rate;
        }
    }
    at = std::clamp(at, 0.0, std::max(total, 0.0));
    if (at < this->last_reported_) {
        at = this->last_reported_;
    } else {
        this->last_reported_ = at;
    }
    return at;
}

double PlaybackEngine::duration() const {
    std::lock_guard<std::mutex> status(this->status_mutex_);
    return this->audio_ ? this->audio_->duration_seconds() : 0.0;
}

std::optional<modules::MediaError> PlaybackEngine::last_error() const {
    std::lock_guard<std::mutex> status(this->status_mutex_);
    return this->last_error_;
}

std::shared_ptr<const DecodedAudio> PlaybackEngine::decoded_audio() const {
    std::lock_guard<std::mutex> status(this->status_mutex_);
    return this->audio_;
}

std::optional<modules::AudioFormat> PlaybackEngine::source_format() const {
    std::lock_guard<std::mutex> status(this->status_mutex_);
    return this->format_;
}

modules::PcmFormat PlaybackEngine::device_format() const {
    std::lock_guard<std::mutex> pos(this->position_mutex_);
    return this->device_format_;
}

} // namespace voxplay::core
