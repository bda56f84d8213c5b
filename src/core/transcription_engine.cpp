#include "core/transcription_engine.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include "modules/sample_converter.hpp"

namespace voxplay::core {

namespace {

constexpr float kSilencePeak = 1e-4f;
constexpr auto kDecodePoll = std::chrono::milliseconds(50);

TranscriptionError cancelled() {
    return TranscriptionError{TranscriptionError::Kind::Transient, "cancelled"};
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

} // namespace

TranscriptionEngine::TranscriptionEngine(std::unique_ptr<modules::SpeechRecognizer> recognizer,
                                         modules::TranscriptionConfig config)
    : recognizer_(std::move(recognizer)), config_(std::move(config)) {}

TranscriptionEngine::~TranscriptionEngine() {
    this->cancel();
}

std::expected<TranscriptionEngine::RequestResult, TranscriptionError> TranscriptionEngine::transcribe(
    std::shared_ptr<const DecodedAudio> audio, modules::AudioFormat format) {
    if (!audio) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "no audio loaded"});
    }
    if (!this->recognizer_) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "no recognizer configured"});
    }

    std::unique_lock<std::mutex> lock(this->mutex_);
    if (this->audio_ != audio) {
        // A different source: whatever ran or was cached belongs to the old one.
        if (this->cancel_) this->cancel_->store(true);
        ++this->generation_;
        this->reset_locked();
        this->audio_ = audio;
    }

    if (format == modules::AudioFormat::Flac) {
        TranscriptionError error{TranscriptionError::Kind::UnsupportedFormat,
                                 "transcription of flac sources is not supported"};
        this->error_ = error;
        this->state_ = TranscriptionState::Failed;
        return std::unexpected(error);
    }

    switch (this->state_.load()) {
        case TranscriptionState::Running:
            return RequestResult::AlreadyRunning;
        case TranscriptionState::Complete:
            return RequestResult::Cached;
        case TranscriptionState::Failed:
            if (this->error_ && this->error_->kind != TranscriptionError::Kind::Transient) {
                return std::unexpected(*this->error_);
            }
            break;
        case TranscriptionState::NotRequested:
            break;
    }

    uint64_t generation = ++this->generation_;
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    this->cancel_ = cancel;
    this->transcript_.reset();
    this->error_.reset();
    this->progress_ = 0.0f;
    this->state_ = TranscriptionState::Running;
    lock.unlock();

    std::cout << "[Transcription] Job " << generation << " queued\n";
    this->pool_.enqueue([this, generation, cancel, audio] { this->run_job(generation, cancel, audio); });
    return RequestResult::Started;
}

void TranscriptionEngine::cancel() {
    std::lock_guard<std::mutex> listeners(this->listeners_mutex_);
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (this->state_.load() == TranscriptionState::Running) {
        std::cout << "[Transcription] Cancelling job " << this->generation_ << "\n";
    }
    if (this->cancel_) this->cancel_->store(true);
    ++this->generation_;
    this->pool_.clear_pending();
    this->reset_locked();
    this->audio_.reset();
    this->cv_.notify_all();
}

void TranscriptionEngine::reset_locked() {
    this->cancel_.reset();
    this->transcript_.reset();
    this->error_.reset();
    this->progress_ = 0.0f;
    this->state_ = TranscriptionState::NotRequested;
}

std::shared_ptr<const Transcript> TranscriptionEngine::transcript() const {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->state_.load() == TranscriptionState::Complete ? this->transcript_ : nullptr;
}

std::optional<TranscriptionError> TranscriptionEngine::last_error() const {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->error_;
}

TranscriptionState TranscriptionEngine::wait(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(this->mutex_);
    this->cv_.wait_for(lock, timeout, [this] { return this->state_.load() != TranscriptionState::Running; });
    return this->state_.load();
}

size_t TranscriptionEngine::add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(this->listeners_mutex_);
    size_t id = this->next_listener_id_++;
    this->listeners_.emplace(id, std::move(listener));
    return id;
}

void TranscriptionEngine::remove_listener(size_t id) {
    std::lock_guard<std::mutex> lock(this->listeners_mutex_);
    this->listeners_.erase(id);
}

void TranscriptionEngine::run_job(uint64_t generation, std::shared_ptr<std::atomic<bool>> cancel,
                                  std::shared_ptr<const DecodedAudio> audio) {
    if (cancel->load()) return;
    auto start = std::chrono::steady_clock::now();
    auto result = this->process(*audio, *cancel);
    if (cancel->load()) {
        std::cout << "[Transcription] Job " << generation << " cancelled\n";
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    if (result) {
        std::cout << "[Transcription] Job " << generation << " produced " << result->size() << " segments in "
                  << elapsed.count() << " ms\n";
    } else {
        std::cerr << "[Transcription] Job " << generation << " failed ("
                  << error_kind_to_string(result.error().kind) << "): " << result.error().message << "\n";
    }
    this->finish(generation, std::move(result));
}

void TranscriptionEngine::finish(uint64_t generation, std::expected<Transcript, TranscriptionError> result) {
    std::lock_guard<std::mutex> listeners(this->listeners_mutex_);
    TranscriptionState final_state;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        if (generation != this->generation_) return;
        if (result) {
            this->transcript_ = std::make_shared<const Transcript>(std::move(*result));
            this->state_ = TranscriptionState::Complete;
        } else {
            this->error_ = result.error();
            this->state_ = TranscriptionState::Failed;
        }
        this->progress_ = 1.0f;
        final_state = this->state_.load();
    }
    this->cv_.notify_all();

    for (auto& entry : this->listeners_) {
        entry.second(final_state);
    }
}

std::expected<std::vector<float>, TranscriptionError> TranscriptionEngine::prepare_pcm(
    const DecodedAudio& audio, const std::atomic<bool>& cancel) {
    while (!audio.wait_complete(kDecodePoll)) {
        if (cancel.load()) return std::unexpected(cancelled());
    }
    if (audio.frames_available() == 0) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "no decoded audio"});
    }

    const modules::PcmFormat format = audio.format();
    modules::SampleConverter converter;
    if (!converter.configure_s16(format, 1, AV_SAMPLE_FMT_FLT, modules::SpeechRecognizer::kSampleRate)) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent,
                                                  "cannot resample " + std::to_string(format.sample_rate) + " Hz audio"});
    }

    const std::vector<int16_t>& samples = audio.samples();
    const int64_t total = audio.frames_available();
    std::vector<float> pcm;
    pcm.reserve(static_cast<size_t>(total * modules::SpeechRecognizer::kSampleRate / format.sample_rate + 1024));

    // One second per chunk keeps cancellation responsive on long files.
    const int64_t chunk = format.sample_rate;
    for (int64_t offset = 0; offset < total; offset += chunk) {
        if (cancel.load()) return std::unexpected(cancelled());
        int64_t n = std::min(chunk, total - offset);
        const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(samples.data() + offset * format.channels)};
        if (converter.convert(in, static_cast<int>(n), pcm) < 0) {
            return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "resampling failed"});
        }
    }
    converter.flush(pcm);

    float peak = 0.0f;
    for (float s : pcm) peak = std::max(peak, std::fabs(s));
    if (peak < kSilencePeak) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "audio is silent"});
    }
    return pcm;
}

std::expected<Transcript, TranscriptionError> TranscriptionEngine::process(const DecodedAudio& audio,
                                                                           const std::atomic<bool>& cancel) {
    auto pcm = this->prepare_pcm(audio, cancel);
    if (!pcm) return std::unexpected(pcm.error());

    auto ready = this->recognizer_->prepare();
    if (!ready) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Transient,
                                                  "speech model unavailable: " + this->config_.model_path});
    }

    const size_t rate = modules::SpeechRecognizer::kSampleRate;
    const size_t window = std::max<size_t>(rate, static_cast<size_t>(this->config_.window_seconds * rate));
    const size_t total = pcm->size();
    Transcript segments;

    for (size_t start = 0; start < total; start += window) {
        if (cancel.load()) return std::unexpected(cancelled());
        size_t len = std::min(window, total - start);
        auto recognized = this->recognizer_->recognize(std::span<const float>(pcm->data() + start, len), cancel);
        if (!recognized) {
            if (recognized.error() == modules::RecognizerError::Aborted) return std::unexpected(cancelled());
            return std::unexpected(TranscriptionError{
                TranscriptionError::Kind::Transient,
                "recognition failed: " + modules::recognizer_error_to_string(recognized.error())});
        }

        double offset = static_cast<double>(start) / rate;
        for (auto& seg : *recognized) {
            if (cancel.load()) return std::unexpected(cancelled());
            segments.push_back(TranscriptSegment{std::move(seg.text), seg.start_sec + offset, seg.end_sec + offset});
        }
        this->progress_ = static_cast<float>(start + len) / static_cast<float>(total);
    }

    segments = normalize_segments(std::move(segments), audio.duration_seconds());
    if (segments.empty()) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "no speech recognised"});
    }
    return segments;
}

Transcript TranscriptionEngine::normalize_segments(Transcript segments, double duration) {
    std::stable_sort(segments.begin(), segments.end(),
                     [](const TranscriptSegment& a, const TranscriptSegment& b) { return a.start < b.start; });

    Transcript out;
    out.reserve(segments.size());
    for (auto& seg : segments) {
        std::string text = trim(seg.text);
        if (text.empty()) continue;
        if (text.size() > 2 && text.front() == '[' && text.back() == ']') continue;

        double start = std::clamp(seg.start, 0.0, duration);
        double end = std::clamp(seg.end, 0.0, duration);
        if (!out.empty() && start < out.back().end) start = out.back().end;
        if (end < start) end = start;
        out.push_back(TranscriptSegment{std::move(text), start, end});
    }
    return out;
}

} // namespace voxplay::core
