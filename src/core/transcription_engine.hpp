#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include "core/decoded_audio.hpp"
#include "core/player_types.hpp"
#include "modules/config_module.hpp"
#include "modules/media_types.hpp"
#include "modules/speech_recognizer.hpp"
#include "utils/thread_pool.hpp"

namespace voxplay::core {

// Runs speech recognition over a source's decoded audio on a background
// worker. At most one job per source; the result is cached until cancel().
//
// Every job carries a generation number and a cancellation flag. cancel()
// bumps the generation, so a job that finishes late is discarded and its
// segments are never published.
class TranscriptionEngine {
public:
    enum class RequestResult {
        Started,
        AlreadyRunning,
        Cached
    };

    // Invoked on the worker thread with the job's final state. Listeners
    // must not call cancel() or remove_listener().
    using Listener = std::function<void(TranscriptionState)>;

    TranscriptionEngine(std::unique_ptr<modules::SpeechRecognizer> recognizer, modules::TranscriptionConfig config);
    ~TranscriptionEngine();

    TranscriptionEngine(const TranscriptionEngine&) = delete;
    TranscriptionEngine& operator=(const TranscriptionEngine&) = delete;

    // Never blocks on recognition. Returns an error without starting a job
    // for flac sources, for a stored permanent failure and when no audio is
    // given.
    std::expected<RequestResult, TranscriptionError> transcribe(std::shared_ptr<const DecodedAudio> audio,
                                                                modules::AudioFormat format);

    // Cancels any running job and discards cached segments.
    void cancel();

    TranscriptionState state() const { return this->state_.load(std::memory_order_acquire); }
    std::shared_ptr<const Transcript> transcript() const;
    std::optional<TranscriptionError> last_error() const;
    float progress() const { return this->progress_.load(std::memory_order_relaxed); }

    // Blocks until the state leaves Running or the timeout expires.
    TranscriptionState wait(std::chrono::milliseconds timeout) const;

    size_t add_listener(Listener listener);
    void remove_listener(size_t id);

    // Sorts, trims and clamps recognizer output into a valid transcript.
    static Transcript normalize_segments(Transcript segments, double duration);

private:
    void run_job(uint64_t generation, std::shared_ptr<std::atomic<bool>> cancel,
                 std::shared_ptr<const DecodedAudio> audio);
    std::expected<Transcript, TranscriptionError> process(const DecodedAudio& audio, const std::atomic<bool>& cancel);
    std::expected<std::vector<float>, TranscriptionError> prepare_pcm(const DecodedAudio& audio,
                                                                      const std::atomic<bool>& cancel);
    void finish(uint64_t generation, std::expected<Transcript, TranscriptionError> result);
    void reset_locked();

    std::unique_ptr<modules::SpeechRecognizer> recognizer_;
    modules::TranscriptionConfig config_;

    // Lock order: listeners_mutex_ before mutex_.
    std::mutex listeners_mutex_;
    std::map<size_t, Listener> listeners_;
    size_t next_listener_id_ = 1;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<TranscriptionState> state_{TranscriptionState::NotRequested};
    uint64_t generation_ = 0;
    std::shared_ptr<std::atomic<bool>> cancel_;
    std::shared_ptr<const DecodedAudio> audio_;
    std::shared_ptr<const Transcript> transcript_;
    std::optional<TranscriptionError> error_;
    std::atomic<float> progress_{0.0f};

    // Declared last: joins the worker before the state above goes away.
    utils::ThreadPool pool_{1};
};

} // namespace voxplay::core
