#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/playback_engine.hpp"
#include "core/player_types.hpp"
#include "core/sync_controller.hpp"
#include "core/transcription_engine.hpp"
#include "modules/audio_output.hpp"
#include "modules/config_module.hpp"
#include "modules/speech_recognizer.hpp"

namespace voxplay::core {

// Host-facing player: one source, one output stream, one transcript.
// All methods are called from the host's UI thread; none of them block on
// transcription.
class Player {
public:
    // ALSA output and whisper.cpp recognizer built from `config`.
    explicit Player(modules::PlayerConfig config);
    Player(modules::PlayerConfig config, modules::OutputFactory output_factory,
           std::unique_ptr<modules::SpeechRecognizer> recognizer);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    std::expected<void, modules::MediaError> load_file(const std::string& path);
    std::expected<void, modules::MediaError> load_bytes(std::vector<uint8_t> bytes);
    void unload();

    std::expected<void, modules::MediaError> play();
    void pause();
    void seek(double seconds);
    void stop();
    void set_volume(int volume);

    std::expected<TranscriptionEngine::RequestResult, TranscriptionError> request_transcription();
    void cancel_transcription();

    // Per-frame host hook: refreshes the active segment snapshot.
    void tick();

    double position() const { return this->playback_.position(); }
    double duration() const { return this->playback_.duration(); }
    PlaybackState playback_state() const { return this->playback_.state(); }
    TranscriptionState transcription_state() const { return this->transcription_.state(); }
    std::optional<modules::MediaError> last_error() const { return this->playback_.last_error(); }
    std::optional<TranscriptionError> transcription_error() const { return this->transcription_.last_error(); }
    float transcription_progress() const { return this->transcription_.progress(); }

    std::shared_ptr<const Transcript> segments() const { return this->sync_.segments(); }
    std::optional<size_t> active_index() const { return this->sync_.current_index(); }
    std::optional<TranscriptSegment> active_segment() const { return this->sync_.current_segment(); }
    bool activate_segment(size_t index) { return this->sync_.activate_index(index); }

    // "01:05 / 03:00"
    std::string time_label() const;
    // Segment text, or "00:01-00:02: text" in timestamps mode. Empty when
    // `index` is out of range or no transcript is available.
    std::string segment_label(size_t index) const;

    const modules::PlayerConfig& config() const { return this->config_; }
    PlaybackEngine& playback() { return this->playback_; }
    TranscriptionEngine& transcription() { return this->transcription_; }
    SyncController& sync() { return this->sync_; }

private:
    std::expected<void, modules::MediaError> load(std::shared_ptr<const modules::Source> source);

    modules::PlayerConfig config_;
    PlaybackEngine playback_;
    TranscriptionEngine transcription_;
    SyncController sync_;
};

} // namespace voxplay::core
