#pragma once

#include <mutex>
#include <string>
#include "modules/config_module.hpp"
#include "modules/speech_recognizer.hpp"

struct whisper_context;

namespace voxplay::modules {

// whisper.cpp backend. The model is loaded lazily on the first prepare()
// and kept for the lifetime of the recognizer.
class WhisperRecognizer : public SpeechRecognizer {
public:
    explicit WhisperRecognizer(TranscriptionConfig config);
    ~WhisperRecognizer() override;

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    std::expected<void, RecognizerError> prepare() override;
    std::expected<std::vector<RecognizedSegment>, RecognizerError> recognize(
        std::span<const float> pcm, const std::atomic<bool>& cancel) override;

private:
    TranscriptionConfig config_;
    whisper_context* ctx_ = nullptr;
    std::mutex mutex_;
};

} // namespace voxplay::modules
