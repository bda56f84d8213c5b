#pragma once

#include <atomic>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace voxplay::modules {

enum class RecognizerError {
    ModelUnavailable, // Model file missing or failed to load; retry once it exists
    InferenceFailed,
    Aborted
};

std::string recognizer_error_to_string(RecognizerError error);

// Times are relative to the start of the PCM passed in.
struct RecognizedSegment {
    std::string text;
    double start_sec = 0.0;
    double end_sec = 0.0;
};

class SpeechRecognizer {
public:
    static constexpr int kSampleRate = 16000;

    virtual ~SpeechRecognizer() = default;

    // Loads the model if needed. Cheap once loaded.
    virtual std::expected<void, RecognizerError> prepare() = 0;

    // `pcm` is mono float at kSampleRate. Must return promptly with
    // RecognizerError::Aborted once `cancel` is set.
    virtual std::expected<std::vector<RecognizedSegment>, RecognizerError> recognize(
        std::span<const float> pcm, const std::atomic<bool>& cancel) = 0;
};

} // namespace voxplay::modules
