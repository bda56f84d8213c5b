#pragma once

#include <string>
#include <vector>

namespace voxplay::core {

enum class PlaybackState {
    Idle,
    Loading,
    Ready,
    Playing,
    Paused,
    Seeking,
    Stopped,
    Errored
};

enum class TranscriptionState {
    NotRequested,
    Running,
    Complete,
    Failed
};

std::string state_to_string(PlaybackState state);
std::string state_to_string(TranscriptionState state);

// One word or phrase of the transcript; times are seconds into the source.
struct TranscriptSegment {
    std::string text;
    double start = 0.0;
    double end = 0.0;

    bool operator==(const TranscriptSegment&) const = default;
};

// Sorted by start, non-overlapping.
using Transcript = std::vector<TranscriptSegment>;

struct TranscriptionError {
    enum class Kind {
        Transient,        // Retry by requesting transcription again
        Permanent,        // Audio cannot be transcribed
        UnsupportedFormat // Format is playable but not transcribable
    };

    Kind kind = Kind::Permanent;
    std::string message;
};

std::string error_kind_to_string(TranscriptionError::Kind kind);

} // namespace voxplay::core
