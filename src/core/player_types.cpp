#include "core/player_types.hpp"

namespace voxplay::core {

std::string state_to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::Idle: return "Idle";
        case PlaybackState::Loading: return "Loading";
        case PlaybackState::Ready: return "Ready";
        case PlaybackState::Playing: return "Playing";
        case PlaybackState::Paused: return "Paused";
        case PlaybackState::Seeking: return "Seeking";
        case PlaybackState::Stopped: return "Stopped";
        case PlaybackState::Errored: return "Errored";
    }
    return "Unknown";
}

std::string state_to_string(TranscriptionState state) {
    switch (state) {
        case TranscriptionState::NotRequested: return "NotRequested";
        case TranscriptionState::Running: return "Running";
        case TranscriptionState::Complete: return "Complete";
        case TranscriptionState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string error_kind_to_string(TranscriptionError::Kind kind) {
    switch (kind) {
        case TranscriptionError::Kind::Transient: return "Transient";
        case TranscriptionError::Kind::Permanent: return "Permanent";
        case TranscriptionError::Kind::UnsupportedFormat: return "UnsupportedFormat";
    }
    return "Unknown";
}

} // namespace voxplay::core
