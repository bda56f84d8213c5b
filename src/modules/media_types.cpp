#include "modules/media_types.hpp"

namespace voxplay::modules {

std::string error_to_string(MediaError error) {
    switch (error) {
        case MediaError::FileNotFound: return "FileNotFound";
        case MediaError::UnsupportedFormat: return "UnsupportedFormat";
        case MediaError::DecodeError: return "DecodeError";
        case MediaError::OutputDeviceError: return "OutputDeviceError";
        case MediaError::InvalidState: return "InvalidState";
        case MediaError::InternalError: return "InternalError";
    }
    return "Unknown";
}

std::string format_name(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return "mp3";
        case AudioFormat::M4a: return "m4a";
        case AudioFormat::Wav: return "wav";
        case AudioFormat::Flac: return "flac";
    }
    return "unknown";
}

Source Source::from_path(std::string path) {
    return Source(std::move(path));
}

Source Source::from_bytes(std::vector<uint8_t> bytes) {
    return Source(std::move(bytes));
}

std::string Source::describe() const {
    if (this->is_path()) return this->path();
    return "<memory: " + std::to_string(this->bytes().size()) + " bytes>";
}

} // namespace voxplay::modules
