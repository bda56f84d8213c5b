#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace voxplay::modules {

enum class MediaError {
    FileNotFound,
    UnsupportedFormat,
    DecodeError,
    OutputDeviceError,
    InvalidState,
    InternalError
};

std::string error_to_string(MediaError error);

// Playable containers. Adding a format means one value here and one
// decoder strategy; nothing downstream of the decoder changes.
enum class AudioFormat {
    Mp3,
    M4a,
    Wav,
    Flac
};

std::string format_name(AudioFormat format);

// Input bound to a session: a filesystem path or an owned byte buffer.
class Source {
public:
    static Source from_path(std::string path);
    static Source from_bytes(std::vector<uint8_t> bytes);

    bool is_path() const { return std::holds_alternative<std::string>(this->input_); }
    const std::string& path() const { return std::get<std::string>(this->input_); }
    const std::vector<uint8_t>& bytes() const { return std::get<std::vector<uint8_t>>(this->input_); }

    // Path, or "<memory: N bytes>" for buffers. Used in log lines.
    std::string describe() const;

private:
    explicit Source(std::variant<std::string, std::vector<uint8_t>> input) : input_(std::move(input)) {}

    std::variant<std::string, std::vector<uint8_t>> input_;
};

struct PcmFormat {
    int sample_rate = 0;
    int channels = 0;

    bool operator==(const PcmFormat&) const = default;
};

// Interleaved signed 16-bit samples.
struct PcmBlock {
    std::vector<int16_t> samples;
};

} // namespace voxplay::modules
