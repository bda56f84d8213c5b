#pragma once

#include <expected>
#include <string>
#include <vector>

namespace voxplay::modules {

enum class ConfigError {
    ParseError
};

struct AudioOutputConfig {
    std::string device = "default";
    std::vector<std::string> fallback_devices = {"plughw:0,0"};
    int sample_rate = 0; // 0 = match the source
    int channels = 0;    // 0 = match the source
    int buffer_ms = 200;
    int period_ms = 20;
};

struct PlaybackConfig {
    int prebuffer_ms = 250;   // Decoded before load() reports Ready
    int ring_buffer_ms = 500; // Decode-ahead between feeder and device thread
    int volume = 100;         // 0-100
};

enum class TranscriptMode {
    None,       // Transcription requests are refused
    Allow,
    Label,      // Segment labels show text
    Timestamps  // Segment labels show "start-end: text"
};

struct TranscriptionConfig {
    TranscriptMode mode = TranscriptMode::Allow;
    std::string model_path = "models/ggml-base.en.bin";
    std::string language = "en";
    int threads = 0; // 0 = hardware concurrency
    double window_seconds = 30.0;
    bool word_timestamps = true;
};

struct PlayerConfig {
    AudioOutputConfig output;
    PlaybackConfig playback;
    TranscriptionConfig transcription;
};

std::string transcript_mode_to_string(TranscriptMode mode);
bool parse_transcript_mode(const std::string& name, TranscriptMode& out);

class ConfigModule {
public:
    // Writes a default config when `filepath` does not exist.
    std::expected<PlayerConfig, ConfigError> load_or_create_config(const std::string& filepath);

    std::expected<PlayerConfig, ConfigError> parse_config(const std::string& text);

    bool save_config(const PlayerConfig& config, const std::string& filepath);
};

} // namespace voxplay::modules
