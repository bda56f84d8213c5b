#include "modules/config_validator.hpp"

namespace voxplay::modules {

std::vector<std::string> ConfigValidator::validate(const PlayerConfig& config) {
    std::vector<std::string> errors;

    auto check_positive = [&](int val, const std::string& name) {
        if (val <= 0) {
            errors.push_back(name + " must be positive: " + std::to_string(val));
        }
    };

    // 1. Output device
    const auto& out = config.output;
    if (out.device.empty()) {
        errors.push_back("output.device is empty.");
    }
    for (size_t i = 0; i < out.fallback_devices.size(); ++i) {
        if (out.fallback_devices[i].empty()) {
            errors.push_back("output.fallback_devices[" + std::to_string(i) + "] is empty.");
        }
    }
    if (out.sample_rate != 0 && (out.sample_rate < 8000 || out.sample_rate > 192000)) {
        errors.push_back("output.sample_rate out of range [8000, 192000] (0 = source rate): " +
                         std::to_string(out.sample_rate));
    }
    if (out.channels < 0 || out.channels > 8) {
        errors.push_back("output.channels out of range [0, 8]: " + std::to_string(out.channels));
    }
    check_positive(out.buffer_ms, "output.buffer_ms");
    check_positive(out.period_ms, "output.period_ms");
    if (out.period_ms > 0 && out.buffer_ms > 0 && out.period_ms > out.buffer_ms) {
        errors.push_back("output.period_ms (" + std::to_string(out.period_ms) + ") exceeds output.buffer_ms (" +
                         std::to_string(out.buffer_ms) + ")");
    }

    // 2. Playback buffering
    check_positive(config.playback.prebuffer_ms, "playback.prebuffer_ms");
    check_positive(config.playback.ring_buffer_ms, "playback.ring_buffer_ms");
    if (config.playback.volume < 0 || config.playback.volume > 100) {
        errors.push_back("playback.volume out of range [0, 100]: " + std::to_string(config.playback.volume));
    }

    // 3. Transcription
    const auto& tr = config.transcription;
    if (tr.mode != TranscriptMode::None && tr.model_path.empty()) {
        errors.push_back("transcription.model_path is empty while transcription is enabled.");
    }
    if (tr.window_seconds < 1.0 || tr.window_seconds > 30.0) {
        errors.push_back("transcription.window_seconds out of range [1, 30]: " + std::to_string(tr.window_seconds));
    }
    if (tr.threads < 0) {
        errors.push_back("transcription.threads must not be negative: " + std::to_string(tr.threads));
    }

    return errors;
}

} // namespace voxplay::modules
