#include "modules/config_module.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

namespace voxplay::modules {

std::string transcript_mode_to_string(TranscriptMode mode) {
    switch (mode) {
        case TranscriptMode::None: return "none";
        case TranscriptMode::Allow: return "allow";
        case TranscriptMode::Label: return "label";
        case TranscriptMode::Timestamps: return "timestamps";
    }
    return "allow";
}

bool parse_transcript_mode(const std::string& name, TranscriptMode& out) {
    if (name == "none") { out = TranscriptMode::None; return true; }
    if (name == "allow") { out = TranscriptMode::Allow; return true; }
    if (name == "label") { out = TranscriptMode::Label; return true; }
    if (name == "timestamps") { out = TranscriptMode::Timestamps; return true; }
    return false;
}

bool ConfigModule::save_config(const PlayerConfig& config, const std::string& filepath) {
    nlohmann::json j;

    j["output"]["device"] = config.output.device;
    j["output"]["fallback_devices"] = config.output.fallback_devices;
    j["output"]["sample_rate"] = config.output.sample_rate;
    j["output"]["channels"] = config.output.channels;
    j["output"]["buffer_ms"] = config.output.buffer_ms;
    j["output"]["period_ms"] = config.output.period_ms;

    j["playback"]["prebuffer_ms"] = config.playback.prebuffer_ms;
    j["playback"]["ring_buffer_ms"] = config.playback.ring_buffer_ms;
    j["playback"]["volume"] = config.playback.volume;

    j["transcription"]["mode"] = transcript_mode_to_string(config.transcription.mode);
    j["transcription"]["model_path"] = config.transcription.model_path;
    j["transcription"]["language"] = config.transcription.language;
    j["transcription"]["threads"] = config.transcription.threads;
    j["transcription"]["window_seconds"] = config.transcription.window_seconds;
    j["transcription"]["word_timestamps"] = config.transcription.word_timestamps;

    std::ofstream out(filepath);
    if (!out.is_open()) {
        std::cerr << "Config: cannot write " << filepath << "\n";
        return false;
    }
    out << j.dump(4);
    return static_cast<bool>(out);
}

std::expected<PlayerConfig, ConfigError> ConfigModule::parse_config(const std::string& text) {
    PlayerConfig config;
    try {
        auto j = nlohmann::json::parse(text);

        if (j.contains("output")) {
            const auto& o = j["output"];
            config.output.device = o.value("device", config.output.device);
            if (o.contains("fallback_devices") && o["fallback_devices"].is_array()) {
                config.output.fallback_devices.clear();
                for (const auto& item : o["fallback_devices"]) {
                    if (item.is_string()) config.output.fallback_devices.push_back(item.get<std::string>());
                }
            }
            config.output.sample_rate = o.value("sample_rate", config.output.sample_rate);
            config.output.channels = o.value("channels", config.output.channels);
            config.output.buffer_ms = o.value("buffer_ms", config.output.buffer_ms);
            config.output.period_ms = o.value("period_ms", config.output.period_ms);
        }

        if (j.contains("playback")) {
            const auto& p = j["playback"];
            config.playback.prebuffer_ms = p.value("prebuffer_ms", config.playback.prebuffer_ms);
            config.playback.ring_buffer_ms = p.value("ring_buffer_ms", config.playback.ring_buffer_ms);
            config.playback.volume = p.value("volume", config.playback.volume);
        }

        if (j.contains("transcription")) {
            const auto& t = j["transcription"];
            std::string mode = t.value("mode", transcript_mode_to_string(config.transcription.mode));
            if (!parse_transcript_mode(mode, config.transcription.mode)) {
                std::cerr << "Config: unknown transcription mode '" << mode << "', using 'allow'\n";
                config.transcription.mode = TranscriptMode::Allow;
            }
            config.transcription.model_path = t.value("model_path", config.transcription.model_path);
            config.transcription.language = t.value("language", config.transcription.language);
            config.transcription.threads = t.value("threads", config.transcription.threads);
            config.transcription.window_seconds = t.value("window_seconds", config.transcription.window_seconds);
            config.transcription.word_timestamps = t.value("word_timestamps", config.transcription.word_timestamps);
        }
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Config Parse Error: " << e.what() << "\n";
        return std::unexpected(ConfigError::ParseError);
    } catch (const std::exception& e) {
        std::cerr << "Config Parse Error: " << e.what() << "\n";
        return std::unexpected(ConfigError::ParseError);
    }
    return config;
}

std::expected<PlayerConfig, ConfigError> ConfigModule::load_or_create_config(const std::string& filepath) {
    std::ifstream in(filepath);
    if (!in.is_open()) {
        std::cout << "[Config] Not found at " << filepath << ". Generating default config.\n";
        PlayerConfig config;
        if (!this->save_config(config, filepath)) {
            std::cerr << "[Config] Continuing with in-memory defaults\n";
        }
        return config;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return this->parse_config(buffer.str());
}

} // namespace voxplay::modules
