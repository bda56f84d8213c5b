#include "core/player.hpp"
#include <iostream>
#include "modules/alsa_output.hpp"
#include "modules/config_validator.hpp"
#include "modules/whisper_recognizer.hpp"
#include "utils/time_format.hpp"

namespace voxplay::core {

namespace {

modules::OutputFactory alsa_factory(const modules::AudioOutputConfig& config) {
    return [config]() -> std::unique_ptr<modules::AudioOutput> {
        return std::make_unique<modules::AlsaOutput>(config);
    };
}

} // namespace

Player::Player(modules::PlayerConfig config)
    : Player(config, alsa_factory(config.output),
             std::make_unique<modules::WhisperRecognizer>(config.transcription)) {}

Player::Player(modules::PlayerConfig config, modules::OutputFactory output_factory,
               std::unique_ptr<modules::SpeechRecognizer> recognizer)
    : config_(std::move(config)),
      playback_(std::move(output_factory), this->config_.output, this->config_.playback),
      transcription_(std::move(recognizer), this->config_.transcription),
      sync_(this->playback_, this->transcription_) {
    for (const auto& issue : modules::ConfigValidator::validate(this->config_)) {
        std::cerr << "[Config] " << issue << "\n";
    }
}

Player::~Player() {
    // Output first: the device thread must not outlive the buffers it reads.
    this->playback_.stop();
    this->transcription_.cancel();
}

std::expected<void, modules::MediaError> Player::load_file(const std::string& path) {
    return this->load(std::make_shared<const modules::Source>(modules::Source::from_path(path)));
}

std::expected<void, modules::MediaError> Player::load_bytes(std::vector<uint8_t> bytes) {
    return this->load(std::make_shared<const modules::Source>(modules::Source::from_bytes(std::move(bytes))));
}

std::expected<void, modules::MediaError> Player::load(std::shared_ptr<const modules::Source> source) {
    this->playback_.stop();
    this->transcription_.cancel();
    this->sync_.reset();
    // load() releases the previous DecodedAudio before decoding the new one.
    return this->playback_.load(std::move(source));
}

void Player::unload() {
    this->playback_.stop();
    this->transcription_.cancel();
    this->sync_.reset();
    this->playback_.unload();
}

std::expected<void, modules::MediaError> Player::play() {
    return this->playback_.play();
}

void Player::pause() {
    this->playback_.pause();
}

void Player::seek(double seconds) {
    this->playback_.seek(seconds);
    this->sync_.refresh();
}

void Player::stop() {
    this->playback_.stop();
    this->sync_.refresh();
}

void Player::set_volume(int volume) {
    this->playback_.set_volume(volume);
}

std::expected<TranscriptionEngine::RequestResult, TranscriptionError> Player::request_transcription() {
    if (this->config_.transcription.mode == modules::TranscriptMode::None) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "transcription is disabled"});
    }
    auto format = this->playback_.source_format();
    auto audio = this->playback_.decoded_audio();
    if (!format || !audio) {
        return std::unexpected(TranscriptionError{TranscriptionError::Kind::Permanent, "no audio loaded"});
    }
    return this->transcription_.transcribe(std::move(audio), *format);
}

void Player::cancel_transcription() {
    this->transcription_.cancel();
    this->sync_.reset();
}

void Player::tick() {
    this->sync_.refresh();
}

std::string Player::time_label() const {
    return utils::format_progress(this->playback_.position(), this->playback_.duration());
}

std::string Player::segment_label(size_t index) const {
    auto segments = this->sync_.segments();
    if (!segments || index >= segments->size()) return {};
    const TranscriptSegment& seg = (*segments)[index];
    if (this->config_.transcription.mode == modules::TranscriptMode::Timestamps) {
        return utils::format_duration(seg.start) + "-" + utils::format_duration(seg.end) + ": " + seg.text;
    }
    return seg.text;
}

} // namespace voxplay::core
