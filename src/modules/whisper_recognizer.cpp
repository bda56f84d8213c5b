#include "modules/whisper_recognizer.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <thread>
#include "whisper.h"

namespace voxplay::modules {

namespace {

bool is_verbose() {
    return std::getenv("VOXPLAY_WHISPER_DEBUG") != nullptr;
}

// Keep errors and warnings; info/debug only when verbose.
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    default:
        if (is_verbose()) std::fputs(text, stderr);
        break;
    }
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

} // namespace

WhisperRecognizer::WhisperRecognizer(TranscriptionConfig config) : config_(std::move(config)) {}

WhisperRecognizer::~WhisperRecognizer() {
    if (this->ctx_) {
        whisper_free(this->ctx_);
    }
}

std::expected<void, RecognizerError> WhisperRecognizer::prepare() {
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (this->ctx_) return {};

    std::error_code ec;
    if (!std::filesystem::exists(this->config_.model_path, ec)) {
        std::cerr << "[whisper] model not found: " << this->config_.model_path << "\n";
        return std::unexpected(RecognizerError::ModelUnavailable);
    }

    whisper_log_set(log_cb, nullptr);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = false;
    std::cout << "[whisper] init from: " << this->config_.model_path << "\n";
    this->ctx_ = whisper_init_from_file_with_params(this->config_.model_path.c_str(), cparams);
    if (!this->ctx_) {
        std::cerr << "[whisper] init FAILED for path: " << this->config_.model_path << "\n";
        return std::unexpected(RecognizerError::ModelUnavailable);
    }
    return {};
}

std::expected<std::vector<RecognizedSegment>, RecognizerError> WhisperRecognizer::recognize(
    std::span<const float> pcm, const std::atomic<bool>& cancel) {
    std::lock_guard<std::mutex> lock(this->mutex_);
    if (!this->ctx_) return std::unexpected(RecognizerError::ModelUnavailable);
    if (pcm.empty()) return std::vector<RecognizedSegment>{};

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = is_verbose();
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = this->config_.language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = this->config_.threads > 0
                                   ? this->config_.threads
                                   : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    wparams.no_context       = true;
    wparams.suppress_blank   = true;

    // One segment per word.
    if (this->config_.word_timestamps) {
        wparams.token_timestamps = true;
        wparams.max_len          = 1;
        wparams.split_on_word    = true;
    }

    wparams.abort_callback = [](void* user_data) {
        return static_cast<const std::atomic<bool>*>(user_data)->load();
    };
    wparams.abort_callback_user_data = const_cast<std::atomic<bool>*>(&cancel);

    int ret = whisper_full(this->ctx_, wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (cancel.load()) {
        return std::unexpected(RecognizerError::Aborted);
    }
    if (ret != 0) {
        std::cerr << "[whisper] whisper_full FAILED, ret=" << ret << "\n";
        return std::unexpected(RecognizerError::InferenceFailed);
    }

    std::vector<RecognizedSegment> segments;
    const int n = whisper_full_n_segments(this->ctx_);
    segments.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text(this->ctx_, i);
        if (!txt) continue;
        std::string text = trim(txt);
        if (text.empty()) continue;
        // Non-speech markers such as [BLANK_AUDIO]
        if (text.size() > 2 && text.front() == '[' && text.back() == ']') continue;

        // t0/t1 are in 10 ms units
        RecognizedSegment seg;
        seg.text = std::move(text);
        seg.start_sec = static_cast<double>(whisper_full_get_segment_t0(this->ctx_, i)) / 100.0;
        seg.end_sec = static_cast<double>(whisper_full_get_segment_t1(this->ctx_, i)) / 100.0;
        segments.push_back(std::move(seg));
    }
    if (is_verbose()) whisper_print_timings(this->ctx_);
    return segments;
}

} // namespace voxplay::modules
