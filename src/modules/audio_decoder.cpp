#include "modules/audio_decoder.hpp"
#include <iostream>

namespace voxplay::modules {

namespace {
// Isolated bad packets are skipped; a run longer than this ends the stream.
constexpr int kMaxConsecutiveFailures = 8;
constexpr size_t kBlockFrames = 4096;
}

FFmpegAudioDecoder::FFmpegAudioDecoder(AudioFormat format, const char* demuxer,
                                       std::initializer_list<AVCodecID> accepted)
    : format_(format), demuxer_(demuxer), accepted_codecs_(accepted) {
    this->frame_ = av_frame_alloc();
}

FFmpegAudioDecoder::~FFmpegAudioDecoder() {
    this->close();
    if (this->frame_) {
        av_frame_free(&this->frame_);
    }
}

bool FFmpegAudioDecoder::accepts(AVCodecID id) const {
    for (AVCodecID accepted : this->accepted_codecs_) {
        if (accepted == id) return true;
    }
    return false;
}

void FFmpegAudioDecoder::close() {
    if (this->codec_ctx_) {
        avcodec_free_context(&this->codec_ctx_);
    }
    this->container_.close();
    this->stream_index_ = -1;
}

std::expected<void, MediaError> FFmpegAudioDecoder::open(std::shared_ptr<const Source> source) {
    this->close();
    this->flushing_ = false;
    this->finished_ = false;
    this->failure_.reset();
    this->consecutive_failures_ = 0;
    if (!this->frame_) return std::unexpected(MediaError::InternalError);

    auto opened = this->container_.open(std::move(source), this->demuxer_);
    if (!opened) return std::unexpected(opened.error());

    if (this->container_.has_video_stream()) {
        std::cerr << "[Decoder] Container carries video; only audio sources are supported\n";
        this->close();
        return std::unexpected(MediaError::UnsupportedFormat);
    }

    this->stream_index_ = this->container_.find_audio_stream();
    AVCodecParameters* params = this->container_.get_codec_params(this->stream_index_);
    if (!params) {
        std::cerr << "[Decoder] No audio stream found\n";
        this->close();
        return std::unexpected(MediaError::UnsupportedFormat);
    }

    if (!this->accepts(params->codec_id)) {
        std::cerr << "[Decoder] Codec '" << avcodec_get_name(params->codec_id) << "' is not supported in "
                  << format_name(this->format_) << " sources\n";
        this->close();
        return std::unexpected(MediaError::UnsupportedFormat);
    }

    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        std::cerr << "[Decoder] FFmpeg build lacks a decoder for '" << avcodec_get_name(params->codec_id) << "'\n";
        this->close();
        return std::unexpected(MediaError::UnsupportedFormat);
    }

    this->codec_ctx_ = avcodec_alloc_context3(codec);
    if (!this->codec_ctx_) {
        this->close();
        return std::unexpected(MediaError::InternalError);
    }
    if (avcodec_parameters_to_context(this->codec_ctx_, params) < 0 ||
        avcodec_open2(this->codec_ctx_, codec, nullptr) < 0) {
        std::cerr << "[Decoder] Failed to open codec " << codec->name << "\n";
        this->close();
        return std::unexpected(MediaError::DecodeError);
    }

    int channels = this->codec_ctx_->ch_layout.nb_channels;
    int rate = this->codec_ctx_->sample_rate;
    if (channels <= 0 || rate <= 0) {
        std::cerr << "[Decoder] Stream reports no sample rate or channel layout\n";
        this->close();
        return std::unexpected(MediaError::DecodeError);
    }

    auto configured = this->converter_.configure(this->codec_ctx_->ch_layout, this->codec_ctx_->sample_fmt, rate,
                                                 channels, AV_SAMPLE_FMT_S16, rate);
    if (!configured) {
        this->close();
        return std::unexpected(configured.error());
    }

    this->metadata_.format = PcmFormat{rate, channels};
    this->metadata_.estimated_duration_sec = this->container_.duration_seconds();
    this->metadata_.codec_name = codec->name;

    std::cout << "[Decoder] " << format_name(this->format_) << " stream: " << codec->name << ", " << rate << " Hz, "
              << channels << " ch, ~" << this->metadata_.estimated_duration_sec << " s\n";
    return {};
}

std::expected<void, MediaError> FFmpegAudioDecoder::drain_frames(PcmBlock& block) {
    for (;;) {
        int ret = avcodec_receive_frame(this->codec_ctx_, this->frame_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return {};
        }
        if (ret < 0) {
            if (++this->consecutive_failures_ > kMaxConsecutiveFailures) {
                return std::unexpected(MediaError::DecodeError);
            }
            return {};
        }
        this->consecutive_failures_ = 0;

        int converted = this->converter_.convert(const_cast<const uint8_t**>(this->frame_->extended_data),
                                                 this->frame_->nb_samples, block.samples);
        av_frame_unref(this->frame_);
        if (converted < 0) {
            char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
            av_strerror(converted, err_buf, sizeof(err_buf));
            std::cerr << "[Decoder] swr_convert error: " << err_buf << "\n";
            return std::unexpected(MediaError::DecodeError);
        }
    }
}

std::expected<std::optional<PcmBlock>, MediaError> FFmpegAudioDecoder::next_block() {
    if (this->failure_) return std::unexpected(*this->failure_);
    if (this->finished_) return std::nullopt;
    if (!this->codec_ctx_) return std::unexpected(MediaError::InternalError);

    PcmBlock block;
    const size_t target = kBlockFrames * static_cast<size_t>(this->metadata_.format.channels);
    block.samples.reserve(target + target / 2);

    while (block.samples.size() < target) {
        auto drained = this->drain_frames(block);
        if (!drained) {
            this->failure_ = drained.error();
            break;
        }
        if (block.samples.size() >= target) break;

        if (this->flushing_) {
            this->converter_.flush(block.samples);
            this->finished_ = true;
            break;
        }

        auto packet = this->container_.read_packet();
        if (!packet) {
            std::cerr << "[Decoder] Demux error, stream truncated\n";
            this->failure_ = packet.error();
            break;
        }
        if (*packet == nullptr) {
            avcodec_send_packet(this->codec_ctx_, nullptr);
            this->flushing_ = true;
            continue;
        }
        if ((*packet)->stream_index != this->stream_index_) {
            continue;
        }

        int ret = avcodec_send_packet(this->codec_ctx_, *packet);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            if (++this->consecutive_failures_ > kMaxConsecutiveFailures) {
                std::cerr << "[Decoder] Too many corrupt packets, stopping\n";
                this->failure_ = MediaError::DecodeError;
                break;
            }
        }
    }

    if (this->finished_ || this->failure_) {
        // The container (and file handle) is not needed past the last block.
        this->close();
    }

    // Samples decoded before a failure are still delivered; the error
    // surfaces on the following call.
    if (!block.samples.empty()) return block;
    if (this->failure_) return std::unexpected(*this->failure_);
    return std::nullopt;
}

Mp3Decoder::Mp3Decoder()
    : FFmpegAudioDecoder(AudioFormat::Mp3, "mp3", {AV_CODEC_ID_MP3}) {}

M4aDecoder::M4aDecoder()
    : FFmpegAudioDecoder(AudioFormat::M4a, "mov", {AV_CODEC_ID_AAC, AV_CODEC_ID_ALAC}) {}

WavDecoder::WavDecoder()
    : FFmpegAudioDecoder(AudioFormat::Wav, "wav",
                         {AV_CODEC_ID_PCM_S16LE, AV_CODEC_ID_PCM_S24LE, AV_CODEC_ID_PCM_S32LE,
                          AV_CODEC_ID_PCM_F32LE, AV_CODEC_ID_PCM_F64LE, AV_CODEC_ID_PCM_U8,
                          AV_CODEC_ID_PCM_ALAW, AV_CODEC_ID_PCM_MULAW, AV_CODEC_ID_ADPCM_MS,
                          AV_CODEC_ID_ADPCM_IMA_WAV}) {}

FlacDecoder::FlacDecoder()
    : FFmpegAudioDecoder(AudioFormat::Flac, "flac", {AV_CODEC_ID_FLAC}) {}

std::unique_ptr<AudioDecoder> create_decoder(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return std::make_unique<Mp3Decoder>();
        case AudioFormat::M4a: return std::make_unique<M4aDecoder>();
        case AudioFormat::Wav: return std::make_unique<WavDecoder>();
        case AudioFormat::Flac: return std::make_unique<FlacDecoder>();
    }
    return nullptr;
}

} // namespace voxplay::modules
