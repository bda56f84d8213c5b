#pragma once

#include <expected>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "modules/container_reader.hpp"
#include "modules/media_types.hpp"
#include "modules/sample_converter.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
}

namespace voxplay::modules {

struct DecoderMetadata {
    PcmFormat format;
    double estimated_duration_sec = 0.0; // From the container header; 0 if unknown.
    std::string codec_name;
};

// Decode strategy for one container format. A decoder yields a finite,
// non-restartable sequence of PCM blocks: once next_block() returns
// std::nullopt (or an error) it keeps doing so.
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual AudioFormat format() const = 0;

    // Unsupported codec variants are reported here, not mid-stream.
    virtual std::expected<void, MediaError> open(std::shared_ptr<const Source> source) = 0;

    virtual std::expected<std::optional<PcmBlock>, MediaError> next_block() = 0;

    virtual const DecoderMetadata& metadata() const = 0;

    // Releases the container and codec (and any file handle).
    virtual void close() = 0;
};

// Shared FFmpeg pipeline. Strategies differ in the demuxer they force and
// the codecs they accept.
class FFmpegAudioDecoder : public AudioDecoder {
public:
    ~FFmpegAudioDecoder() override;

    AudioFormat format() const override { return this->format_; }
    std::expected<void, MediaError> open(std::shared_ptr<const Source> source) override;
    std::expected<std::optional<PcmBlock>, MediaError> next_block() override;
    const DecoderMetadata& metadata() const override { return this->metadata_; }
    void close() override;

protected:
    FFmpegAudioDecoder(AudioFormat format, const char* demuxer, std::initializer_list<AVCodecID> accepted);

private:
    bool accepts(AVCodecID id) const;
    // Converts every frame the codec has ready into `block`.
    std::expected<void, MediaError> drain_frames(PcmBlock& block);

    AudioFormat format_;
    const char* demuxer_;
    std::vector<AVCodecID> accepted_codecs_;

    ContainerReader container_;
    AVCodecContext* codec_ctx_ = nullptr;
    AVFrame* frame_ = nullptr;
    SampleConverter converter_;
    int stream_index_ = -1;
    int consecutive_failures_ = 0;
    bool flushing_ = false;
    bool finished_ = false;
    std::optional<MediaError> failure_;
    DecoderMetadata metadata_;
};

class Mp3Decoder final : public FFmpegAudioDecoder {
public:
    Mp3Decoder();
};

class M4aDecoder final : public FFmpegAudioDecoder {
public:
    M4aDecoder();
};

class WavDecoder final : public FFmpegAudioDecoder {
public:
    WavDecoder();
};

class FlacDecoder final : public FFmpegAudioDecoder {
public:
    FlacDecoder();
};

std::unique_ptr<AudioDecoder> create_decoder(AudioFormat format);

} // namespace voxplay::modules
