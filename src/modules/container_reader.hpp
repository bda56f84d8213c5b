#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include "modules/media_types.hpp"

extern "C" {
#include <libavformat/avformat.h>
}

namespace voxplay::modules {

// Demuxer over a path or an in-memory buffer. The container (and the
// file handle FFmpeg holds for path inputs) is released by close() or
// on destruction.
class ContainerReader {
public:
    ContainerReader();
    ~ContainerReader();

    ContainerReader(const ContainerReader&) = delete;
    ContainerReader& operator=(const ContainerReader&) = delete;

    // `demuxer` forces an FFmpeg input format by short name; nullptr probes.
    std::expected<void, MediaError> open(std::shared_ptr<const Source> source, const char* demuxer);
    void close();
    bool is_open() const { return this->format_ctx_ != nullptr; }

    int find_audio_stream() const;
    bool has_video_stream() const;
    AVCodecParameters* get_codec_params(int stream_index) const;
    double duration_seconds() const;

    // Next packet of any stream; nullptr at end of stream.
    std::expected<AVPacket*, MediaError> read_packet();

private:
    struct MemoryInput {
        const uint8_t* data = nullptr;
        size_t size = 0;
        size_t pos = 0;
    };

    static int read_memory(void* opaque, uint8_t* buf, int buf_size);
    static int64_t seek_memory(void* opaque, int64_t offset, int whence);

    AVFormatContext* format_ctx_ = nullptr;
    AVIOContext* avio_ctx_ = nullptr;
    AVPacket* packet_ = nullptr;
    MemoryInput memory_;
    std::shared_ptr<const Source> source_;
};

} // namespace voxplay::modules
