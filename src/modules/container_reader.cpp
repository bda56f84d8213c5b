#include "modules/container_reader.hpp"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>

extern "C" {
#include <libavutil/mem.h>
}

namespace voxplay::modules {

namespace {
constexpr int kAvioBufferSize = 4096;
}

ContainerReader::ContainerReader() {
    this->packet_ = av_packet_alloc();
}

ContainerReader::~ContainerReader() {
    this->close();
    if (this->packet_) {
        av_packet_free(&this->packet_);
    }
}

void ContainerReader::close() {
    if (this->format_ctx_) {
        avformat_close_input(&this->format_ctx_);
    }
    if (this->avio_ctx_) {
        // Custom IO is not owned by the format context.
        av_freep(&this->avio_ctx_->buffer);
        avio_context_free(&this->avio_ctx_);
    }
    this->memory_ = MemoryInput{};
    this->source_.reset();
}

int ContainerReader::read_memory(void* opaque, uint8_t* buf, int buf_size) {
    auto* in = static_cast<MemoryInput*>(opaque);
    size_t remaining = in->size - in->pos;
    if (remaining == 0) return AVERROR_EOF;
    size_t n = std::min(remaining, static_cast<size_t>(buf_size));
    std::memcpy(buf, in->data + in->pos, n);
    in->pos += n;
    return static_cast<int>(n);
}

int64_t ContainerReader::seek_memory(void* opaque, int64_t offset, int whence) {
    auto* in = static_cast<MemoryInput*>(opaque);
    if (whence & AVSEEK_SIZE) {
        return static_cast<int64_t>(in->size);
    }
    whence &= ~AVSEEK_FORCE;

    int64_t target = 0;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = static_cast<int64_t>(in->pos) + offset; break;
        case SEEK_END: target = static_cast<int64_t>(in->size) + offset; break;
        default: return AVERROR(EINVAL);
    }
    if (target < 0 || target > static_cast<int64_t>(in->size)) {
        return AVERROR(EINVAL);
    }
    in->pos = static_cast<size_t>(target);
    return target;
}

std::expected<void, MediaError> ContainerReader::open(std::shared_ptr<const Source> source, const char* demuxer) {
    this->close();
    if (!source || !this->packet_) return std::unexpected(MediaError::InternalError);
    this->source_ = std::move(source);

    const AVInputFormat* input_format = nullptr;
    if (demuxer) {
        input_format = av_find_input_format(demuxer);
        if (!input_format) {
            std::cerr << "[Container] FFmpeg build has no '" << demuxer << "' demuxer\n";
            this->close();
            return std::unexpected(MediaError::UnsupportedFormat);
        }
    }

    int err = 0;
    if (this->source_->is_path()) {
        std::cout << "[Container] Opening " << this->source_->path() << "\n";
        err = avformat_open_input(&this->format_ctx_, this->source_->path().c_str(), input_format, nullptr);
    } else {
        const auto& bytes = this->source_->bytes();
        this->memory_ = MemoryInput{bytes.data(), bytes.size(), 0};

        auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
        if (!buffer) {
            this->close();
            return std::unexpected(MediaError::InternalError);
        }
        this->avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 0, &this->memory_,
                                             &ContainerReader::read_memory, nullptr,
                                             &ContainerReader::seek_memory);
        if (!this->avio_ctx_) {
            av_free(buffer);
            this->close();
            return std::unexpected(MediaError::InternalError);
        }
        this->format_ctx_ = avformat_alloc_context();
        if (!this->format_ctx_) {
            this->close();
            return std::unexpected(MediaError::InternalError);
        }
        this->format_ctx_->pb = this->avio_ctx_;
        std::cout << "[Container] Opening " << this->source_->describe() << "\n";
        // On failure avformat_open_input frees the context and nulls the pointer.
        err = avformat_open_input(&this->format_ctx_, nullptr, input_format, nullptr);
    }

    if (err != 0) {
        char msg[AV_ERROR_MAX_STRING_SIZE] = {0};
        av_strerror(err, msg, sizeof(msg));
        std::cerr << "[Container] Open failed: " << msg << "\n";
        bool missing = err == AVERROR(ENOENT) || err == AVERROR(EACCES);
        this->close();
        return std::unexpected(missing ? MediaError::FileNotFound : MediaError::UnsupportedFormat);
    }

    if (avformat_find_stream_info(this->format_ctx_, nullptr) < 0) {
        this->close();
        return std::unexpected(MediaError::DecodeError);
    }

    std::cout << "[Container] Found " << this->format_ctx_->nb_streams << " streams ("
              << this->format_ctx_->iformat->name << ")\n";
    return {};
}

int ContainerReader::find_audio_stream() const {
    if (!this->format_ctx_) return -1;
    int index = av_find_best_stream(this->format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    return index >= 0 ? index : -1;
}

bool ContainerReader::has_video_stream() const {
    if (!this->format_ctx_) return false;
    for (unsigned int i = 0; i < this->format_ctx_->nb_streams; i++) {
        const AVStream* stream = this->format_ctx_->streams[i];
        // Embedded cover art is a still picture, not video.
        if (stream->codecpar->codec_type == AVMEDIA_TYPE_VIDEO &&
            !(stream->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
            return true;
        }
    }
    return false;
}

AVCodecParameters* ContainerReader::get_codec_params(int stream_index) const {
    if (!this->format_ctx_ || stream_index < 0 || stream_index >= static_cast<int>(this->format_ctx_->nb_streams)) {
        return nullptr;
    }
    return this->format_ctx_->streams[stream_index]->codecpar;
}

double ContainerReader::duration_seconds() const {
    if (!this->format_ctx_ || this->format_ctx_->duration == AV_NOPTS_VALUE || this->format_ctx_->duration < 0) {
        return 0.0;
    }
    return static_cast<double>(this->format_ctx_->duration) / AV_TIME_BASE;
}

std::expected<AVPacket*, MediaError> ContainerReader::read_packet() {
    if (!this->format_ctx_ || !this->packet_) return std::unexpected(MediaError::InternalError);
    av_packet_unref(this->packet_);
    int err = av_read_frame(this->format_ctx_, this->packet_);
    if (err == AVERROR_EOF) {
        return nullptr;
    }
    if (err < 0) {
        return std::unexpected(MediaError::DecodeError);
    }
    return this->packet_;
}

} // namespace voxplay::modules
