#pragma once

#include <cstdint>
#include <expected>
#include <vector>
#include "modules/media_types.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace voxplay::modules {

// libswresample wrapper converting to a packed (interleaved) output format.
// Output is appended to caller-owned vectors so that steady-state use
// reuses their capacity.
class SampleConverter {
public:
    SampleConverter() = default;
    ~SampleConverter();

    SampleConverter(const SampleConverter&) = delete;
    SampleConverter& operator=(const SampleConverter&) = delete;

    // Arbitrary input (as a decoder frame describes it) to packed output.
    std::expected<void, MediaError> configure(const AVChannelLayout& in_layout, AVSampleFormat in_format, int in_rate,
                                              int out_channels, AVSampleFormat out_format, int out_rate);

    // Interleaved S16 input with a default channel layout.
    std::expected<void, MediaError> configure_s16(const PcmFormat& in, int out_channels, AVSampleFormat out_format,
                                                  int out_rate);

    // True when input and output are identical S16 and no resampling runs.
    bool is_passthrough() const { return this->passthrough_; }

    // `in` holds one pointer per plane (one for packed input). Returns the
    // number of output frames appended, or a negative FFmpeg error.
    template <typename T>
    int convert(const uint8_t** in, int in_frames, std::vector<T>& out) {
        return this->convert_bytes(in, in_frames, out, sizeof(T));
    }

    // Drains resampler delay at end of stream.
    template <typename T>
    int flush(std::vector<T>& out) {
        return this->convert_bytes(nullptr, 0, out, sizeof(T));
    }

    // Drops buffered resampler state, e.g. after a seek.
    void reset();

private:
    template <typename T>
    int convert_bytes(const uint8_t** in, int in_frames, std::vector<T>& out, size_t sample_size) {
        if (!this->swr_ctx_) return AVERROR(EINVAL);
        int capacity = swr_get_out_samples(this->swr_ctx_, in_frames);
        if (capacity <= 0) return 0;
        size_t old_size = out.size();
        size_t samples = static_cast<size_t>(capacity) * this->out_channels_;
        size_t elems = (samples * this->out_bytes_per_sample_ + sample_size - 1) / sample_size;
        out.resize(old_size + elems);
        uint8_t* dst = reinterpret_cast<uint8_t*>(out.data() + old_size);
        int produced = swr_convert(this->swr_ctx_, &dst, capacity, in, in_frames);
        if (produced < 0) {
            out.resize(old_size);
            return produced;
        }
        size_t used = (static_cast<size_t>(produced) * this->out_channels_ * this->out_bytes_per_sample_ +
                       sample_size - 1) / sample_size;
        out.resize(old_size + used);
        return produced;
    }

    SwrContext* swr_ctx_ = nullptr;
    int out_channels_ = 0;
    int out_rate_ = 0;
    int out_bytes_per_sample_ = 0;
    bool passthrough_ = false;
};

} // namespace voxplay::modules
