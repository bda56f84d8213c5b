#include "modules/sample_converter.hpp"
#include <iostream>

namespace voxplay::modules {

SampleConverter::~SampleConverter() {
    if (this->swr_ctx_) {
        swr_free(&this->swr_ctx_);
    }
}

std::expected<void, MediaError> SampleConverter::configure(const AVChannelLayout& in_layout, AVSampleFormat in_format,
                                                           int in_rate, int out_channels, AVSampleFormat out_format,
                                                           int out_rate) {
    if (this->swr_ctx_) {
        swr_free(&this->swr_ctx_);
    }
    if (in_rate <= 0 || out_rate <= 0 || out_channels <= 0 || in_layout.nb_channels <= 0) {
        return std::unexpected(MediaError::InternalError);
    }

    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, out_channels);

    int ret = swr_alloc_set_opts2(&this->swr_ctx_,
                                  &out_layout, out_format, out_rate,
                                  &in_layout, in_format, in_rate,
                                  0, nullptr);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || !this->swr_ctx_ || swr_init(this->swr_ctx_) < 0) {
        std::cerr << "[Resampler] Failed to initialize " << in_rate << "Hz/" << in_layout.nb_channels << "ch -> "
                  << out_rate << "Hz/" << out_channels << "ch\n";
        if (this->swr_ctx_) swr_free(&this->swr_ctx_);
        return std::unexpected(MediaError::InternalError);
    }

    this->out_channels_ = out_channels;
    this->out_rate_ = out_rate;
    this->out_bytes_per_sample_ = av_get_bytes_per_sample(out_format);
    this->passthrough_ = in_format == AV_SAMPLE_FMT_S16 && out_format == AV_SAMPLE_FMT_S16 &&
                         in_rate == out_rate && in_layout.nb_channels == out_channels;
    return {};
}

std::expected<void, MediaError> SampleConverter::configure_s16(const PcmFormat& in, int out_channels,
                                                               AVSampleFormat out_format, int out_rate) {
    AVChannelLayout in_layout;
    av_channel_layout_default(&in_layout, in.channels);
    auto res = this->configure(in_layout, AV_SAMPLE_FMT_S16, in.sample_rate, out_channels, out_format, out_rate);
    av_channel_layout_uninit(&in_layout);
    return res;
}

void SampleConverter::reset() {
    if (this->swr_ctx_) {
        // swr_init on an initialized context discards buffered samples.
        swr_init(this->swr_ctx_);
    }
}

} // namespace voxplay::modules
