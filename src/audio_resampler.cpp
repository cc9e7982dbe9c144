#include "bragi/audio_resampler.h"
#include <utility>
#include <vector>

extern "C" {
    #include <libavutil/channel_layout.h>
    #include <libavutil/opt.h>
    #include <libavutil/samplefmt.h>
    #include <libswresample/swresample.h>
}

namespace bragi {

bool AudioResampler::convert(const AudioClip& input, int sample_rate, int channels, AudioClip& output) {
    last_error_.clear();

    if (input.sample_rate <= 0 || input.channels <= 0 || sample_rate <= 0 || channels <= 0) {
        last_error_ = "Invalid sample format for conversion";
        return false;
    }

    if (input.sample_rate == sample_rate && input.channels == channels) {
        output = input;
        return true;
    }

    if (input.empty()) {
        output = AudioClip(std::vector<float>(), sample_rate, channels);
        return true;
    }

    SwrContext* swr_ctx = swr_alloc();
    if (!swr_ctx) {
        last_error_ = "Cannot allocate resampler";
        return false;
    }

    AVChannelLayout in_layout;
    AVChannelLayout out_layout;
    av_channel_layout_default(&in_layout, input.channels);
    av_channel_layout_default(&out_layout, channels);
    av_opt_set_chlayout(swr_ctx, "in_chlayout", &in_layout, 0);
    av_opt_set_chlayout(swr_ctx, "out_chlayout", &out_layout, 0);
    av_opt_set_int(swr_ctx, "in_sample_rate", input.sample_rate, 0);
    av_opt_set_int(swr_ctx, "out_sample_rate", sample_rate, 0);
    av_opt_set_sample_fmt(swr_ctx, "in_sample_fmt", AV_SAMPLE_FMT_FLT, 0);
    av_opt_set_sample_fmt(swr_ctx, "out_sample_fmt", AV_SAMPLE_FMT_FLT, 0);
    av_channel_layout_uninit(&in_layout);
    av_channel_layout_uninit(&out_layout);

    if (swr_init(swr_ctx) < 0) {
        last_error_ = "Cannot initialize resampler";
        swr_free(&swr_ctx);
        return false;
    }

    int in_frames = static_cast<int>(input.frames());
    int capacity = swr_get_out_samples(swr_ctx, in_frames);
    if (capacity <= 0) {
        capacity = in_frames;
    }

    std::vector<float> samples(static_cast<size_t>(capacity) * channels);
    const uint8_t* in = reinterpret_cast<const uint8_t*>(input.samples.data());
    uint8_t* out = reinterpret_cast<uint8_t*>(samples.data());

    int converted = swr_convert(swr_ctx, &out, capacity, &in, in_frames);
    if (converted < 0) {
        last_error_ = "Resampling failed";
        swr_free(&swr_ctx);
        return false;
    }

    size_t total = static_cast<size_t>(converted);

    // Flush delayed samples
    int pending = swr_get_out_samples(swr_ctx, 0);
    if (pending > 0) {
        samples.resize((total + static_cast<size_t>(pending)) * channels);
        out = reinterpret_cast<uint8_t*>(samples.data() + total * channels);
        int flushed = swr_convert(swr_ctx, &out, pending, nullptr, 0);
        if (flushed > 0) {
            total += static_cast<size_t>(flushed);
        }
    }

    swr_free(&swr_ctx);

    samples.resize(total * channels);
    output = AudioClip(std::move(samples), sample_rate, channels);
    return true;
}

} // namespace bragi
