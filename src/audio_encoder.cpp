#include "bragi/audio_encoder.h"
#include "bragi/errors.h"
#include "file_utils.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>

extern "C" {
    #include <libavformat/avformat.h>
    #include <libavcodec/avcodec.h>
    #include <libavutil/avutil.h>
    #include <libavutil/channel_layout.h>
    #include <libavutil/opt.h>
    #include <libswresample/swresample.h>
}

namespace bragi {

AudioContainer container_from_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".wav") {
        return AudioContainer::Wav;
    }
    return AudioContainer::Mp3;
}

const char* container_extension(AudioContainer container) {
    return container == AudioContainer::Wav ? "wav" : "mp3";
}

namespace {

// Owns every FFmpeg object of one encode
class EncoderSession {
public:
    ~EncoderSession() {
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (swr_ctx) swr_free(&swr_ctx);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
        if (format_ctx) {
            if (format_ctx->pb && !(format_ctx->oformat->flags & AVFMT_NOFILE)) {
                avio_closep(&format_ctx->pb);
            }
            avformat_free_context(format_ctx);
        }
    }

    bool open(const std::string& path, AudioContainer container,
              int sample_rate, int channels, int bitrate);
    bool encode(const float* samples, size_t frames);
    bool finish();

    std::string error;

private:
    bool send_frame(const AVFrame* input);

    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    AVStream* stream = nullptr;
    SwrContext* swr_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    int channels_ = 1;
    int64_t next_pts_ = 0;
};

const AVCodec* find_encoder(AudioContainer container) {
    if (container == AudioContainer::Wav) {
        return avcodec_find_encoder(AV_CODEC_ID_PCM_S16LE);
    }
    const AVCodec* codec = avcodec_find_encoder_by_name("libmp3lame");
    if (!codec) {
        codec = avcodec_find_encoder(AV_CODEC_ID_MP3);
    }
    return codec;
}

bool EncoderSession::open(const std::string& path, AudioContainer container,
                          int sample_rate, int channels, int bitrate) {
    channels_ = channels;

    const char* format_name = container_extension(container);
    if (avformat_alloc_output_context2(&format_ctx, nullptr, format_name, path.c_str()) < 0 || !format_ctx) {
        error = std::string("Cannot allocate ") + format_name + " output context";
        return false;
    }

    const AVCodec* codec = find_encoder(container);
    if (!codec) {
        error = std::string("No encoder available for ") + format_name;
        return false;
    }

    stream = avformat_new_stream(format_ctx, nullptr);
    codec_ctx = avcodec_alloc_context3(codec);
    if (!stream || !codec_ctx) {
        error = "Cannot allocate encoder";
        return false;
    }

    codec_ctx->sample_rate = sample_rate;
    av_channel_layout_default(&codec_ctx->ch_layout, channels);
    codec_ctx->time_base = AVRational{1, sample_rate};

    if (container == AudioContainer::Wav) {
        codec_ctx->sample_fmt = AV_SAMPLE_FMT_S16;
    } else {
        codec_ctx->sample_fmt = codec->sample_fmts ? codec->sample_fmts[0] : AV_SAMPLE_FMT_S16P;
        codec_ctx->bit_rate = bitrate;
    }

    if (format_ctx->oformat->flags & AVFMT_GLOBALHEADER) {
        codec_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    if (avcodec_open2(codec_ctx, codec, nullptr) < 0) {
        error = std::string("Cannot open ") + codec->name + " encoder at " +
                std::to_string(sample_rate) + "Hz";
        return false;
    }

    if (avcodec_parameters_from_context(stream->codecpar, codec_ctx) < 0) {
        error = "Cannot copy encoder parameters";
        return false;
    }
    stream->time_base = codec_ctx->time_base;

    if (!(format_ctx->oformat->flags & AVFMT_NOFILE)) {
        if (avio_open(&format_ctx->pb, path.c_str(), AVIO_FLAG_WRITE) < 0) {
            error = "Cannot open output file";
            return false;
        }
    }

    if (avformat_write_header(format_ctx, nullptr) < 0) {
        error = "Cannot write container header";
        return false;
    }

    // Interleaved float in, encoder layout out (same rate)
    swr_ctx = swr_alloc();
    if (!swr_ctx) {
        error = "Cannot allocate resampler";
        return false;
    }
    av_opt_set_chlayout(swr_ctx, "in_chlayout", &codec_ctx->ch_layout, 0);
    av_opt_set_chlayout(swr_ctx, "out_chlayout", &codec_ctx->ch_layout, 0);
    av_opt_set_int(swr_ctx, "in_sample_rate", sample_rate, 0);
    av_opt_set_int(swr_ctx, "out_sample_rate", sample_rate, 0);
    av_opt_set_sample_fmt(swr_ctx, "in_sample_fmt", AV_SAMPLE_FMT_FLT, 0);
    av_opt_set_sample_fmt(swr_ctx, "out_sample_fmt", codec_ctx->sample_fmt, 0);
    if (swr_init(swr_ctx) < 0) {
        error = "Cannot initialize resampler";
        return false;
    }

    packet = av_packet_alloc();
    frame = av_frame_alloc();
    if (!packet || !frame) {
        error = "Cannot allocate packet or frame";
        return false;
    }
    return true;
}

bool EncoderSession::send_frame(const AVFrame* input) {
    if (avcodec_send_frame(codec_ctx, input) < 0) {
        error = "Encoder rejected frame";
        return false;
    }

    while (true) {
        int ret = avcodec_receive_packet(codec_ctx, packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            error = "Encoding failed";
            return false;
        }

        av_packet_rescale_ts(packet, codec_ctx->time_base, stream->time_base);
        packet->stream_index = stream->index;
        ret = av_interleaved_write_frame(format_ctx, packet);
        av_packet_unref(packet);
        if (ret < 0) {
            error = "Cannot write packet";
            return false;
        }
    }
}

bool EncoderSession::encode(const float* samples, size_t frames) {
    bool variable_size = (codec_ctx->codec->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE) != 0;
    bool small_last = (codec_ctx->codec->capabilities & AV_CODEC_CAP_SMALL_LAST_FRAME) != 0;
    bool fixed_size = codec_ctx->frame_size > 0 && !variable_size;
    int frame_size = fixed_size ? codec_ctx->frame_size : 1024;

    size_t offset = 0;
    while (offset < frames) {
        int chunk = static_cast<int>(std::min<size_t>(frame_size, frames - offset));
        // Fixed-size encoders without short-frame support get a zero-padded tail
        int frame_samples = (chunk < frame_size && fixed_size && !small_last) ? frame_size : chunk;

        av_frame_unref(frame);
        frame->nb_samples = frame_samples;
        frame->format = codec_ctx->sample_fmt;
        frame->sample_rate = codec_ctx->sample_rate;
        if (av_channel_layout_copy(&frame->ch_layout, &codec_ctx->ch_layout) < 0 ||
            av_frame_get_buffer(frame, 0) < 0) {
            error = "Cannot allocate frame buffer";
            return false;
        }
        if (frame_samples > chunk) {
            av_samples_set_silence(frame->extended_data, 0, frame_samples,
                                   channels_, codec_ctx->sample_fmt);
        }

        const uint8_t* in = reinterpret_cast<const uint8_t*>(samples + offset * channels_);
        if (swr_convert(swr_ctx, frame->extended_data, chunk, &in, chunk) < 0) {
            error = "Sample conversion failed";
            return false;
        }

        frame->pts = next_pts_;
        next_pts_ += frame_samples;

        if (!send_frame(frame)) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

bool EncoderSession::finish() {
    if (!send_frame(nullptr)) {
        return false;
    }
    if (av_write_trailer(format_ctx) < 0) {
        error = "Cannot write container trailer";
        return false;
    }
    if (format_ctx->pb && !(format_ctx->oformat->flags & AVFMT_NOFILE)) {
        avio_closep(&format_ctx->pb);
    }
    return true;
}

} // namespace

void export_audio(const AudioClip& clip,
                  const std::string& destination,
                  AudioContainer container,
                  int mp3_bitrate) {
    if (clip.sample_rate <= 0 || clip.channels <= 0) {
        throw ResourceError("Cannot export audio with an invalid format: " + destination);
    }

    std::string partial = detail::partial_path_for(destination);
    std::string error;
    {
        EncoderSession session;
        bool ok = session.open(partial, container, clip.sample_rate, clip.channels, mp3_bitrate) &&
                  session.encode(clip.samples.data(), clip.frames()) &&
                  session.finish();
        if (!ok) {
            error = session.error;
        }
    }

    if (!error.empty()) {
        std::error_code ec;
        std::filesystem::remove(partial, ec);
        std::cerr << "[Bragi] Audio export failed: " << error << "\n";
        throw ResourceError("Failed to write audio file " + destination + ": " + error);
    }

    detail::commit_partial(partial, destination);

    std::cout << "[Bragi] Wrote " << clip.duration() << "s of "
              << container_extension(container) << " audio to " << destination << "\n";
}

} // namespace bragi
