#include "bragi/audio_extractor.h"
#include "bragi/errors.h"
#include <iostream>
#include <utility>

extern "C" {
    #include <libavformat/avformat.h>
    #include <libavcodec/avcodec.h>
    #include <libavutil/avutil.h>
    #include <libavutil/channel_layout.h>
    #include <libswresample/swresample.h>
}

namespace bragi {

namespace {

// Decoder, resampler and scratch objects for one pass over a stream
struct DecodePass {
    AVCodecContext* codec_ctx = nullptr;
    SwrContext* swr_ctx = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* frame = nullptr;
    int channels = 1;

    ~DecodePass() {
        if (frame) av_frame_free(&frame);
        if (packet) av_packet_free(&packet);
        if (swr_ctx) swr_free(&swr_ctx);
        if (codec_ctx) avcodec_free_context(&codec_ctx);
    }

    // Resample into the tail of output; input == nullptr flushes
    bool resample(const uint8_t** input, int in_samples, std::vector<float>& output) {
        int out_samples = swr_get_out_samples(swr_ctx, in_samples);
        if (out_samples <= 0) {
            return true;
        }

        size_t old_size = output.size();
        output.resize(old_size + static_cast<size_t>(out_samples) * channels);
        uint8_t* out_buf = reinterpret_cast<uint8_t*>(output.data() + old_size);

        int converted = swr_convert(swr_ctx, &out_buf, out_samples, input, in_samples);
        if (converted < 0) {
            output.resize(old_size);
            return false;
        }
        output.resize(old_size + static_cast<size_t>(converted) * channels);
        return true;
    }

    bool receive_frames(std::vector<float>& output) {
        while (avcodec_receive_frame(codec_ctx, frame) >= 0) {
            bool ok = resample(const_cast<const uint8_t**>(frame->extended_data),
                               frame->nb_samples, output);
            av_frame_unref(frame);
            if (!ok) {
                return false;
            }
        }
        return true;
    }
};

} // namespace

// =======================
// AudioExtractor::Impl
// =======================

class AudioExtractor::Impl {
public:
    ~Impl() { close(); }

    AVFormatContext* format_ctx = nullptr;
    std::vector<int> audio_streams;     // Container indices of the audio streams
    std::string current_file;
    int64_t duration_ms = 0;

    bool open(const std::string& path, std::string& error);
    void close();

    /**
     * Decode one audio track to interleaved float32
     *
     * A sample rate or channel count of 0 keeps the track's own value.
     */
    bool decode(int track, int sample_rate, int channels, AudioClip& clip, std::string& error);

    bool is_open() const { return format_ctx != nullptr; }
};

bool AudioExtractor::Impl::open(const std::string& path, std::string& error)
{
    close();

    if (avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr) < 0) {
        error = "Cannot open file: " + path;
        return false;
    }

    if (avformat_find_stream_info(format_ctx, nullptr) < 0) {
        error = "Cannot find stream info: " + path;
        close();
        return false;
    }

    for (unsigned int i = 0; i < format_ctx->nb_streams; i++) {
        const AVCodecParameters* codecpar = format_ctx->streams[i]->codecpar;
        if (codecpar->codec_type == AVMEDIA_TYPE_AUDIO && avcodec_find_decoder(codecpar->codec_id)) {
            audio_streams.push_back(static_cast<int>(i));
        }
    }

    if (audio_streams.empty()) {
        error = "No decodable audio stream in: " + path;
        close();
        return false;
    }

    current_file = path;
    duration_ms = format_ctx->duration != AV_NOPTS_VALUE ? format_ctx->duration / 1000 : 0;
    return true;
}

void AudioExtractor::Impl::close()
{
    if (format_ctx) {
        avformat_close_input(&format_ctx);
    }
    audio_streams.clear();
    current_file.clear();
    duration_ms = 0;
}

bool AudioExtractor::Impl::decode(int track, int sample_rate, int channels,
                                  AudioClip& clip, std::string& error)
{
    AVStream* stream = format_ctx->streams[audio_streams[track]];
    const AVCodec* codec = avcodec_find_decoder(stream->codecpar->codec_id);

    DecodePass pass;
    pass.codec_ctx = avcodec_alloc_context3(codec);
    if (!pass.codec_ctx ||
        avcodec_parameters_to_context(pass.codec_ctx, stream->codecpar) < 0 ||
        avcodec_open2(pass.codec_ctx, codec, nullptr) < 0) {
        error = "Cannot open decoder for track " + std::to_string(track);
        return false;
    }

    int in_channels = pass.codec_ctx->ch_layout.nb_channels > 0 ? pass.codec_ctx->ch_layout.nb_channels : 1;
    if (sample_rate <= 0) sample_rate = pass.codec_ctx->sample_rate;
    if (channels <= 0) channels = in_channels;
    pass.channels = channels;

    AVChannelLayout in_layout = {};
    if (pass.codec_ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC ||
        av_channel_layout_copy(&in_layout, &pass.codec_ctx->ch_layout) < 0) {
        av_channel_layout_uninit(&in_layout);
        av_channel_layout_default(&in_layout, in_channels);
    }
    AVChannelLayout out_layout = {};
    av_channel_layout_default(&out_layout, channels);

    int ret = swr_alloc_set_opts2(&pass.swr_ctx,
                                  &out_layout, AV_SAMPLE_FMT_FLT, sample_rate,
                                  &in_layout, pass.codec_ctx->sample_fmt, pass.codec_ctx->sample_rate,
                                  0, nullptr);
    av_channel_layout_uninit(&in_layout);
    av_channel_layout_uninit(&out_layout);

    if (ret < 0 || !pass.swr_ctx || swr_init(pass.swr_ctx) < 0) {
        error = "Cannot initialize resampler";
        return false;
    }

    pass.packet = av_packet_alloc();
    pass.frame = av_frame_alloc();
    if (!pass.packet || !pass.frame) {
        error = "Cannot allocate packet or frame";
        return false;
    }

    std::vector<float> samples;
    if (format_ctx->duration > 0) {
        samples.reserve(static_cast<size_t>(format_ctx->duration * sample_rate / AV_TIME_BASE) * channels);
    }

    // Tracks decode independently, so start from the beginning every time
    av_seek_frame(format_ctx, -1, 0, AVSEEK_FLAG_BACKWARD);

    while (av_read_frame(format_ctx, pass.packet) >= 0) {
        bool ok = true;
        if (pass.packet->stream_index == stream->index &&
            avcodec_send_packet(pass.codec_ctx, pass.packet) >= 0) {
            ok = pass.receive_frames(samples);
        }
        av_packet_unref(pass.packet);
        if (!ok) {
            error = "Resampling failed";
            return false;
        }
    }

    // Drain decoder, then resampler
    bool drained = avcodec_send_packet(pass.codec_ctx, nullptr) < 0 || pass.receive_frames(samples);
    if (!drained || !pass.resample(nullptr, 0, samples)) {
        error = "Resampling failed";
        return false;
    }

    if (samples.empty()) {
        error = "No samples decoded";
        return false;
    }

    clip = AudioClip(std::move(samples), sample_rate, channels);
    return true;
}

// =======================
// AudioExtractor
// =======================

AudioExtractor::AudioExtractor()
    : pimpl_(std::make_unique<Impl>())
{
}

AudioExtractor::~AudioExtractor() = default;

bool AudioExtractor::open(const std::string& file_path)
{
    last_error_.clear();

    if (!pimpl_->open(file_path, last_error_)) {
        std::cerr << "[Bragi] " << last_error_ << "\n";
        return false;
    }

    std::cout << "[Bragi] Opened file with " << pimpl_->audio_streams.size()
              << " audio track(s), duration: " << (pimpl_->duration_ms / 1000.0) << "s\n";

    return true;
}

void AudioExtractor::close()
{
    pimpl_->close();
}

int AudioExtractor::get_track_count() const
{
    return static_cast<int>(pimpl_->audio_streams.size());
}

double AudioExtractor::get_duration() const
{
    return static_cast<double>(pimpl_->duration_ms) / 1000.0;
}

bool AudioExtractor::extract_track(int track_index, std::vector<float>& samples)
{
    last_error_.clear();

    if (!pimpl_->is_open()) {
        last_error_ = "No file is open";
        return false;
    }

    if (track_index < 0 || track_index >= get_track_count()) {
        last_error_ = "Invalid track index: " + std::to_string(track_index);
        return false;
    }

    AudioClip clip;
    std::string error;
    if (!pimpl_->decode(track_index, WHISPER_SAMPLE_RATE, 1, clip, error)) {
        last_error_ = "Failed to extract audio from track " + std::to_string(track_index) + ": " + error;
        std::cerr << "[Bragi] " << last_error_ << "\n";
        return false;
    }
    samples = std::move(clip.samples);

    std::cout << "[Bragi] Track " << track_index << ": extracted " << samples.size()
              << " samples (" << (samples.size() / static_cast<double>(WHISPER_SAMPLE_RATE)) << "s at 16kHz)\n";

    return true;
}

bool AudioExtractor::extract_audio(const std::string& file_path,
                                   std::vector<float>& samples,
                                   double& duration)
{
    if (!open(file_path)) {
        return false;
    }

    duration = get_duration();
    bool ok = extract_track(0, samples);
    close();

    if (ok && duration <= 0.0) {
        duration = samples.size() / static_cast<double>(WHISPER_SAMPLE_RATE);
    }
    return ok;
}

bool AudioExtractor::decode_clip(const std::string& file_path,
                                 AudioClip& clip,
                                 int sample_rate,
                                 int channels)
{
    last_error_.clear();

    // Own demuxer so an open multi-track file stays untouched
    Impl file;
    std::string error;
    if (!file.open(file_path, error) || !file.decode(0, sample_rate, channels, clip, error)) {
        last_error_ = error + " (" + file_path + ")";
        return false;
    }
    return true;
}

// =======================
// MediaAudioSource
// =======================

ExtractedAudio MediaAudioSource::extract(const std::string& media_path)
{
    AudioExtractor extractor;
    ExtractedAudio audio;
    audio.sample_rate = AudioExtractor::WHISPER_SAMPLE_RATE;

    if (!extractor.extract_audio(media_path, audio.samples, audio.duration)) {
        throw ExternalServiceError("Audio extraction failed: " + extractor.get_last_error());
    }
    return audio;
}

} // namespace bragi
