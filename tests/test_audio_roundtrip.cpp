/**
 * @file test_audio_roundtrip.cpp
 * @brief Export, decode and resample through FFmpeg
 */

#include <bragi/audio_encoder.h>
#include <bragi/audio_extractor.h>
#include <bragi/audio_resampler.h>
#include <bragi/errors.h>
#include <bragi/timeline.h>
#include "test_common.h"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;
using namespace bragi;

namespace {

AudioClip sine(int sample_rate, double seconds, double frequency = 440.0) {
    const double pi = 3.14159265358979323846;
    size_t frames = static_cast<size_t>(std::llround(seconds * sample_rate));
    std::vector<float> samples(frames);
    for (size_t i = 0; i < frames; ++i) {
        samples[i] = 0.5f * static_cast<float>(std::sin(2.0 * pi * frequency * i / sample_rate));
    }
    return AudioClip(std::move(samples), sample_rate, 1);
}

} // namespace

static void test_container_selection() {
    bragi_test::section("container from destination extension");

    CHECK(container_from_path("out.wav") == AudioContainer::Wav);
    CHECK(container_from_path("OUT.WAV") == AudioContainer::Wav);
    CHECK(container_from_path("out.mp3") == AudioContainer::Mp3);
    CHECK(container_from_path("out.Mp3") == AudioContainer::Mp3);
    CHECK(container_from_path("out.ogg") == AudioContainer::Mp3);
    CHECK(container_from_path("no_extension") == AudioContainer::Mp3);
    CHECK(std::string(container_extension(AudioContainer::Wav)) == "wav");
}

static void test_wav_round_trip(const fs::path& dir) {
    bragi_test::section("wav export and decode");

    fs::path dest = dir / "tone.wav";
    export_audio(sine(24000, 1.0), dest.string(), AudioContainer::Wav);

    CHECK(fs::exists(dest));
    CHECK(!fs::exists(dir / "tone.wav.partial"));

    AudioExtractor extractor;
    AudioClip decoded;
    CHECK(extractor.decode_clip(dest.string(), decoded));
    CHECK(decoded.sample_rate == 24000);
    CHECK(decoded.channels == 1);
    CHECK(bragi_test::near(decoded.duration(), 1.0, 0.01));

    MediaAudioSource source;
    ExtractedAudio audio = source.extract(dest.string());
    CHECK(audio.sample_rate == AudioExtractor::WHISPER_SAMPLE_RATE);
    CHECK(bragi_test::near(audio.duration, 1.0, 0.05));
    CHECK(bragi_test::near(audio.samples.size() / 16000.0, 1.0, 0.05));

    CHECK_THROWS(source.extract((dir / "missing.wav").string()), ExternalServiceError);
}

static void test_mp3_export(const fs::path& dir) {
    bragi_test::section("mp3 export");

    fs::path dest = dir / "tone.mp3";
    try {
        export_audio(sine(24000, 1.0), dest.string(), AudioContainer::Mp3);
    } catch (const ResourceError& e) {
        // FFmpeg builds without libmp3lame have no mp3 encoder
        std::cout << "  skipped: " << e.what() << "\n";
        return;
    }

    CHECK(fs::exists(dest));
    AudioExtractor extractor;
    AudioClip decoded;
    CHECK(extractor.decode_clip(dest.string(), decoded));
    CHECK(bragi_test::near(decoded.duration(), 1.0, 0.1));
}

static void test_export_failure(const fs::path& dir) {
    bragi_test::section("unwritable destination");

    CHECK_THROWS(export_audio(sine(24000, 0.1), (dir / "missing" / "x.wav").string(),
                              AudioContainer::Wav),
                 ResourceError);
}

static void test_resampler() {
    bragi_test::section("resampler");

    AudioResampler resampler;
    AudioClip output;
    CHECK(resampler.convert(sine(24000, 1.0), 16000, 1, output));
    CHECK(output.sample_rate == 16000);
    CHECK(bragi_test::near(output.duration(), 1.0, 0.01));

    AudioClip stereo;
    CHECK(resampler.convert(sine(22050, 0.5), 24000, 2, stereo));
    CHECK(stereo.channels == 2);
    CHECK(stereo.samples.size() == stereo.frames() * 2);
    CHECK(bragi_test::near(stereo.duration(), 0.5, 0.01));
}

static void test_timeline_conversion() {
    bragi_test::section("timeline converts foreign clips");

    Timeline timeline(24000, 1);
    timeline.append_silence(0.25);
    timeline.append(sine(16000, 1.0));
    CHECK(bragi_test::near(timeline.duration(), 1.25, 0.01));

    AudioClip clip = timeline.take();
    CHECK(clip.sample_rate == 24000);
    CHECK(timeline.empty());
}

int main() {
    fs::path dir = fs::temp_directory_path() / "bragi_test_audio";
    fs::remove_all(dir);
    fs::create_directories(dir);

    test_container_selection();
    test_wav_round_trip(dir);
    test_mp3_export(dir);
    test_export_failure(dir);
    test_resampler();
    test_timeline_conversion();

    fs::remove_all(dir);
    return bragi_test::finish("test_audio_roundtrip");
}
