#pragma once

#include "bragi/export.h"
#include "bragi/collaborators.h"
#include "bragi/types.h"
#include <memory>
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief AudioExtractor - FFmpeg audio extraction
 *
 * Decodes the audio track of audio/video files. Two uses:
 * - Speech-to-text input: 16kHz mono float32 in [-1, 1]
 * - Synthesis output read-back: any rate/channel layout as an AudioClip
 */
class BRAGI_API AudioExtractor {
public:
    static constexpr int WHISPER_SAMPLE_RATE = 16000;

    AudioExtractor();
    ~AudioExtractor();

    /**
     * @brief Open a media file and index its decodable audio tracks
     * @return False (see get_last_error) if the file has none
     */
    bool open(const std::string& file_path);

    void close();

    // Both 0 while no file is open
    int get_track_count() const;
    double get_duration() const;   // Container duration, seconds

    /**
     * @brief Decode one track of the open file as 16kHz mono
     * @param track_index 0-based among the audio tracks
     */
    bool extract_track(int track_index, std::vector<float>& samples);

    /**
     * @brief One-shot open, decode of the first track as 16kHz mono, close
     *
     * duration falls back to the decoded length when the container has none.
     */
    bool extract_audio(const std::string& file_path,
                       std::vector<float>& samples,
                       double& duration);

    /**
     * @brief Read a synthesized audio file back as a clip
     *
     * Independent of open(). A rate or channel count of 0 keeps the file's own.
     */
    bool decode_clip(const std::string& file_path,
                     AudioClip& clip,
                     int sample_rate = 0,
                     int channels = 0);

    std::string get_last_error() const { return last_error_; }

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string last_error_;
};

/**
 * @brief AudioSource over AudioExtractor (first audio track, 16kHz mono)
 */
class BRAGI_API MediaAudioSource : public AudioSource {
public:
    /**
     * @throws ExternalServiceError with the decoder's error message
     */
    ExtractedAudio extract(const std::string& media_path) override;
};

} // namespace bragi
