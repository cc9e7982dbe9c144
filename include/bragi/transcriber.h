#pragma once

#include "bragi/export.h"
#include "bragi/collaborators.h"
#include "bragi/types.h"
#include <memory>
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief Whisper decoding options
 */
struct WhisperOptions {
    std::string language = "auto";          // Spoken language ("auto" = detect per file)
    std::string task = "transcribe";        // "transcribe" or "translate" (to English)
    int beam_size = 5;
    float patience = 1.0f;
    float length_penalty = 1.0f;
    float repetition_penalty = 1.0f;
    int no_repeat_ngram_size = 0;
    int max_length = 448;
    bool suppress_blank = true;
};

/**
 * @brief Speech-to-text with Whisper via CTranslate2
 *
 * The model is loaded on the first prepare() call, so a Transcriber can be
 * constructed cheaply and handed to a pipeline before any model is touched.
 *
 * Audio is processed in 30 second windows; segments come from Whisper's
 * timestamp tokens and are offset by their window start.
 *
 * Example usage:
 * @code
 * bragi::ModelOptions options;
 * options.model_path = "models/whisper-small";
 * bragi::Transcriber transcriber(options);
 * transcriber.prepare();
 * auto result = transcriber.transcribe(audio);
 * @endcode
 */
class BRAGI_API Transcriber : public SpeechToText {
public:
    explicit Transcriber(const ModelOptions& options,
                         const WhisperOptions& whisper_options = WhisperOptions());
    ~Transcriber() override;

    // Non-copyable, movable
    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;
    Transcriber(Transcriber&&) noexcept;
    Transcriber& operator=(Transcriber&&) noexcept;

    /**
     * @brief Load the Whisper model (no-op once loaded)
     * @throws ExternalServiceError if the model cannot be loaded
     */
    void prepare() override;

    /**
     * @brief Transcribe 16kHz mono audio
     * @throws ExternalServiceError if the model is not loaded or inference fails
     */
    TranscriptionResult transcribe(const ExtractedAudio& audio) override;

    bool is_loaded() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief Whisper token helpers
 */
namespace whisper_tokens {

/**
 * @brief Time of a timestamp token like "<|1.40|>"
 * @return Seconds, or -1 if the token is not a timestamp
 */
BRAGI_API double parse_timestamp_token(const std::string& token);

/**
 * @brief Replace GPT-2 BPE space markers (U+0120) with spaces
 */
BRAGI_API std::string clean_token(const std::string& token);

/**
 * @brief Segments from a token sequence with interleaved timestamp tokens
 *
 * @param tokens Decoded tokens of one window
 * @param offset Window start in seconds
 * @param window_end Used to close a trailing segment without an end timestamp
 */
BRAGI_API std::vector<TranscribedSegment> extract_segments(const std::vector<std::string>& tokens,
                                                           double offset,
                                                           double window_end);

} // namespace whisper_tokens

} // namespace bragi
