#pragma once

#include "export.h"
#include "collaborators.h"
#include "progress.h"
#include "types.h"
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief Transcription pipeline stage
 */
enum class PipelineState {
    Idle,
    Extracting,
    Transcribing,
    Translating,
    Serializing,
    Done,
    Failed
};

/**
 * @brief Stage name for logs and progress messages
 */
BRAGI_API const char* to_string(PipelineState state);

/**
 * @brief Outcome of translating one segment
 *
 * Holds either the translated text, or the source text together with the
 * warning explaining why it was kept.
 */
struct TranslationOutcome {
    std::string text;               // Text to emit for the segment
    bool translated = false;        // False when the source text was kept
    std::string warning;            // Set when a translation call failed
};

/**
 * @brief Media file to translated subtitles
 *
 * Extracting → Transcribing → Translating → Serializing → Done, or Failed
 * from any stage. Collaborators are borrowed and must outlive the pipeline;
 * each pipeline gets its own handles.
 *
 * Translation runs strictly one segment at a time. A segment whose
 * translation fails keeps its source text and a warning is reported; the
 * run continues.
 *
 * Example usage:
 * @code
 * bragi::MediaAudioSource source;
 * bragi::Transcriber whisper(whisper_options);
 * bragi::Translator nllb(nllb_options);
 *
 * bragi::TranscriptionOptions options;
 * options.target_language = "es";
 * options.destination_path = "video.srt";
 *
 * bragi::TranscriptionPipeline pipeline(source, whisper, nllb, "video.mp4", options);
 * std::string srt = pipeline.run(progress, token);
 * @endcode
 */
class BRAGI_API TranscriptionPipeline {
public:
    TranscriptionPipeline(AudioSource& source,
                          SpeechToText& speech_to_text,
                          TextTranslator& translator,
                          std::string media_path,
                          TranscriptionOptions options);

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    /**
     * @brief Run every stage
     *
     * @param progress Status messages (may be empty)
     * @param token Checked between segments
     * @return Subtitle text (also written to destination_path if set)
     * @throws ExternalServiceError on extraction or speech-to-text failure
     * @throws ResourceError if the subtitle file cannot be written
     * @throws CancelledError if cancelled
     */
    std::string run(const ProgressCallback& progress,
                    const CancellationToken& token = CancellationToken());

    /**
     * @brief Translate one text, keeping the source on failure
     *
     * An empty translation also keeps the source text (without a warning).
     */
    static TranslationOutcome translate_or_keep(TextTranslator& translator,
                                                const std::string& text,
                                                const std::string& source_lang,
                                                const std::string& target_lang);

    /**
     * @brief Segments used when speech-to-text reports none
     *
     * @return Transcribed segments, or one segment spanning the whole audio
     *         carrying the full transcript
     */
    static std::vector<Segment> segments_from(const TranscriptionResult& result);

    PipelineState state() const { return state_; }

    /**
     * @brief Per-segment translation warnings of the last run
     */
    const std::vector<std::string>& warnings() const { return warnings_; }

    /**
     * @brief Segments produced by the last successful run (translated)
     */
    const std::vector<Segment>& segments() const { return segments_; }

    /**
     * @brief Language used as translation source in the last run
     */
    const std::string& source_language() const { return source_language_; }

private:
    void set_state(PipelineState state);

    AudioSource& source_;
    SpeechToText& speech_to_text_;
    TextTranslator& translator_;
    std::string media_path_;
    TranscriptionOptions options_;

    PipelineState state_ = PipelineState::Idle;
    std::vector<std::string> warnings_;
    std::vector<Segment> segments_;
    std::string source_language_;
};

} // namespace bragi
