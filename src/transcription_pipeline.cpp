#include "bragi/transcription_pipeline.h"
#include "bragi/errors.h"
#include "bragi/subtitle_export.h"
#include <exception>
#include <iostream>
#include <utility>

namespace bragi {

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Idle: return "idle";
        case PipelineState::Extracting: return "extracting";
        case PipelineState::Transcribing: return "transcribing";
        case PipelineState::Translating: return "translating";
        case PipelineState::Serializing: return "serializing";
        case PipelineState::Done: return "done";
        case PipelineState::Failed: return "failed";
    }
    return "unknown";
}

TranscriptionPipeline::TranscriptionPipeline(AudioSource& source,
                                             SpeechToText& speech_to_text,
                                             TextTranslator& translator,
                                             std::string media_path,
                                             TranscriptionOptions options)
    : source_(source)
    , speech_to_text_(speech_to_text)
    , translator_(translator)
    , media_path_(std::move(media_path))
    , options_(std::move(options))
{
}

void TranscriptionPipeline::set_state(PipelineState state) {
    state_ = state;
}

// ═══════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════

TranslationOutcome TranscriptionPipeline::translate_or_keep(TextTranslator& translator,
                                                            const std::string& text,
                                                            const std::string& source_lang,
                                                            const std::string& target_lang) {
    TranslationOutcome outcome;
    outcome.text = text;

    try {
        std::string translated = translator.translate(text, source_lang, target_lang);
        if (!translated.empty()) {
            outcome.text = std::move(translated);
            outcome.translated = true;
        }
    } catch (const std::exception& e) {
        outcome.warning = std::string("Warning: Translation error for a segment: ") + e.what();
    }

    return outcome;
}

std::vector<Segment> TranscriptionPipeline::segments_from(const TranscriptionResult& result) {
    std::vector<Segment> segments;

    if (result.segments.empty()) {
        segments.emplace_back(0.0, result.duration, result.full_text, 1);
        return segments;
    }

    segments.reserve(result.segments.size());
    int index = 1;
    for (const auto& seg : result.segments) {
        segments.emplace_back(seg.start, seg.end, seg.text, index++);
    }
    return segments;
}

// ═══════════════════════════════════════════════════════════
// Run
// ═══════════════════════════════════════════════════════════

std::string TranscriptionPipeline::run(const ProgressCallback& progress,
                                       const CancellationToken& token) {
    warnings_.clear();
    segments_.clear();
    source_language_.clear();

    try {
        // Extraction
        set_state(PipelineState::Extracting);
        report(progress, "Extracting audio from " + media_path_ + "...");
        ExtractedAudio audio;
        try {
            audio = source_.extract(media_path_);
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw ExternalServiceError(std::string("Audio extraction failed: ") + e.what());
        }
        report(progress, "Audio extraction complete.");
        token.throw_if_cancelled();

        // Speech-to-text
        set_state(PipelineState::Transcribing);
        TranscriptionResult result;
        try {
            speech_to_text_.prepare();
            report(progress, "Speech-to-text model ready. Transcribing...");
            result = speech_to_text_.transcribe(audio);
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            throw ExternalServiceError(std::string("Transcription failed: ") + e.what());
        }
        if (result.duration <= 0.0) {
            result.duration = audio.duration;
        }

        std::vector<Segment> segments = segments_from(result);
        report(progress, "Transcription complete: " + std::to_string(segments.size()) +
                         " segments.");
        token.throw_if_cancelled();

        source_language_ = options_.source_language;
        if (source_language_.empty() || source_language_ == "auto") {
            source_language_ = result.language;
        }

        // Translation
        set_state(PipelineState::Translating);
        report(progress, "Translating segments from " + source_language_ + " to " +
                         options_.target_language + "...");

        std::vector<Segment> translated;
        translated.reserve(segments.size());
        for (const Segment& segment : segments) {
            token.throw_if_cancelled();

            TranslationOutcome outcome = translate_or_keep(
                translator_, segment.text, source_language_, options_.target_language);
            if (!outcome.warning.empty()) {
                warnings_.push_back(outcome.warning);
                report(progress, outcome.warning);
            }
            translated.emplace_back(segment.start, segment.end, std::move(outcome.text), segment.index);
        }

        // Serialization
        set_state(PipelineState::Serializing);
        std::string text;
        if (options_.destination_path.empty()) {
            text = SubtitleSerializer::serialize(translated);
        } else {
            SubtitleSerializer serializer;
            text = serializer.write_srt(translated, options_.destination_path);
            report(progress, "Subtitles saved to " + options_.destination_path);
        }

        segments_ = std::move(translated);
        set_state(PipelineState::Done);
        return text;

    } catch (const std::exception& e) {
        set_state(PipelineState::Failed);
        std::cerr << "[Bragi] Transcription pipeline failed: " << e.what() << std::endl;
        throw;
    }
}

} // namespace bragi
