#pragma once

#include "bragi/export.h"
#include "bragi/progress.h"
#include "bragi/synthesis_backend.h"
#include "bragi/types.h"
#include <optional>
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief Outcome of a synthesis run
 */
struct SynthesisReport {
    bool produced = false;          // False for empty input (nothing written)
    std::string path;               // Destination actually written
    int synthesized = 0;            // Segments that contributed audio
    int skipped = 0;                // Segments whose synthesis failed
    double duration = 0.0;          // Length of the assembled audio (seconds)
    std::vector<std::string> warnings;
};

/**
 * @brief Rebuilds one audio track from timed subtitle segments
 *
 * Per segment, in order, starting with the cursor at 0:
 *   1. gap = start - cursor; a positive gap is filled with silence
 *   2. the backend synthesizes the text; a failure skips the segment with a warning
 *   3. the cursor moves to the segment's declared end
 *
 * Overlapping segments (gap <= 0) are appended directly after the previous
 * clip. Clip durations are used as they come back from the backend, so the
 * track drifts when a clip is longer or shorter than its slot.
 *
 * Example usage:
 * @code
 * bragi::SynthesisOptions options;
 * options.language = "es";
 *
 * bragi::SynthesisBackend backend(bragi::parse_voice_selector("espeak-ng"));
 * bragi::TimelineAudioSynthesizer synthesizer(backend, options);
 *
 * auto segments = bragi::SubtitleParser::load_srt("video.srt");
 * auto report = synthesizer.synthesize_to_file(segments, "video_es.mp3", progress, token);
 * @endcode
 */
class BRAGI_API TimelineAudioSynthesizer {
public:
    /**
     * @param backend Synthesis backend (borrowed, must outlive the synthesizer)
     * @param options Target language and output format
     */
    TimelineAudioSynthesizer(SynthesisBackend& backend, SynthesisOptions options);

    /**
     * @brief Assemble the timeline in memory
     *
     * @param segments Segments in playback order
     * @param progress Status and per-segment warnings (may be empty)
     * @param token Checked between segments
     * @return Assembled audio, or nullopt for an empty segment sequence
     * @throws CancelledError if cancelled
     */
    std::optional<AudioClip> synthesize(const std::vector<Segment>& segments,
                                        const ProgressCallback& progress = ProgressCallback(),
                                        const CancellationToken& token = CancellationToken());

    /**
     * @brief Assemble the timeline and encode it to a file
     *
     * The container follows the destination extension (mp3 or wav,
     * case-insensitive); anything else is written as mp3. Nothing is written
     * before the whole timeline has been assembled, and nothing at all for an
     * empty segment sequence.
     *
     * @throws ResourceError if the file cannot be written
     * @throws CancelledError if cancelled
     */
    SynthesisReport synthesize_to_file(const std::vector<Segment>& segments,
                                       const std::string& destination,
                                       const ProgressCallback& progress = ProgressCallback(),
                                       const CancellationToken& token = CancellationToken());

    /**
     * @brief Synthesize a text blob without timing as one clip
     *
     * @throws ExternalServiceError if the backend fails
     */
    AudioClip narrate_text(const std::string& text);

    /**
     * @brief Counters of the last synthesize() call
     */
    const SynthesisReport& last_report() const { return report_; }

private:
    SynthesisBackend& backend_;
    SynthesisOptions options_;
    SynthesisReport report_;
};

} // namespace bragi
