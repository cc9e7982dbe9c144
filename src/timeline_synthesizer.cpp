#include "bragi/timeline_synthesizer.h"
#include "bragi/audio_encoder.h"
#include "bragi/errors.h"
#include "bragi/timeline.h"
#include <iostream>
#include <utility>

namespace bragi {

TimelineAudioSynthesizer::TimelineAudioSynthesizer(SynthesisBackend& backend, SynthesisOptions options)
    : backend_(backend)
    , options_(std::move(options))
{
}

std::optional<AudioClip> TimelineAudioSynthesizer::synthesize(const std::vector<Segment>& segments,
                                                              const ProgressCallback& progress,
                                                              const CancellationToken& token) {
    report_ = SynthesisReport();

    if (segments.empty()) {
        report(progress, "No valid subtitle segments found");
        return std::nullopt;
    }

    report(progress, "Synthesizing " + std::to_string(segments.size()) + " segments with " +
                     backend_.name() + "...");

    Timeline timeline(options_.sample_rate, options_.channels);

    for (size_t i = 0; i < segments.size(); ++i) {
        token.throw_if_cancelled();

        const Segment& segment = segments[i];

        double gap = segment.start - timeline.cursor();
        if (gap > 0.0) {
            timeline.append_silence(gap);
        }

        SynthesisResult result = backend_.synthesize(segment.text, options_.language);
        if (result.ok) {
            try {
                timeline.append(result.clip);
                report_.synthesized++;
            } catch (const ExternalServiceError& e) {
                result.ok = false;
                result.error = e.what();
            }
        }

        if (!result.ok) {
            report_.skipped++;
            std::string warning = "Warning: Synthesis failed for segment " + std::to_string(i + 1) +
                                  ": " + result.error;
            report_.warnings.push_back(warning);
            report(progress, warning);
        }

        timeline.set_cursor(segment.end);
    }

    report_.duration = timeline.duration();
    report_.produced = true;
    return timeline.take();
}

SynthesisReport TimelineAudioSynthesizer::synthesize_to_file(const std::vector<Segment>& segments,
                                                             const std::string& destination,
                                                             const ProgressCallback& progress,
                                                             const CancellationToken& token) {
    std::optional<AudioClip> clip = synthesize(segments, progress, token);
    if (!clip) {
        return report_;
    }

    AudioContainer container = container_from_path(destination);
    export_audio(*clip, destination, container, options_.mp3_bitrate);

    report_.path = destination;
    report(progress, "Audio saved to " + destination);
    return report_;
}

AudioClip TimelineAudioSynthesizer::narrate_text(const std::string& text) {
    SynthesisResult result = backend_.synthesize(text, options_.language);
    if (!result.ok) {
        throw ExternalServiceError("Narration failed: " + result.error);
    }

    Timeline timeline(options_.sample_rate, options_.channels);
    timeline.append(result.clip);
    return timeline.take();
}

} // namespace bragi
