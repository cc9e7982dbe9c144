/**
 * @file srt_to_voice.cpp
 * @brief SubRip subtitles to one timed voice track
 *
 * Synthesizes every subtitle block with the selected voice and places it at
 * its start time, filling gaps with silence.
 *
 * Usage:
 *   srt_to_voice <subtitles.srt> <output.mp3|output.wav> <lang> [options]
 *
 * Options:
 *   --config <file>        JSON configuration (see bragi/config.h)
 *   --voice <selector>     espeak-ng[:voice] | command:<template> | piper:<model.onnx>
 *   --narrate              Read the whole text as one clip, ignoring timing
 *
 * Example:
 *   srt_to_voice lecture.srt lecture_km.mp3 km --voice espeak-ng
 */

#include <bragi/audio_encoder.h>
#include <bragi/config.h>
#include <bragi/errors.h>
#include <bragi/subtitle_parser.h>
#include <bragi/synthesis_backend.h>
#include <bragi/task.h>
#include <bragi/timeline_synthesizer.h>
#include <csignal>
#include <iostream>
#include <string>

namespace {

bragi::Task<bragi::SynthesisReport>* g_task = nullptr;

void on_interrupt(int) {
    if (g_task) {
        g_task->cancel();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <subtitles.srt> <output.mp3|output.wav> <lang> [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <file>        JSON configuration\n";
    std::cerr << "  --voice <selector>     espeak-ng[:voice] | command:<template> | piper:<model.onnx>\n";
    std::cerr << "  --narrate              Read the whole text as one clip, ignoring timing\n";
}

// Text of all blocks, one per line
std::string join_text(const std::vector<bragi::Segment>& segments) {
    std::string text;
    for (const auto& seg : segments) {
        if (!text.empty()) {
            text += "\n";
        }
        text += seg.text;
    }
    return text;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    std::string srt_path = argv[1];
    std::string output_path = argv[2];
    std::string language = argv[3];
    bool narrate = false;

    try {
        bragi::AppConfig config;
        for (int i = 4; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") {
                config = bragi::load_config(argv[i + 1]);
            }
        }

        for (int i = 4; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--config" && has_value) {
                ++i;
            } else if (arg == "--voice" && has_value) {
                config.voice = argv[++i];
            } else if (arg == "--narrate") {
                narrate = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        config.synthesis.language = language;

        // Selector errors surface here, before any work starts
        bragi::SynthesisBackend backend(bragi::parse_voice_selector(config.voice));
        bragi::TimelineAudioSynthesizer synthesizer(backend, config.synthesis);

        bragi::Task<bragi::SynthesisReport> task(
            [&](const bragi::ProgressCallback& progress, const bragi::CancellationToken& token) {
                auto segments = bragi::SubtitleParser::load_srt(srt_path);

                if (!narrate) {
                    return synthesizer.synthesize_to_file(segments, output_path, progress, token);
                }

                bragi::SynthesisReport report;
                if (segments.empty()) {
                    bragi::report(progress, "No valid subtitle segments found");
                    return report;
                }

                bragi::report(progress, "Narrating " + std::to_string(segments.size()) + " blocks...");
                bragi::AudioClip clip = synthesizer.narrate_text(join_text(segments));
                bragi::export_audio(clip, output_path, bragi::container_from_path(output_path),
                                    config.synthesis.mp3_bitrate);

                report.produced = true;
                report.path = output_path;
                report.synthesized = 1;
                report.duration = clip.duration();
                bragi::report(progress, "Audio saved to " + output_path);
                return report;
            });

        int exit_code = 0;
        bragi::TaskCallbacks<bragi::SynthesisReport> callbacks;
        callbacks.on_progress = [](const std::string& message) {
            std::cout << message << std::endl;
        };
        callbacks.on_success = [](const bragi::SynthesisReport& report) {
            if (report.produced) {
                std::cout << "Done: " << report.path << " (" << report.duration << "s, "
                          << report.synthesized << " synthesized, "
                          << report.skipped << " skipped)" << std::endl;
            }
        };
        callbacks.on_error = [&exit_code](const std::string& message) {
            std::cerr << "Error: " << message << std::endl;
            exit_code = 1;
        };

        g_task = &task;
        std::signal(SIGINT, on_interrupt);

        task.start(callbacks);
        task.wait();

        g_task = nullptr;
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
