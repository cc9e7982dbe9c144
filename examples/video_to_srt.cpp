/**
 * @file video_to_srt.cpp
 * @brief Media file to translated SubRip subtitles
 *
 * Extracts the audio track, transcribes it with Whisper, translates every
 * segment with NLLB and writes the subtitles.
 *
 * Usage:
 *   video_to_srt <media_file> <target_lang> [options]
 *
 * Options:
 *   --config <file>        JSON configuration (see bragi/config.h)
 *   --output <file.srt>    Subtitle destination (default: <media>.srt)
 *   --source <lang>        Spoken language (default: auto)
 *   --whisper <dir>        Whisper model directory
 *   --nllb <dir>           NLLB model directory
 *   --device <cpu|cuda|auto>
 *   --segments-json        Also write <media>_segments.json
 *
 * Example:
 *   video_to_srt lecture.mp4 km --whisper models/whisper-small \
 *                               --nllb models/nllb-200-distilled-600M
 */

#include <bragi/audio_extractor.h>
#include <bragi/config.h>
#include <bragi/errors.h>
#include <bragi/segments_json.h>
#include <bragi/subtitle_export.h>
#include <bragi/task.h>
#include <bragi/transcriber.h>
#include <bragi/transcription_pipeline.h>
#include <bragi/translator.h>
#include <csignal>
#include <iostream>
#include <string>

namespace {

bragi::Task<std::string>* g_task = nullptr;

void on_interrupt(int) {
    if (g_task) {
        g_task->cancel();
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <media_file> <target_lang> [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <file>        JSON configuration\n";
    std::cerr << "  --output <file.srt>    Subtitle destination (default: <media>.srt)\n";
    std::cerr << "  --source <lang>        Spoken language (default: auto)\n";
    std::cerr << "  --whisper <dir>        Whisper model directory\n";
    std::cerr << "  --nllb <dir>           NLLB model directory\n";
    std::cerr << "  --device <cpu|cuda|auto>\n";
    std::cerr << "  --segments-json        Also write <media>_segments.json\n\n";
    std::cerr << "Supported languages:\n";
    for (const auto& lang : bragi::Translator::supported_languages()) {
        std::cerr << "  " << lang.code << " - " << lang.name << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string media_path = argv[1];
    std::string target_lang = argv[2];

    try {
        // Config file first so flags can override it
        bragi::AppConfig config;
        for (int i = 3; i + 1 < argc; ++i) {
            if (std::string(argv[i]) == "--config") {
                config = bragi::load_config(argv[i + 1]);
            }
        }

        for (int i = 3; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--config" && has_value) {
                ++i;
            } else if (arg == "--output" && has_value) {
                config.transcription.destination_path = argv[++i];
            } else if (arg == "--source" && has_value) {
                config.transcription.source_language = argv[++i];
            } else if (arg == "--whisper" && has_value) {
                config.whisper_model.model_path = argv[++i];
            } else if (arg == "--nllb" && has_value) {
                config.nllb_model.model_path = argv[++i];
            } else if (arg == "--device" && has_value) {
                bragi::DeviceType device = bragi::parse_device(argv[++i]);
                config.whisper_model.device = device;
                config.nllb_model.device = device;
            } else if (arg == "--segments-json") {
                config.write_segments_json = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        config.transcription.target_language = target_lang;
        if (config.transcription.destination_path.empty()) {
            config.transcription.destination_path =
                bragi::SubtitleSerializer::generate_output_path(media_path);
        }
        if (config.transcription.source_language != "auto") {
            config.whisper.language = config.transcription.source_language;
        }

        if (!bragi::Translator::is_language_supported(target_lang)) {
            std::cerr << "Error: Unsupported target language '" << target_lang << "'\n";
            return 1;
        }

        bragi::MediaAudioSource source;
        bragi::Transcriber transcriber(config.whisper_model, config.whisper);
        bragi::Translator translator(config.nllb_model, config.translation);

        bragi::TranscriptionPipeline pipeline(source, transcriber, translator,
                                              media_path, config.transcription);

        bragi::Task<std::string> task(
            [&pipeline](const bragi::ProgressCallback& progress, const bragi::CancellationToken& token) {
                return pipeline.run(progress, token);
            });

        int exit_code = 0;
        bragi::TaskCallbacks<std::string> callbacks;
        callbacks.on_progress = [](const std::string& message) {
            std::cout << message << std::endl;
        };
        callbacks.on_success = [&](const std::string&) {
            std::cout << "Done: " << config.transcription.destination_path << std::endl;
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

        if (exit_code == 0 && config.write_segments_json) {
            bragi::SegmentsJson::Metadata metadata;
            metadata.media_file = media_path;
            metadata.language = target_lang;
            metadata.source_language = pipeline.source_language();
            if (!pipeline.segments().empty()) {
                metadata.duration = pipeline.segments().back().end;
            }

            std::string json_path = bragi::SegmentsJson::generate_output_path(media_path);
            bragi::SegmentsJson::write(pipeline.segments(), metadata, json_path);
            std::cout << "Segments: " << json_path << std::endl;
        }

        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
