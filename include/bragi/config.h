#pragma once

#include "bragi/export.h"
#include "bragi/transcriber.h"
#include "bragi/translator.h"
#include "bragi/types.h"
#include <string>

namespace bragi {

/**
 * @brief Application configuration
 *
 * Every field has a usable default; a configuration file only needs the keys
 * it changes.
 *
 * @code
 * {
 *   "whisper": { "model_path": "models/whisper-small", "device": "cpu",
 *                "compute_type": "int8", "language": "auto", "beam_size": 5 },
 *   "nllb":    { "model_path": "models/nllb-200-distilled-600M", "beam_size": 4 },
 *   "transcription": { "target_language": "km", "source_language": "auto",
 *                      "write_segments_json": false },
 *   "synthesis": { "voice": "espeak-ng", "language": "km",
 *                  "sample_rate": 24000, "channels": 1, "mp3_bitrate": 128000 }
 * }
 * @endcode
 */
struct AppConfig {
    // ═══════════════════════════════════════════════════════════
    // Speech-to-text
    // ═══════════════════════════════════════════════════════════
    ModelOptions whisper_model;
    WhisperOptions whisper;

    // ═══════════════════════════════════════════════════════════
    // Translation
    // ═══════════════════════════════════════════════════════════
    ModelOptions nllb_model;
    TranslationOptions translation;

    // ═══════════════════════════════════════════════════════════
    // Pipelines
    // ═══════════════════════════════════════════════════════════
    TranscriptionOptions transcription;
    bool write_segments_json = false;       // Sidecar beside the subtitle file

    SynthesisOptions synthesis;
    std::string voice = "espeak-ng";        // Voice selector (see parse_voice_selector)

    AppConfig() {
        whisper_model.model_path = "models/whisper-small";
        nllb_model.model_path = "models/nllb-200-distilled-600M";
    }
};

/**
 * @brief Parse a configuration document
 * @throws FormatError on malformed JSON, wrong value types or unknown enum values
 */
BRAGI_API AppConfig parse_config(const std::string& json);

/**
 * @brief Load a configuration file
 * @throws ResourceError if the file cannot be read
 * @throws FormatError if the content is invalid
 */
BRAGI_API AppConfig load_config(const std::string& path);

BRAGI_API DeviceType parse_device(const std::string& name);
BRAGI_API ComputeType parse_compute_type(const std::string& name);

} // namespace bragi
