#pragma once

#include "export.h"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace bragi {

/**
 * @brief Timed subtitle text unit
 *
 * The index is assigned at serialization time (1-based, sequence position);
 * the parser leaves it at the block's position in the recovered sequence.
 * Segments are built whole and never edited afterwards: a stage that changes
 * text (translation) produces a new sequence.
 */
struct Segment {
    int index;                      // Sequence index (1-based)
    double start;                   // Start time in seconds
    double end;                     // End time in seconds (expected > start, not enforced)
    std::string text;               // UTF-8 text, may contain line breaks

    Segment() : index(0), start(0.0), end(0.0) {}
    Segment(double start_, double end_, std::string text_, int index_ = 0)
        : index(index_), start(start_), end(end_), text(std::move(text_)) {}

    bool operator==(const Segment& other) const {
        return start == other.start && end == other.end && text == other.text;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

/**
 * @brief Raw speech-to-text output unit
 */
struct TranscribedSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

/**
 * @brief Result of a speech-to-text run
 */
struct TranscriptionResult {
    std::vector<TranscribedSegment> segments;
    std::string full_text;          // Whole transcript (used when no segments come back)
    std::string language;           // Detected or forced language code ("en", "km", ...)
    double duration = 0.0;          // Audio duration in seconds
};

/**
 * @brief Decoded audio handed from extraction to speech-to-text
 */
struct ExtractedAudio {
    std::vector<float> samples;     // Mono float32 in [-1, 1]
    int sample_rate = 16000;
    double duration = 0.0;          // Container duration in seconds
};

/**
 * @brief Synthesized or assembled audio
 *
 * Samples are interleaved float32. Duration is derived from the frame count.
 */
struct AudioClip {
    std::vector<float> samples;
    int sample_rate;
    int channels;

    AudioClip() : sample_rate(0), channels(1) {}
    AudioClip(std::vector<float> samples_, int sample_rate_, int channels_ = 1)
        : samples(std::move(samples_)), sample_rate(sample_rate_), channels(channels_) {}

    size_t frames() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    double duration() const {
        if (sample_rate <= 0) return 0.0;
        return static_cast<double>(frames()) / static_cast<double>(sample_rate);
    }

    bool empty() const { return samples.empty(); }
};

/**
 * @brief Compute precision type
 */
enum class ComputeType {
    Float32,        // Full precision (most accurate, slowest)
    Float16,        // Half precision (fast on GPU)
    Int8,           // 8-bit quantized (fastest, good quality)
    Int8Float16,    // Mixed precision
    Auto            // Auto-detect best for device
};

/**
 * @brief Device type for inference
 */
enum class DeviceType {
    Auto,           // Prefer CUDA when available
    CUDA,           // NVIDIA GPU
    CPU             // CPU only
};

/**
 * @brief CTranslate2 model initialization options (Whisper and NLLB)
 */
struct ModelOptions {
    std::string model_path;                         // CTranslate2 model directory
    DeviceType device = DeviceType::CPU;
    ComputeType compute_type = ComputeType::Int8;
    int device_index = 0;                           // GPU index for multi-GPU systems

    std::string device_string() const {
        switch (device) {
            case DeviceType::CUDA: return "cuda";
            case DeviceType::CPU: return "cpu";
            default: return "auto";
        }
    }

    std::string compute_type_string() const {
        switch (compute_type) {
            case ComputeType::Float32: return "float32";
            case ComputeType::Float16: return "float16";
            case ComputeType::Int8: return "int8";
            case ComputeType::Int8Float16: return "int8_float16";
            default: return "default";
        }
    }
};

/**
 * @brief Transcription pipeline options
 */
struct TranscriptionOptions {
    std::string target_language;            // Translation target ("es", "km", ...)
    std::string source_language = "auto";   // "auto" = language reported by speech-to-text
    std::string destination_path;           // Subtitle destination (empty = don't write)
};

/**
 * @brief Timeline synthesis options
 */
struct SynthesisOptions {
    std::string language;                   // Language passed to the synthesis backend
    int sample_rate = 24000;                // Output timeline sample rate
    int channels = 1;                       // Output timeline channel count
    int mp3_bitrate = 128000;               // Bitrate used for mp3 export
};

} // namespace bragi
