#include "bragi/config.h"
#include "bragi/errors.h"
#include "file_utils.h"
#include <nlohmann/json.hpp>

namespace bragi {

DeviceType parse_device(const std::string& name) {
    if (name == "cpu") return DeviceType::CPU;
    if (name == "cuda") return DeviceType::CUDA;
    if (name == "auto") return DeviceType::Auto;
    throw FormatError("Unknown device: '" + name + "' (expected cpu, cuda or auto)");
}

ComputeType parse_compute_type(const std::string& name) {
    if (name == "float32") return ComputeType::Float32;
    if (name == "float16") return ComputeType::Float16;
    if (name == "int8") return ComputeType::Int8;
    if (name == "int8_float16") return ComputeType::Int8Float16;
    if (name == "auto" || name == "default") return ComputeType::Auto;
    throw FormatError("Unknown compute type: '" + name + "'");
}

namespace {

using nlohmann::json;

void read_model(const json& node, ModelOptions& model) {
    model.model_path = node.value("model_path", model.model_path);
    model.device_index = node.value("device_index", model.device_index);
    if (node.contains("device")) {
        model.device = parse_device(node.at("device").get<std::string>());
    }
    if (node.contains("compute_type")) {
        model.compute_type = parse_compute_type(node.at("compute_type").get<std::string>());
    }
}

void read_whisper(const json& node, AppConfig& config) {
    read_model(node, config.whisper_model);

    WhisperOptions& whisper = config.whisper;
    whisper.language = node.value("language", whisper.language);
    whisper.task = node.value("task", whisper.task);
    whisper.beam_size = node.value("beam_size", whisper.beam_size);
    whisper.patience = node.value("patience", whisper.patience);
    whisper.length_penalty = node.value("length_penalty", whisper.length_penalty);
    whisper.repetition_penalty = node.value("repetition_penalty", whisper.repetition_penalty);
    whisper.no_repeat_ngram_size = node.value("no_repeat_ngram_size", whisper.no_repeat_ngram_size);
    whisper.max_length = node.value("max_length", whisper.max_length);
    whisper.suppress_blank = node.value("suppress_blank", whisper.suppress_blank);
}

void read_nllb(const json& node, AppConfig& config) {
    read_model(node, config.nllb_model);

    TranslationOptions& translation = config.translation;
    translation.beam_size = node.value("beam_size", translation.beam_size);
    translation.length_penalty = node.value("length_penalty", translation.length_penalty);
    translation.max_length = node.value("max_length", translation.max_length);
    translation.repetition_penalty = node.value("repetition_penalty", translation.repetition_penalty);
    translation.no_repeat_ngram_size = node.value("no_repeat_ngram_size", translation.no_repeat_ngram_size);
}

void read_transcription(const json& node, AppConfig& config) {
    TranscriptionOptions& transcription = config.transcription;
    transcription.target_language = node.value("target_language", transcription.target_language);
    transcription.source_language = node.value("source_language", transcription.source_language);
    transcription.destination_path = node.value("destination_path", transcription.destination_path);
    config.write_segments_json = node.value("write_segments_json", config.write_segments_json);
}

void read_synthesis(const json& node, AppConfig& config) {
    SynthesisOptions& synthesis = config.synthesis;
    config.voice = node.value("voice", config.voice);
    synthesis.language = node.value("language", synthesis.language);
    synthesis.sample_rate = node.value("sample_rate", synthesis.sample_rate);
    synthesis.channels = node.value("channels", synthesis.channels);
    synthesis.mp3_bitrate = node.value("mp3_bitrate", synthesis.mp3_bitrate);

    if (synthesis.sample_rate <= 0 || synthesis.channels <= 0 || synthesis.channels > 2) {
        throw FormatError("Invalid synthesis output format");
    }
}

} // namespace

AppConfig parse_config(const std::string& text) {
    AppConfig config;

    try {
        json doc = json::parse(text);
        if (!doc.is_object()) {
            throw FormatError("Configuration must be a JSON object");
        }

        if (doc.contains("whisper")) read_whisper(doc.at("whisper"), config);
        if (doc.contains("nllb")) read_nllb(doc.at("nllb"), config);
        if (doc.contains("transcription")) read_transcription(doc.at("transcription"), config);
        if (doc.contains("synthesis")) read_synthesis(doc.at("synthesis"), config);

    } catch (const json::exception& e) {
        throw FormatError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

AppConfig load_config(const std::string& path) {
    return parse_config(detail::read_file(path));
}

} // namespace bragi
