#include "bragi/synthesis_backend.h"
#include "bragi/audio_extractor.h"
#include "bragi/errors.h"
#include "bragi/temp_file.h"
#include "file_utils.h"
#include <nlohmann/json.hpp>
#include <onnxruntime_cxx_api.h>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <utility>
#include <vector>

namespace bragi {

namespace {

const std::string kEspeakTemplate = "espeak-ng -v {voice} -w {output} -f {text_file}";

// Single-quote for /bin/sh
std::string shell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

void replace_all(std::string& text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

// Splits UTF-8 into code points (as strings), invalid bytes pass through singly
std::vector<std::string> split_code_points(const std::string& text) {
    std::vector<std::string> points;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > text.size()) len = 1;
        points.push_back(text.substr(i, len));
        i += len;
    }
    return points;
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Voice selector
// ═══════════════════════════════════════════════════════════

VoiceSelection parse_voice_selector(const std::string& selector) {
    if (selector == "espeak-ng" || selector.compare(0, 10, "espeak-ng:") == 0) {
        CommandVoice voice;
        voice.name = "espeak-ng";
        voice.command_template = kEspeakTemplate;
        if (selector.size() > 10) {
            voice.voice = selector.substr(10);
        }
        return voice;
    }

    if (selector.compare(0, 8, "command:") == 0) {
        CommandVoice voice;
        voice.command_template = selector.substr(8);
        if (voice.command_template.empty()) {
            throw FormatError("Voice selector 'command:' needs a command template");
        }
        return voice;
    }

    if (selector.compare(0, 6, "piper:") == 0) {
        PiperVoice voice;
        voice.model_path = selector.substr(6);
        if (voice.model_path.empty()) {
            throw FormatError("Voice selector 'piper:' needs a model path");
        }
        return voice;
    }

    throw FormatError("Unknown voice selector: '" + selector +
                      "' (expected espeak-ng[:voice], command:<template> or piper:<model.onnx>)");
}

// ═══════════════════════════════════════════════════════════
// Engines
// ═══════════════════════════════════════════════════════════

namespace {

class VoiceEngine {
public:
    virtual ~VoiceEngine() = default;
    virtual AudioClip synthesize(const std::string& text, const std::string& language) = 0;
    virtual std::string name() const = 0;
};

/**
 * Runs an external TTS command and decodes the file it writes.
 */
class CommandEngine : public VoiceEngine {
public:
    explicit CommandEngine(CommandVoice voice) : voice_(std::move(voice)) {
        if (voice_.command_template.empty()) {
            throw FormatError("Command voice has an empty template");
        }
    }

    AudioClip synthesize(const std::string& text, const std::string& language) override {
        ScopedTempFile text_file(".txt");
        ScopedTempFile output(".wav");
        text_file.write(text);

        std::string command = voice_.command_template;
        replace_all(command, "{text_file}", shell_quote(text_file.path()));
        replace_all(command, "{output}", shell_quote(output.path()));
        replace_all(command, "{lang}", shell_quote(language));
        replace_all(command, "{voice}", shell_quote(voice_.voice.empty() ? language : voice_.voice));
        command += " >/dev/null 2>&1";

        int status = std::system(command.c_str());
        if (status != 0) {
            throw ExternalServiceError(voice_.name + " exited with status " + std::to_string(status));
        }

        AudioExtractor extractor;
        AudioClip clip;
        if (!extractor.decode_clip(output.path(), clip)) {
            throw ExternalServiceError(voice_.name + " produced no usable audio: " +
                                       extractor.get_last_error());
        }
        return clip;
    }

    std::string name() const override { return voice_.name; }

private:
    CommandVoice voice_;
};

/**
 * Piper VITS model: espeak-ng IPA phonemes → phoneme ids → ONNX inference.
 */
class PiperEngine : public VoiceEngine {
public:
    explicit PiperEngine(PiperVoice voice)
        : voice_(std::move(voice))
        , env_(ORT_LOGGING_LEVEL_WARNING, "Piper")
    {
        if (voice_.model_path.empty()) {
            throw FormatError("Piper voice has no model path");
        }
        if (voice_.config_path.empty()) {
            voice_.config_path = voice_.model_path + ".json";
        }

        load_config();

        try {
            Ort::SessionOptions session_options;
            session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            session_options.SetIntraOpNumThreads(1);
            session_options.SetInterOpNumThreads(1);

            session_ = std::make_unique<Ort::Session>(env_, voice_.model_path.c_str(), session_options);
        } catch (const Ort::Exception& e) {
            throw ExternalServiceError("Failed to load Piper model " + voice_.model_path + ": " + e.what());
        }

        std::cout << "[Bragi] Piper voice loaded (" << sample_rate_ << "Hz, "
                  << phoneme_ids_.size() << " phonemes): " << voice_.model_path << std::endl;
    }

    AudioClip synthesize(const std::string& text, const std::string& language) override {
        (void)language;  // The espeak voice is fixed by the model config

        std::vector<int64_t> ids = phonemize(text);
        if (ids.size() <= 3) {
            throw ExternalServiceError("Nothing to synthesize");
        }

        Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(
            OrtAllocatorType::OrtArenaAllocator, OrtMemType::OrtMemTypeDefault);

        std::vector<Ort::Value> input_tensors;
        std::vector<const char*> input_names = {"input", "input_lengths", "scales"};

        std::vector<int64_t> input_shape = {1, static_cast<int64_t>(ids.size())};
        input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(
            memory_info, ids.data(), ids.size(), input_shape.data(), input_shape.size()));

        std::vector<int64_t> lengths = {static_cast<int64_t>(ids.size())};
        std::vector<int64_t> lengths_shape = {1};
        input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(
            memory_info, lengths.data(), lengths.size(), lengths_shape.data(), lengths_shape.size()));

        std::vector<float> scales = {noise_scale_, length_scale_, noise_w_};
        std::vector<int64_t> scales_shape = {3};
        input_tensors.push_back(Ort::Value::CreateTensor<float>(
            memory_info, scales.data(), scales.size(), scales_shape.data(), scales_shape.size()));

        std::vector<int64_t> speaker = {static_cast<int64_t>(voice_.speaker_id)};
        std::vector<int64_t> speaker_shape = {1};
        if (num_speakers_ > 1) {
            input_names.push_back("sid");
            input_tensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memory_info, speaker.data(), speaker.size(), speaker_shape.data(), speaker_shape.size()));
        }

        const char* output_names[] = {"output"};

        std::vector<Ort::Value> output_tensors;
        try {
            output_tensors = session_->Run(
                Ort::RunOptions{nullptr},
                input_names.data(), input_tensors.data(), input_tensors.size(),
                output_names, 1);
        } catch (const Ort::Exception& e) {
            throw ExternalServiceError(std::string("Piper inference failed: ") + e.what());
        }

        const float* audio = output_tensors[0].GetTensorData<float>();
        size_t count = output_tensors[0].GetTensorTypeAndShapeInfo().GetElementCount();

        return AudioClip(std::vector<float>(audio, audio + count), sample_rate_, 1);
    }

    std::string name() const override { return "piper"; }

private:
    void load_config() {
        nlohmann::json config;
        try {
            config = nlohmann::json::parse(detail::read_file(voice_.config_path));
        } catch (const nlohmann::json::exception& e) {
            throw FormatError("Invalid Piper config " + voice_.config_path + ": " + e.what());
        }

        try {
            sample_rate_ = config.at("audio").value("sample_rate", 22050);
            espeak_voice_ = config.contains("espeak") ? config["espeak"].value("voice", "en-us") : "en-us";
            num_speakers_ = config.value("num_speakers", 1);

            if (config.contains("inference")) {
                const auto& inference = config["inference"];
                noise_scale_ = inference.value("noise_scale", noise_scale_);
                length_scale_ = inference.value("length_scale", length_scale_);
                noise_w_ = inference.value("noise_w", noise_w_);
            }

            for (const auto& [phoneme, ids] : config.at("phoneme_id_map").items()) {
                phoneme_ids_[phoneme] = ids.get<std::vector<int64_t>>();
            }
        } catch (const nlohmann::json::exception& e) {
            throw FormatError("Invalid Piper config " + voice_.config_path + ": " + e.what());
        }

        for (const char* required : {"^", "$", "_"}) {
            if (phoneme_ids_.find(required) == phoneme_ids_.end()) {
                throw FormatError("Piper config lacks phoneme '" + std::string(required) + "'");
            }
        }
    }

    std::string run_espeak(const std::string& text) const {
        ScopedTempFile text_file(".txt");
        text_file.write(text);

        std::string command = voice_.espeak_command + " -q --ipa -v " + shell_quote(espeak_voice_) +
                              " -f " + shell_quote(text_file.path()) + " 2>/dev/null";

        FILE* pipe = popen(command.c_str(), "r");
        if (!pipe) {
            throw ExternalServiceError("Cannot run " + voice_.espeak_command);
        }

        std::string output;
        char buffer[4096];
        size_t read = 0;
        while ((read = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
            output.append(buffer, read);
        }

        int status = pclose(pipe);
        if (status != 0) {
            throw ExternalServiceError(voice_.espeak_command + " exited with status " + std::to_string(status));
        }
        return output;
    }

    std::vector<int64_t> phonemize(const std::string& text) const {
        std::string phonemes = run_espeak(text);

        const auto& pad = phoneme_ids_.at("_");
        std::vector<int64_t> ids = phoneme_ids_.at("^");
        ids.insert(ids.end(), pad.begin(), pad.end());

        bool pending_space = false;
        for (const auto& point : split_code_points(phonemes)) {
            if (point == "\n" || point == "\r" || point == " " || point == "\t") {
                pending_space = true;
                continue;
            }

            auto it = phoneme_ids_.find(point);
            if (it == phoneme_ids_.end()) {
                continue;  // Unknown phoneme
            }

            if (pending_space && ids.size() > 2) {
                auto space = phoneme_ids_.find(" ");
                if (space != phoneme_ids_.end()) {
                    ids.insert(ids.end(), space->second.begin(), space->second.end());
                    ids.insert(ids.end(), pad.begin(), pad.end());
                }
            }
            pending_space = false;

            ids.insert(ids.end(), it->second.begin(), it->second.end());
            ids.insert(ids.end(), pad.begin(), pad.end());
        }

        const auto& eos = phoneme_ids_.at("$");
        ids.insert(ids.end(), eos.begin(), eos.end());
        return ids;
    }

    PiperVoice voice_;
    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;

    std::map<std::string, std::vector<int64_t>> phoneme_ids_;
    std::string espeak_voice_ = "en-us";
    int sample_rate_ = 22050;
    int num_speakers_ = 1;
    float noise_scale_ = 0.667f;
    float length_scale_ = 1.0f;
    float noise_w_ = 0.8f;
};

/**
 * Embedder-supplied function.
 */
class CallbackEngine : public VoiceEngine {
public:
    explicit CallbackEngine(CallbackVoice voice) : voice_(std::move(voice)) {
        if (!voice_.synthesize) {
            throw FormatError("Callback voice has no function");
        }
    }

    AudioClip synthesize(const std::string& text, const std::string& language) override {
        return voice_.synthesize(text, language);
    }

    std::string name() const override { return voice_.name; }

private:
    CallbackVoice voice_;
};

struct EngineFactory {
    std::unique_ptr<VoiceEngine> operator()(CommandVoice& voice) const {
        return std::make_unique<CommandEngine>(std::move(voice));
    }
    std::unique_ptr<VoiceEngine> operator()(PiperVoice& voice) const {
        return std::make_unique<PiperEngine>(std::move(voice));
    }
    std::unique_ptr<VoiceEngine> operator()(CallbackVoice& voice) const {
        return std::make_unique<CallbackEngine>(std::move(voice));
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════
// SynthesisBackend
// ═══════════════════════════════════════════════════════════

class SynthesisBackend::Impl {
public:
    explicit Impl(VoiceSelection voice)
        : engine(std::visit(EngineFactory{}, voice))
    {
    }

    std::unique_ptr<VoiceEngine> engine;
};

SynthesisBackend::SynthesisBackend(VoiceSelection voice)
    : pimpl_(std::make_unique<Impl>(std::move(voice)))
{
}

SynthesisBackend::~SynthesisBackend() = default;
SynthesisBackend::SynthesisBackend(SynthesisBackend&&) noexcept = default;
SynthesisBackend& SynthesisBackend::operator=(SynthesisBackend&&) noexcept = default;

SynthesisResult SynthesisBackend::synthesize(const std::string& text, const std::string& language) {
    SynthesisResult result;

    try {
        result.clip = pimpl_->engine->synthesize(text, language);
        result.ok = true;
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
    }

    return result;
}

std::string SynthesisBackend::name() const {
    return pimpl_->engine->name();
}

} // namespace bragi
