#include "bragi/transcriber.h"
#include "bragi/errors.h"
#include "bragi/mel_spectrogram.h"
#include <ctranslate2/devices.h>
#include <ctranslate2/models/whisper.h>
#include <ctranslate2/utils.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace bragi {

// ═══════════════════════════════════════════════════════════
// Token helpers
// ═══════════════════════════════════════════════════════════

namespace whisper_tokens {

namespace {

const std::string kGpt2Space = "\xC4\xA0";  // Ġ in UTF-8 (U+0120)

bool is_marker(const std::string& token) {
    return token.size() >= 4 && token.compare(0, 2, "<|") == 0 &&
           token.compare(token.size() - 2, 2, "|>") == 0;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(" \t\n\r");
    return text.substr(begin, end - begin + 1);
}

} // namespace

double parse_timestamp_token(const std::string& token) {
    // <|0.00|> ... <|30.00|>
    if (token.size() < 6 || !is_marker(token)) {
        return -1.0;
    }

    std::string inner = token.substr(2, token.size() - 4);
    bool has_dot = false;
    for (char c : inner) {
        if (c == '.') {
            if (has_dot) return -1.0;
            has_dot = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1.0;
        }
    }
    if (!has_dot) {
        return -1.0;
    }
    return std::stod(inner);
}

std::string clean_token(const std::string& token) {
    std::string processed = token;
    size_t pos = 0;
    while ((pos = processed.find(kGpt2Space, pos)) != std::string::npos) {
        processed.replace(pos, kGpt2Space.size(), " ");
        pos += 1;
    }
    return processed;
}

std::vector<TranscribedSegment> extract_segments(const std::vector<std::string>& tokens,
                                                 double offset,
                                                 double window_end) {
    std::vector<TranscribedSegment> segments;

    double current_start = -1.0;
    std::string current_text;

    auto close_segment = [&](double end) {
        std::string text = trim(current_text);
        if (!text.empty()) {
            TranscribedSegment seg;
            seg.start = current_start < 0.0 ? offset : current_start;
            seg.end = std::max(end, seg.start);
            seg.text = std::move(text);
            segments.push_back(std::move(seg));
        }
        current_text.clear();
    };

    for (const auto& token : tokens) {
        double timestamp = parse_timestamp_token(token);

        if (timestamp >= 0.0) {
            double absolute_time = offset + timestamp;
            if (!trim(current_text).empty()) {
                close_segment(absolute_time);
            }
            current_start = absolute_time;
        } else if (!is_marker(token)) {
            current_text += clean_token(token);
        }
    }

    // Text after the last timestamp runs to the end of the window
    if (!trim(current_text).empty()) {
        close_segment(window_end);
    }

    return segments;
}

} // namespace whisper_tokens

// =======================
// Transcriber::Impl
// =======================

class Transcriber::Impl {
public:
    Impl(const ModelOptions& model_options, const WhisperOptions& options)
        : model_options(model_options)
        , options(options)
        , mel_converter(16000, 400, 80, 160)
    {
    }

    ModelOptions model_options;
    WhisperOptions options;
    std::unique_ptr<ctranslate2::models::Whisper> model;
    MelSpectrogram mel_converter;

    void load();

    std::string detect_language(const ctranslate2::StorageView& features);

    std::vector<std::string> decode_window(const ctranslate2::StorageView& features,
                                           const std::string& language);
};

void Transcriber::Impl::load() {
    ctranslate2::Device device;
    switch (model_options.device) {
        case DeviceType::CUDA:
            device = ctranslate2::Device::CUDA;
            break;
        case DeviceType::CPU:
            device = ctranslate2::Device::CPU;
            break;
        default:
            device = ctranslate2::get_device_count(ctranslate2::Device::CUDA) > 0
                ? ctranslate2::Device::CUDA : ctranslate2::Device::CPU;
    }

    model = std::make_unique<ctranslate2::models::Whisper>(
        model_options.model_path,
        device,
        ctranslate2::str_to_compute_type(model_options.compute_type_string()),
        std::vector<int>{model_options.device_index}
    );

    size_t n_mels = model->n_mels();
    if (n_mels != static_cast<size_t>(mel_converter.getMelBins())) {
        mel_converter = MelSpectrogram(16000, 400, static_cast<int>(n_mels), 160);
    }

    std::cout << "[Bragi] Whisper model loaded: " << model_options.model_path
              << " (" << (model->is_multilingual() ? "multilingual" : "English-only")
              << ", " << n_mels << " mel bins, device=" << model_options.device_string()
              << ", compute=" << model_options.compute_type_string() << ")\n";
}

std::string Transcriber::Impl::detect_language(const ctranslate2::StorageView& features) {
    if (!model->is_multilingual()) {
        return "en";
    }

    auto futures = model->detect_language(features);
    if (futures.empty()) {
        return "en";
    }

    auto lang_probs = futures[0].get();
    if (lang_probs.empty()) {
        return "en";
    }

    auto best = std::max_element(lang_probs.begin(), lang_probs.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });

    // "<|en|>" -> "en"
    std::string lang_code = best->first;
    if (lang_code.size() >= 4 && lang_code.compare(0, 2, "<|") == 0) {
        lang_code = lang_code.substr(2, lang_code.size() - 4);
    }

    std::cout << "[Bragi] Detected language: " << lang_code
              << " (probability: " << best->second << ")\n";
    return lang_code;
}

std::vector<std::string> Transcriber::Impl::decode_window(const ctranslate2::StorageView& features,
                                                          const std::string& language) {
    std::vector<std::string> prompt = {"<|startoftranscript|>"};
    if (model->is_multilingual()) {
        prompt.push_back("<|" + language + "|>");
        prompt.push_back("<|" + options.task + "|>");
    }

    ctranslate2::models::WhisperOptions whisper_options;
    whisper_options.beam_size = options.beam_size;
    whisper_options.patience = options.patience;
    whisper_options.length_penalty = options.length_penalty;
    whisper_options.repetition_penalty = options.repetition_penalty;
    whisper_options.no_repeat_ngram_size = options.no_repeat_ngram_size;
    whisper_options.max_length = options.max_length;
    whisper_options.num_hypotheses = 1;
    whisper_options.return_scores = false;
    whisper_options.max_initial_timestamp_index = 50;
    whisper_options.suppress_blank = options.suppress_blank;

    std::vector<std::vector<std::string>> prompts = {prompt};
    auto futures = model->generate(features, prompts, whisper_options);
    if (futures.empty()) {
        return {};
    }

    auto result = futures[0].get();
    if (result.sequences.empty()) {
        return {};
    }
    return result.sequences[0];
}

// =======================
// Transcriber Public API
// =======================

Transcriber::Transcriber(const ModelOptions& options, const WhisperOptions& whisper_options)
    : pimpl_(std::make_unique<Impl>(options, whisper_options))
{
}

Transcriber::~Transcriber() = default;
Transcriber::Transcriber(Transcriber&&) noexcept = default;
Transcriber& Transcriber::operator=(Transcriber&&) noexcept = default;

bool Transcriber::is_loaded() const {
    return pimpl_->model != nullptr;
}

void Transcriber::prepare() {
    if (pimpl_->model) {
        return;
    }

    try {
        pimpl_->load();
    } catch (const std::exception& e) {
        pimpl_->model.reset();
        std::cerr << "[Bragi] Failed to load Whisper model: " << e.what() << "\n";
        throw ExternalServiceError(std::string("Failed to load Whisper model: ") + e.what());
    }
}

TranscriptionResult Transcriber::transcribe(const ExtractedAudio& audio) {
    if (!pimpl_->model) {
        throw ExternalServiceError("Whisper model is not loaded");
    }
    if (audio.sample_rate != 16000) {
        throw ExternalServiceError("Whisper expects 16kHz audio, got " + std::to_string(audio.sample_rate) + "Hz");
    }

    TranscriptionResult result;
    result.duration = audio.duration > 0.0
        ? audio.duration
        : audio.samples.size() / 16000.0;

    const size_t window = MelSpectrogram::CHUNK_SAMPLES;
    const int n_mels = pimpl_->mel_converter.getMelBins();
    std::string language = pimpl_->options.language;

    try {
        for (size_t start = 0; start < audio.samples.size(); start += window) {
            size_t count = std::min(window, audio.samples.size() - start);
            double offset = start / 16000.0;
            double window_end = (start + count) / 16000.0;

            std::vector<float> mel = pimpl_->mel_converter.computeChunk(audio.samples.data() + start, count);
            ctranslate2::StorageView features(
                ctranslate2::Shape{1, static_cast<ctranslate2::dim_t>(n_mels),
                                   static_cast<ctranslate2::dim_t>(MelSpectrogram::CHUNK_FRAMES)},
                mel
            );

            if (language.empty() || language == "auto") {
                language = pimpl_->detect_language(features);
            }

            std::vector<std::string> tokens = pimpl_->decode_window(features, language);
            auto segments = whisper_tokens::extract_segments(tokens, offset, window_end);

            for (auto& seg : segments) {
                if (!result.full_text.empty()) {
                    result.full_text += " ";
                }
                result.full_text += seg.text;
                result.segments.push_back(std::move(seg));
            }

            std::cout << "[Bragi] Window at " << offset << "s: " << segments.size() << " segments\n";
        }
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw ExternalServiceError(std::string("Whisper inference failed: ") + e.what());
    }

    result.language = (language.empty() || language == "auto") ? "en" : language;
    return result;
}

} // namespace bragi
