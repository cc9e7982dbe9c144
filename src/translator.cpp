#include "bragi/translator.h"
#include "bragi/errors.h"
#include <ctranslate2/devices.h>
#include <ctranslate2/translator.h>
#include <sentencepiece_processor.h>
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace bragi {

namespace {

// FLORES-200 codes of the languages offered for subtitles, by short code
const std::vector<TranslationLanguage>& language_table() {
    static const std::vector<TranslationLanguage> languages = {
        {"ar", "arb_Arab", "Arabic"},
        {"bg", "bul_Cyrl", "Bulgarian"},
        {"bn", "ben_Beng", "Bengali"},
        {"cs", "ces_Latn", "Czech"},
        {"da", "dan_Latn", "Danish"},
        {"de", "deu_Latn", "German"},
        {"el", "ell_Grek", "Greek"},
        {"en", "eng_Latn", "English"},
        {"es", "spa_Latn", "Spanish"},
        {"fa", "pes_Arab", "Persian"},
        {"fi", "fin_Latn", "Finnish"},
        {"fr", "fra_Latn", "French"},
        {"he", "heb_Hebr", "Hebrew"},
        {"hi", "hin_Deva", "Hindi"},
        {"hu", "hun_Latn", "Hungarian"},
        {"id", "ind_Latn", "Indonesian"},
        {"it", "ita_Latn", "Italian"},
        {"ja", "jpn_Jpan", "Japanese"},
        {"km", "khm_Khmr", "Khmer"},
        {"ko", "kor_Hang", "Korean"},
        {"lo", "lao_Laoo", "Lao"},
        {"ms", "zsm_Latn", "Malay"},
        {"my", "mya_Mymr", "Burmese"},
        {"nl", "nld_Latn", "Dutch"},
        {"no", "nob_Latn", "Norwegian (Bokmal)"},
        {"pl", "pol_Latn", "Polish"},
        {"pt", "por_Latn", "Portuguese"},
        {"ro", "ron_Latn", "Romanian"},
        {"ru", "rus_Cyrl", "Russian"},
        {"sv", "swe_Latn", "Swedish"},
        {"ta", "tam_Taml", "Tamil"},
        {"th", "tha_Thai", "Thai"},
        {"tl", "tgl_Latn", "Tagalog"},
        {"tr", "tur_Latn", "Turkish"},
        {"uk", "ukr_Cyrl", "Ukrainian"},
        {"ur", "urd_Arab", "Urdu"},
        {"vi", "vie_Latn", "Vietnamese"},
        {"zh", "zho_Hans", "Chinese (Simplified)"},
    };
    return languages;
}

const TranslationLanguage* find_language(const std::string& value,
                                         std::string TranslationLanguage::*field) {
    const auto& languages = language_table();
    auto it = std::find_if(languages.begin(), languages.end(),
                           [&](const TranslationLanguage& lang) { return lang.*field == value; });
    return it != languages.end() ? &*it : nullptr;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Implementation
// ═══════════════════════════════════════════════════════════════════════════

class Translator::Impl {
public:
    std::unique_ptr<ctranslate2::Translator> model;
    sentencepiece::SentencePieceProcessor sp_processor;
    TranslationOptions options;
    std::string device_str;

    Impl(const ModelOptions& model_options, const TranslationOptions& translation_options)
        : options(translation_options)
        , device_str(model_options.device_string())
    {
        std::filesystem::path sp_model_path =
            std::filesystem::path(model_options.model_path) / "sentencepiece.bpe.model";

        try {
            ctranslate2::Device ct_device =
                model_options.device == DeviceType::CUDA ? ctranslate2::Device::CUDA : ctranslate2::Device::CPU;
            if (model_options.device == DeviceType::Auto &&
                ctranslate2::get_device_count(ctranslate2::Device::CUDA) > 0) {
                ct_device = ctranslate2::Device::CUDA;
            }
            device_str = ct_device == ctranslate2::Device::CUDA ? "cuda" : "cpu";

            model = std::make_unique<ctranslate2::Translator>(
                model_options.model_path,
                ct_device,
                ctranslate2::str_to_compute_type(model_options.compute_type_string()),
                std::vector<int>{model_options.device_index}
            );
        } catch (const std::exception& e) {
            std::cerr << "[Bragi] Failed to load translator: " << e.what() << "\n";
            throw ExternalServiceError(std::string("Failed to load NLLB model: ") + e.what());
        }

        auto status = sp_processor.Load(sp_model_path.string());
        if (!status.ok()) {
            std::cerr << "[Bragi] SentencePiece load failed: " << status.ToString() << "\n";
            throw ExternalServiceError("Failed to load SentencePiece model " + sp_model_path.string() +
                                       ": " + status.ToString());
        }

        std::cout << "[Bragi] Translator loaded: " << model_options.model_path
                  << " (device=" << device_str << ", compute=" << model_options.compute_type_string() << ")\n";
    }

    ~Impl() {
        // Model must go before the tokenizer
        model.reset();
    }

    std::vector<std::string> tokenize(const std::string& text) {
        std::vector<std::string> tokens;
        auto status = sp_processor.Encode(text, &tokens);
        if (!status.ok()) {
            throw ExternalServiceError("SentencePiece encode failed: " + status.ToString());
        }
        return tokens;
    }

    std::string detokenize(const std::vector<std::string>& tokens) {
        std::string result;
        auto status = sp_processor.Decode(tokens, &result);
        if (!status.ok()) {
            throw ExternalServiceError("SentencePiece decode failed: " + status.ToString());
        }
        return result;
    }

    // Remove a leading target language token and surrounding whitespace
    std::string clean_output(const std::string& text, const std::string& target_nllb) {
        std::string result = text;

        if (result.compare(0, target_nllb.size(), target_nllb) == 0) {
            result = result.substr(target_nllb.size());
        }

        auto start = result.find_first_not_of(" \t\n\r");
        if (start == std::string::npos) {
            return "";
        }
        auto end = result.find_last_not_of(" \t\n\r");
        return result.substr(start, end - start + 1);
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════════════════

Translator::Translator(const ModelOptions& model, const TranslationOptions& options)
    : pimpl_(std::make_unique<Impl>(model, options))
{
}

Translator::~Translator() = default;

Translator::Translator(Translator&&) noexcept = default;
Translator& Translator::operator=(Translator&&) noexcept = default;

std::string Translator::translate(const std::string& text,
                                  const std::string& source_lang,
                                  const std::string& target_lang) {
    std::string src_nllb = to_nllb_code(source_lang);
    std::string tgt_nllb = to_nllb_code(target_lang);

    if (src_nllb.empty() || tgt_nllb.empty()) {
        throw ExternalServiceError("Unsupported language pair: " + source_lang + " -> " + target_lang);
    }

    if (src_nllb == tgt_nllb || text.find_first_not_of(" \t\n\r") == std::string::npos) {
        return text;
    }

    ctranslate2::TranslationOptions ct_options;
    ct_options.beam_size = pimpl_->options.beam_size;
    ct_options.length_penalty = pimpl_->options.length_penalty;
    ct_options.repetition_penalty = pimpl_->options.repetition_penalty;
    ct_options.no_repeat_ngram_size = pimpl_->options.no_repeat_ngram_size;
    ct_options.max_decoding_length = pimpl_->options.max_length;

    // NLLB format: [source_lang_token, tokens..., </s>], decoder prefix [</s>, target_lang_token]
    std::vector<std::string> tokens;
    tokens.push_back(src_nllb);
    auto text_tokens = pimpl_->tokenize(text);
    tokens.insert(tokens.end(), text_tokens.begin(), text_tokens.end());
    tokens.push_back("</s>");

    std::vector<std::vector<std::string>> inputs = {tokens};
    std::vector<std::vector<std::string>> prefixes = {{"</s>", tgt_nllb}};

    std::vector<ctranslate2::TranslationResult> results;
    try {
        results = pimpl_->model->translate_batch(inputs, prefixes, ct_options);
    } catch (const std::exception& e) {
        throw ExternalServiceError(std::string("Translation failed: ") + e.what());
    }

    if (results.empty() || results[0].hypotheses.empty()) {
        throw ExternalServiceError("Translation returned no hypothesis");
    }

    // Drop the forced target language token before detokenizing
    std::vector<std::string> output = results[0].hypotheses[0];
    if (!output.empty() && output.front() == tgt_nllb) {
        output.erase(output.begin());
    }

    return pimpl_->clean_output(pimpl_->detokenize(output), tgt_nllb);
}

bool Translator::is_language_supported(const std::string& lang_code) {
    return find_language(lang_code, &TranslationLanguage::code) != nullptr;
}

std::vector<TranslationLanguage> Translator::supported_languages() {
    return language_table();
}

std::string Translator::to_nllb_code(const std::string& code) {
    const TranslationLanguage* lang = find_language(code, &TranslationLanguage::code);
    return lang ? lang->nllb_code : std::string();
}

std::string Translator::from_nllb_code(const std::string& nllb_code) {
    const TranslationLanguage* lang = find_language(nllb_code, &TranslationLanguage::nllb_code);
    return lang ? lang->code : std::string();
}

std::string Translator::device() const {
    return pimpl_ ? pimpl_->device_str : "unknown";
}

} // namespace bragi
