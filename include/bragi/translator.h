#pragma once

#include "bragi/export.h"
#include "bragi/collaborators.h"
#include "bragi/types.h"
#include <memory>
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief Subtitle language known to the NLLB translator
 */
struct TranslationLanguage {
    std::string code;       // ISO 639-1 code as used on the command line ("km")
    std::string nllb_code;  // FLORES-200 code ("khm_Khmr")
    std::string name;       // Display name ("Khmer")
};

/**
 * @brief NLLB decoding settings, applied to every subtitle segment
 */
struct TranslationOptions {
    int beam_size = 4;
    float length_penalty = 1.0f;
    int max_length = 256;               // Decoding limit in tokens for one segment
    float repetition_penalty = 1.0f;
    int no_repeat_ngram_size = 0;       // 0 = off
};

/**
 * @brief Segment translator backed by a CTranslate2 NLLB-200 model
 *
 * The model directory must also contain sentencepiece.bpe.model, which
 * tokenizes source text and detokenizes hypotheses.
 *
 * One instance serves one pipeline; translate() must not be called
 * concurrently on the same object. The language table helpers are static
 * and safe from any thread.
 *
 * @code
 *   bragi::ModelOptions model;
 *   model.model_path = "models/nllb-200-distilled-600M";
 *   bragi::Translator translator(model);
 *   std::string khmer = translator.translate("Hello world", "en", "km");
 * @endcode
 */
class BRAGI_API Translator : public TextTranslator {
public:
    /**
     * @brief Load the NLLB model and its tokenizer
     * @throws ExternalServiceError if either cannot be loaded
     */
    explicit Translator(const ModelOptions& model,
                        const TranslationOptions& options = TranslationOptions());

    ~Translator() override;

    Translator(const Translator&) = delete;
    Translator& operator=(const Translator&) = delete;
    Translator(Translator&&) noexcept;
    Translator& operator=(Translator&&) noexcept;

    /**
     * @brief Translate one subtitle text
     *
     * Blank text, or a source language equal to the target, comes back as is.
     *
     * @throws ExternalServiceError when a language has no NLLB code or
     *         inference fails
     */
    std::string translate(const std::string& text,
                          const std::string& source_lang,
                          const std::string& target_lang) override;

    static bool is_language_supported(const std::string& lang_code);

    static std::vector<TranslationLanguage> supported_languages();

    /**
     * @return FLORES-200 code for a short code, empty when there is none
     */
    static std::string to_nllb_code(const std::string& code);

    /**
     * @return Short code for a FLORES-200 code, empty when there is none
     */
    static std::string from_nllb_code(const std::string& nllb_code);

    /**
     * @brief "cuda" or "cpu", whichever the model was placed on
     */
    std::string device() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace bragi
