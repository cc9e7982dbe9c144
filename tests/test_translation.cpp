/**
 * @file test_translation.cpp
 * @brief NLLB translation and Whisper model loading
 *
 * Language tables are always checked. Model-backed checks run only when the
 * model directories exist.
 *
 * Usage: test_translation [nllb_model] [whisper_model]
 */

#include <bragi/errors.h>
#include <bragi/transcriber.h>
#include <bragi/translator.h>
#include "test_common.h"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace bragi;

static void test_language_table() {
    bragi_test::section("language table");

    CHECK(Translator::to_nllb_code("en") == "eng_Latn");
    CHECK(Translator::to_nllb_code("km") == "khm_Khmr");
    CHECK(Translator::to_nllb_code("xx").empty());
    CHECK(Translator::from_nllb_code("khm_Khmr") == "km");
    CHECK(Translator::is_language_supported("es"));
    CHECK(!Translator::is_language_supported("klingon"));

    bool has_khmer = false;
    for (const auto& lang : Translator::supported_languages()) {
        if (lang.code == "km") has_khmer = lang.name == "Khmer";
    }
    CHECK(has_khmer);
}

static void test_missing_models() {
    bragi_test::section("missing models are reported");

    ModelOptions missing;
    missing.model_path = "/nonexistent/model";

    CHECK_THROWS(Translator translator(missing), ExternalServiceError);

    Transcriber transcriber(missing, WhisperOptions());
    CHECK(!transcriber.is_loaded());
    CHECK_THROWS(transcriber.transcribe(ExtractedAudio()), ExternalServiceError);
    CHECK_THROWS(transcriber.prepare(), ExternalServiceError);
}

static void test_translate(const std::string& model_path) {
    bragi_test::section("translate with " + model_path);

    ModelOptions options;
    options.model_path = model_path;
    Translator translator(options);

    std::string spanish = translator.translate("Hello, how are you?", "en", "es");
    std::cout << "  en -> es: " << spanish << "\n";
    CHECK(!spanish.empty());
    CHECK(spanish != "Hello, how are you?");

    std::string khmer = translator.translate("Good morning", "en", "km");
    std::cout << "  en -> km: " << khmer << "\n";
    CHECK(!khmer.empty());

    CHECK(translator.translate("Unchanged", "en", "en") == "Unchanged");
    CHECK(translator.translate("   ", "en", "es") == "   ");
    CHECK_THROWS(translator.translate("Hello", "en", "xx"), ExternalServiceError);
}

static void test_prepare(const std::string& model_path) {
    bragi_test::section("load " + model_path);

    ModelOptions options;
    options.model_path = model_path;
    Transcriber transcriber(options, WhisperOptions());
    transcriber.prepare();
    CHECK(transcriber.is_loaded());

    // One second of silence still yields a well-formed result
    ExtractedAudio audio;
    audio.samples.assign(16000, 0.0f);
    audio.duration = 1.0;
    TranscriptionResult result = transcriber.transcribe(audio);
    CHECK(!result.language.empty());
    CHECK(result.duration == 1.0);
}

int main(int argc, char* argv[]) {
    std::string nllb_model = "models/nllb-200-distilled-600M";
    std::string whisper_model = "models/whisper-small";
    if (argc > 1) nllb_model = argv[1];
    if (argc > 2) whisper_model = argv[2];

    test_language_table();
    test_missing_models();

    if (fs::exists(nllb_model)) {
        test_translate(nllb_model);
    } else {
        std::cout << "  skipped translation: model not found at " << nllb_model << "\n";
    }

    if (fs::exists(whisper_model)) {
        test_prepare(whisper_model);
    } else {
        std::cout << "  skipped transcription: model not found at " << whisper_model << "\n";
    }

    return bragi_test::finish("test_translation");
}
