/**
 * @file test_config.cpp
 * @brief JSON configuration loading
 */

#include <bragi/config.h>
#include <bragi/errors.h>
#include "test_common.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace bragi;

static void test_defaults() {
    bragi_test::section("empty document keeps defaults");

    AppConfig config = parse_config("{}");
    CHECK(config.whisper_model.model_path == "models/whisper-small");
    CHECK(config.nllb_model.model_path == "models/nllb-200-distilled-600M");
    CHECK(config.whisper_model.device == DeviceType::CPU);
    CHECK(config.whisper.language == "auto");
    CHECK(config.transcription.source_language == "auto");
    CHECK(config.synthesis.sample_rate == 24000);
    CHECK(config.synthesis.channels == 1);
    CHECK(config.voice == "espeak-ng");
    CHECK(!config.write_segments_json);
}

static void test_overrides() {
    bragi_test::section("sections override defaults");

    AppConfig config = parse_config(R"({
        "whisper": {"model_path": "/models/whisper-large-v3", "device": "cuda",
                    "compute_type": "float16", "beam_size": 2, "language": "ja"},
        "nllb": {"model_path": "/models/nllb", "max_length": 128},
        "transcription": {"target_language": "km", "write_segments_json": true},
        "synthesis": {"voice": "espeak-ng:km", "sample_rate": 22050, "channels": 2}
    })");

    CHECK(config.whisper_model.model_path == "/models/whisper-large-v3");
    CHECK(config.whisper_model.device == DeviceType::CUDA);
    CHECK(config.whisper_model.compute_type == ComputeType::Float16);
    CHECK(config.whisper_model.device_string() == "cuda");
    CHECK(config.whisper.beam_size == 2);
    CHECK(config.whisper.language == "ja");
    CHECK(config.nllb_model.model_path == "/models/nllb");
    CHECK(config.translation.max_length == 128);
    CHECK(config.transcription.target_language == "km");
    CHECK(config.write_segments_json);
    CHECK(config.voice == "espeak-ng:km");
    CHECK(config.synthesis.sample_rate == 22050);
    CHECK(config.synthesis.channels == 2);
}

static void test_invalid() {
    bragi_test::section("invalid documents");

    CHECK_THROWS(parse_config("{"), FormatError);
    CHECK_THROWS(parse_config("[]"), FormatError);
    CHECK_THROWS(parse_config(R"({"whisper": {"device": "tpu"}})"), FormatError);
    CHECK_THROWS(parse_config(R"({"nllb": {"compute_type": "int4"}})"), FormatError);
    CHECK_THROWS(parse_config(R"({"whisper": {"beam_size": "five"}})"), FormatError);
    CHECK_THROWS(parse_config(R"({"synthesis": {"channels": 0}})"), FormatError);
    CHECK_THROWS(load_config("/nonexistent/bragi.json"), ResourceError);
}

static void test_file() {
    bragi_test::section("load from file");

    fs::path path = fs::temp_directory_path() / "bragi_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"transcription": {"source_language": "en"}})";
    }
    AppConfig config = load_config(path.string());
    CHECK(config.transcription.source_language == "en");
    fs::remove(path);
}

int main() {
    test_defaults();
    test_overrides();
    test_invalid();
    test_file();
    return bragi_test::finish("test_config");
}
