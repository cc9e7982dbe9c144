/**
 * @file test_transcription_pipeline.cpp
 * @brief Media-to-subtitle pipeline driven by in-process collaborators
 */

#include <bragi/errors.h>
#include <bragi/subtitle_parser.h>
#include <bragi/transcription_pipeline.h>
#include "test_common.h"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace bragi;

namespace {

class FakeSource : public AudioSource {
public:
    bool fail = false;
    std::string last_path;

    ExtractedAudio extract(const std::string& media_path) override {
        last_path = media_path;
        if (fail) {
            throw std::runtime_error("no audio stream");
        }
        ExtractedAudio audio;
        audio.samples.assign(16000, 0.0f);
        audio.duration = 10.0;
        return audio;
    }
};

class FakeSpeechToText : public SpeechToText {
public:
    TranscriptionResult result;
    int prepared = 0;
    bool fail_prepare = false;
    bool fail_transcribe = false;

    void prepare() override {
        prepared++;
        if (fail_prepare) {
            throw std::runtime_error("model directory missing");
        }
    }

    TranscriptionResult transcribe(const ExtractedAudio&) override {
        if (fail_transcribe) {
            throw std::runtime_error("decoder crashed");
        }
        return result;
    }
};

class FakeTranslator : public TextTranslator {
public:
    std::string last_source;
    int calls = 0;

    std::string translate(const std::string& text,
                          const std::string& source_lang,
                          const std::string& target_lang) override {
        calls++;
        last_source = source_lang;
        if (text.find("boom") != std::string::npos) {
            throw std::runtime_error("model exploded");
        }
        if (text == "blank") {
            return "";
        }
        return "[" + target_lang + "] " + text;
    }
};

TranscriptionResult two_segments() {
    TranscriptionResult result;
    result.language = "en";
    result.duration = 6.0;
    result.segments.push_back({0.0, 2.5, "Hello there"});
    result.segments.push_back({3.0, 6.0, "General Kenobi"});
    return result;
}

TranscriptionOptions spanish() {
    TranscriptionOptions options;
    options.target_language = "es";
    return options;
}

} // namespace

static void test_happy_path() {
    bragi_test::section("extract, transcribe, translate, serialize");

    FakeSource source;
    FakeSpeechToText stt;
    FakeTranslator translator;
    stt.result = two_segments();

    TranscriptionPipeline pipeline(source, stt, translator, "clip.mp4", spanish());
    std::vector<std::string> messages;
    std::string srt = pipeline.run([&](const std::string& m) { messages.push_back(m); });

    CHECK(srt ==
          "1\n00:00:00,000 --> 00:00:02,500\n[es] Hello there\n\n"
          "2\n00:00:03,000 --> 00:00:06,000\n[es] General Kenobi\n\n");
    CHECK(pipeline.state() == PipelineState::Done);
    CHECK(pipeline.warnings().empty());
    CHECK(pipeline.source_language() == "en");
    CHECK(translator.last_source == "en");
    CHECK(source.last_path == "clip.mp4");
    CHECK(stt.prepared == 1);
    CHECK(pipeline.segments().size() == 2);
    if (pipeline.segments().size() == 2) {
        CHECK(pipeline.segments()[1].text == "[es] General Kenobi");
        CHECK(pipeline.segments()[1].start == 3.0);
        CHECK(pipeline.segments()[1].end == 6.0);
        CHECK(pipeline.segments()[1].index == 2);
    }
    // The transcription itself is left as it came back
    CHECK(stt.result.segments[0].text == "Hello there");

    CHECK(messages.size() >= 4);
    if (!messages.empty()) {
        CHECK(messages.front() == "Extracting audio from clip.mp4...");
    }
    CHECK(std::string(to_string(pipeline.state())) == "done");
}

static void test_explicit_source_language() {
    bragi_test::section("explicit source language overrides detection");

    FakeSource source;
    FakeSpeechToText stt;
    FakeTranslator translator;
    stt.result = two_segments();

    TranscriptionOptions options = spanish();
    options.source_language = "fr";
    TranscriptionPipeline pipeline(source, stt, translator, "clip.mp4", options);
    pipeline.run(ProgressCallback());

    CHECK(translator.last_source == "fr");
    CHECK(pipeline.source_language() == "fr");
}

static void test_translation_failure_keeps_source() {
    bragi_test::section("failed translation keeps the source text");

    FakeSource source;
    FakeSpeechToText stt;
    FakeTranslator translator;
    stt.result = two_segments();
    stt.result.segments[1].text = "boom goes the model";
    stt.result.segments.push_back({7.0, 8.0, "blank"});

    TranscriptionPipeline pipeline(source, stt, translator, "clip.mp4", spanish());
    std::vector<std::string> messages;
    std::string srt = pipeline.run([&](const std::string& m) { messages.push_back(m); });

    std::vector<Segment> segments = SubtitleParser::parse(srt);
    CHECK(segments.size() == 3);
    if (segments.size() == 3) {
        CHECK(segments[0].text == "[es] Hello there");
        CHECK(segments[1].text == "boom goes the model");
        CHECK(segments[2].text == "blank");
    }
    CHECK(pipeline.warnings().size() == 1);
    if (!pipeline.warnings().empty()) {
        CHECK(pipeline.warnings()[0] ==
              "Warning: Translation error for a segment: model exploded");
    }
    CHECK(pipeline.state() == PipelineState::Done);

    TranslationOutcome outcome =
        TranscriptionPipeline::translate_or_keep(translator, "boom", "en", "es");
    CHECK(!outcome.translated);
    CHECK(outcome.text == "boom");
    CHECK(!outcome.warning.empty());
}

static void test_no_segments_fallback() {
    bragi_test::section("whole transcript becomes one segment");

    FakeSource source;
    FakeSpeechToText stt;
    FakeTranslator translator;
    stt.result.language = "en";
    stt.result.full_text = "Everything at once";

    TranscriptionPipeline pipeline(source, stt, translator, "clip.mp4", spanish());
    std::string srt = pipeline.run(ProgressCallback());

    CHECK(srt == "1\n00:00:00,000 --> 00:00:10,000\n[es] Everything at once\n\n");

    TranscriptionResult result;
    result.duration = 4.0;
    result.full_text = "text";
    std::vector<Segment> segments = TranscriptionPipeline::segments_from(result);
    CHECK(segments.size() == 1);
    if (!segments.empty()) {
        CHECK(segments[0].start == 0.0);
        CHECK(segments[0].end == 4.0);
        CHECK(segments[0].text == "text");
    }
}

static void test_extraction_failure() {
    bragi_test::section("extraction failure fails the pipeline");

    FakeSource source;
    FakeSpeechToText stt;
    FakeTranslator translator;
    source.fail = true;

    TranscriptionPipeline pipeline(source, stt, translator, "clip.mp4", spanish());
    CHECK_THROWS(pipeline.run(ProgressCallback()), ExternalServiceError);
    CHECK(pipeline.state() == PipelineState::Failed);
    CHECK(stt.prepared == 0);
    CHECK(translator.calls == 0);
}

static void test_speech_to_text_failure() {
    bragi_test::section("speech-to-text failure fails the pipeline");

    FakeSource source;
    FakeTranslator translator;

    FakeSpeechToText unprepared;
    unprepared.fail_prepare = true;
    TranscriptionPipeline first(source, unprepared, translator, "clip.mp4", spanish());
    CHECK_THROWS(first.run(ProgressCallback()), ExternalServiceError);
    CHECK(first.state() == PipelineState::Failed);
    CHECK(unprepared.prepared == 1);

    FakeSpeechToText crashing;
    crashing.fail_transcribe = true;
    crashing.result = two_segments();
    TranscriptionPipeline second(source, crashing, translator, "clip.mp4", spanish());
    try {
        second.run(ProgressCallback());
        CHECK(false);
    } catch (const ExternalServiceError& e) {
        CHECK(std::string(e.what()) == "Transcription failed: decoder crashed");
    }
    CHECK(second.state() == PipelineState::Failed);
    CHECK(second.segments().empty());

    CHECK(translator.calls == 0);
}

static void test_cancellation() {
    bragi_test::section("cancellation stops before translation");

    FakeSource source;
    FakeSpeechToText stt;
    FakeTranslator translator;
    stt.result = two_segments();

    CancellationToken token;
    token.cancel();
    TranscriptionPipeline pipeline(source, stt, translator, "clip.mp4", spanish());
    CHECK_THROWS(pipeline.run(ProgressCallback(), token), CancelledError);
    CHECK(pipeline.state() == PipelineState::Failed);
    CHECK(translator.calls == 0);
}

static void test_destination_file() {
    bragi_test::section("subtitles written to the destination");

    fs::path dir = fs::temp_directory_path() / "bragi_test_pipeline";
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path dest = dir / "clip.srt";

    FakeSource source;
    FakeSpeechToText stt;
    FakeTranslator translator;
    stt.result = two_segments();

    TranscriptionOptions options = spanish();
    options.destination_path = dest.string();
    TranscriptionPipeline pipeline(source, stt, translator, "clip.mp4", options);

    std::vector<std::string> messages;
    std::string srt = pipeline.run([&](const std::string& m) { messages.push_back(m); });

    CHECK(fs::exists(dest));
    CHECK(SubtitleParser::load_srt(dest.string()) == SubtitleParser::parse(srt));
    CHECK(!messages.empty() && messages.back() == "Subtitles saved to " + dest.string());

    fs::remove_all(dir);
}

int main() {
    test_happy_path();
    test_explicit_source_language();
    test_translation_failure_keeps_source();
    test_no_segments_fallback();
    test_extraction_failure();
    test_speech_to_text_failure();
    test_cancellation();
    test_destination_file();
    return bragi_test::finish("test_transcription_pipeline");
}
