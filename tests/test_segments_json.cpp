/**
 * @file test_segments_json.cpp
 * @brief JSON segment sidecar
 */

#include <bragi/errors.h>
#include <bragi/segments_json.h>
#include "test_common.h"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace bragi;

int main() {
    std::vector<Segment> segments = {
        Segment(0.0, 1.25, "Hola"),
        Segment(1.5, 3.75, "¿Qué tal?\nBien"),
    };

    SegmentsJson::Metadata metadata;
    metadata.media_file = "/videos/interview.mkv";
    metadata.language = "es";
    metadata.source_language = "en";
    metadata.duration = 3.75;

    bragi_test::section("document contents");
    std::string json = SegmentsJson::to_json(segments, metadata);
    CHECK(json.find("\"media_file\": \"interview.mkv\"") != std::string::npos);
    CHECK(json.find("\"engine\": \"bragi\"") != std::string::npos);
    CHECK(json.find("\"text\": \"Hola ¿Qué tal?\\nBien\"") != std::string::npos);

    bragi_test::section("parse back");
    SegmentsJson::Metadata parsed_metadata;
    std::vector<Segment> parsed = SegmentsJson::from_json(json, &parsed_metadata);
    CHECK(parsed == segments);
    if (parsed.size() == 2) {
        CHECK(parsed[1].index == 2);
    }
    CHECK(parsed_metadata.media_file == "interview.mkv");
    CHECK(parsed_metadata.language == "es");
    CHECK(parsed_metadata.source_language == "en");
    CHECK(parsed_metadata.duration == 3.75);

    bragi_test::section("malformed documents");
    CHECK_THROWS(SegmentsJson::from_json("not json"), FormatError);
    CHECK_THROWS(SegmentsJson::from_json("{\"segments\": [{\"start\": 0}]}"), FormatError);
    CHECK_THROWS(SegmentsJson::from_json("{}"), FormatError);

    bragi_test::section("files");
    CHECK(SegmentsJson::generate_output_path("/videos/interview.mkv") ==
          "/videos/interview_segments.json");

    fs::path dir = fs::temp_directory_path() / "bragi_test_segments_json";
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path path = dir / "interview_segments.json";

    SegmentsJson::write(segments, metadata, path.string());
    CHECK(fs::exists(path));
    CHECK(!fs::exists(dir / "interview_segments.json.partial"));
    CHECK(SegmentsJson::load(path.string()) == segments);
    CHECK_THROWS(SegmentsJson::load((dir / "missing.json").string()), ResourceError);

    fs::remove_all(dir);
    return bragi_test::finish("test_segments_json");
}
