/**
 * @file test_subtitle_format.cpp
 * @brief SRT serialization and parsing
 */

#include <bragi/errors.h>
#include <bragi/subtitle_export.h>
#include <bragi/subtitle_parser.h>
#include "test_common.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using bragi::Segment;
using bragi::SubtitleParser;
using bragi::SubtitleSerializer;

static void test_serialize() {
    bragi_test::section("serialize");

    std::vector<Segment> segments = {
        Segment(0.0, 1.5, "Hello", 7),
        Segment(2.25, 4.0, "Line one\nLine two  "),
    };

    std::string expected =
        "1\n00:00:00,000 --> 00:00:01,500\nHello\n\n"
        "2\n00:00:02,250 --> 00:00:04,000\nLine one\nLine two\n\n";
    CHECK(SubtitleSerializer::serialize(segments) == expected);
    CHECK(SubtitleSerializer::serialize({}).empty());
    CHECK(SubtitleSerializer::format_block(3, Segment(3661.234, 3662.0, "x")) ==
          "3\n01:01:01,234 --> 01:01:02,000\nx\n\n");
}

static void test_parse() {
    bragi_test::section("parse");

    std::vector<Segment> segments = SubtitleParser::parse(
        "1\n00:00:00,000 --> 00:00:01,500\nHello\n\n"
        "2\n00:00:02,250 --> 00:00:04,000\nLine one\nLine two\n");
    CHECK(segments.size() == 2);
    if (segments.size() == 2) {
        CHECK(segments[0].index == 1);
        CHECK(segments[0].start == 0.0);
        CHECK(segments[0].end == 1.5);
        CHECK(segments[0].text == "Hello");
        CHECK(segments[1].index == 2);
        CHECK(segments[1].start == 2.25);
        CHECK(segments[1].text == "Line one\nLine two");
    }

    CHECK(SubtitleParser::parse("").empty());
    CHECK(SubtitleParser::parse("\n\n\n").empty());
}

static void test_parse_tolerance() {
    bragi_test::section("malformed blocks are skipped");

    std::string text =
        "1\n00:00:01,000 --> 00:00:02,000\nFirst\n\n"
        "2\nno arrow here\nSecond\n\n"
        "3\n00:00:03,000 --> 00:00:04,000\n\n"
        "4\n00:00:xx,000 --> 00:00:06,000\nBroken time\n\n"
        "5\n00:00:07,000 --> 00:00:08,000\nLast\n";

    std::vector<Segment> segments = SubtitleParser::parse(text);
    CHECK(segments.size() == 2);
    if (segments.size() == 2) {
        CHECK(segments[0].text == "First");
        CHECK(segments[0].index == 1);
        CHECK(segments[1].text == "Last");
        CHECK(segments[1].index == 2);
        CHECK(segments[1].start == 7.0);
    }
}

static void test_parse_line_endings() {
    bragi_test::section("BOM, CRLF and whitespace-only separators");

    std::string text =
        "\xEF\xBB\xBF" "1\r\n00:00:01,000 --> 00:00:02,000\r\nOne\r\n  \r\n"
        "2\r\n00:00:03,000 --> 00:00:04,000\r\nTwo\r\n";

    std::vector<Segment> segments = SubtitleParser::parse(text);
    CHECK(segments.size() == 2);
    if (segments.size() == 2) {
        CHECK(segments[0].text == "One");
        CHECK(segments[1].text == "Two");
        CHECK(segments[1].end == 4.0);
    }

    Segment segment;
    CHECK(!SubtitleParser::parse_block({"1", "00:00:01,000 --> 00:00:02,000"}, segment));
    CHECK(SubtitleParser::parse_block({"9", " 00:00:01,000-->00:00:02,000 ", " hi "}, segment));
    CHECK(segment.text == "hi");
    CHECK(segment.start == 1.0);
}

static void test_round_trip() {
    bragi_test::section("serialize then parse");

    std::vector<Segment> segments = {
        Segment(0.0, 1.5, "Hello", 1),
        Segment(2.25, 4.0, "Line one\nLine two", 2),
        Segment(3661.234, 3665.5, "ភាសាខ្មែរ", 3),
    };

    std::vector<Segment> parsed = SubtitleParser::parse(SubtitleSerializer::serialize(segments));
    CHECK(parsed == segments);
}

static void test_files() {
    bragi_test::section("write_srt and load_srt");

    fs::path dir = fs::temp_directory_path() / "bragi_test_subtitle_format";
    fs::remove_all(dir);
    fs::create_directories(dir);

    fs::path dest = dir / "movie.srt";
    std::vector<Segment> segments = {Segment(0.5, 1.0, "Saved")};

    SubtitleSerializer serializer;
    std::string written = serializer.write_srt(segments, dest.string());
    CHECK(written == SubtitleSerializer::serialize(segments));
    CHECK(fs::exists(dest));
    CHECK(!fs::exists(dir / "movie.srt.partial"));

    std::vector<Segment> loaded = SubtitleParser::load_srt(dest.string());
    CHECK(loaded == segments);

    CHECK_THROWS(SubtitleParser::load_srt((dir / "missing.srt").string()), bragi::ResourceError);
    CHECK_THROWS(serializer.write_srt(segments, (dir / "no_such_dir" / "x.srt").string()),
                 bragi::ResourceError);

    CHECK(SubtitleSerializer::generate_output_path("/videos/clip.mp4") == "/videos/clip.srt");

    fs::remove_all(dir);
}

int main() {
    test_serialize();
    test_parse();
    test_parse_tolerance();
    test_parse_line_endings();
    test_round_trip();
    test_files();
    return bragi_test::finish("test_subtitle_format");
}
