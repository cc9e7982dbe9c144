#include "bragi/subtitle_parser.h"
#include "bragi/errors.h"
#include "bragi/timestamp.h"
#include "file_utils.h"
#include <utility>

namespace bragi {

namespace {

const char* kWhitespace = " \t\r\n\f\v";
const std::string kUtf8Bom = "\xEF\xBB\xBF";
const std::string kTimingSeparator = "-->";

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = text.find_last_not_of(kWhitespace);
    return text.substr(begin, end - begin + 1);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(kWhitespace) == std::string::npos;
}

// CRLF and lone CR become LF
std::string normalize_line_endings(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            result += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            result += c;
        }
    }
    return result;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t pos = 0;

    while (pos <= text.size()) {
        size_t next = text.find('\n', pos);
        if (next == std::string::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, next - pos));
        pos = next + 1;
    }
    return lines;
}

} // namespace

bool SubtitleParser::parse_block(const std::vector<std::string>& lines, Segment& segment) {
    if (lines.size() < 3) {
        return false;
    }

    const std::string& timing = lines[1];
    size_t separator = timing.find(kTimingSeparator);
    if (separator == std::string::npos) {
        return false;
    }

    std::string start_text = trim(timing.substr(0, separator));
    std::string end_text = trim(timing.substr(separator + kTimingSeparator.size()));

    double start = 0.0;
    double end = 0.0;
    try {
        start = TimestampCodec::decode(start_text);
        end = TimestampCodec::decode(end_text);
    } catch (const FormatError&) {
        return false;
    }

    std::string text;
    for (size_t i = 2; i < lines.size(); ++i) {
        if (i > 2) {
            text += "\n";
        }
        text += lines[i];
    }

    segment = Segment(start, end, trim(text));
    return true;
}

std::vector<Segment> SubtitleParser::parse(const std::string& text) {
    std::string content = text;
    if (content.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) {
        content.erase(0, kUtf8Bom.size());
    }
    content = normalize_line_endings(content);

    std::vector<Segment> segments;
    std::vector<std::string> block;

    auto flush_block = [&]() {
        if (block.empty()) {
            return;
        }
        Segment parsed;
        if (parse_block(block, parsed)) {
            int index = static_cast<int>(segments.size()) + 1;
            segments.emplace_back(parsed.start, parsed.end, std::move(parsed.text), index);
        }
        block.clear();
    };

    for (const auto& line : split_lines(content)) {
        if (is_blank(line)) {
            flush_block();
        } else {
            block.push_back(line);
        }
    }
    flush_block();

    return segments;
}

std::vector<Segment> SubtitleParser::load_srt(const std::string& path) {
    return parse(detail::read_file(path));
}

} // namespace bragi
