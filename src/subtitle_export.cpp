#include "bragi/subtitle_export.h"
#include "bragi/timestamp.h"
#include "file_utils.h"
#include <filesystem>
#include <iostream>
#include <sstream>

namespace bragi {

namespace {

std::string trim_trailing_whitespace(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n\f\v");
    if (end == std::string::npos) {
        return std::string();
    }
    return text.substr(0, end + 1);
}

} // namespace

// ═══════════════════════════════════════════════════════════
// Serialization
// ═══════════════════════════════════════════════════════════

std::string SubtitleSerializer::format_block(int index, const Segment& segment) {
    std::ostringstream oss;

    oss << index << "\n";
    oss << TimestampCodec::encode(segment.start) << " --> "
        << TimestampCodec::encode(segment.end) << "\n";
    oss << trim_trailing_whitespace(segment.text) << "\n";
    oss << "\n";

    return oss.str();
}

std::string SubtitleSerializer::serialize(const std::vector<Segment>& segments) {
    std::string result;
    int index = 1;

    for (const auto& segment : segments) {
        result += format_block(index++, segment);
    }

    return result;
}

// ═══════════════════════════════════════════════════════════
// Export
// ═══════════════════════════════════════════════════════════

std::string SubtitleSerializer::write_srt(const std::vector<Segment>& segments,
                                          const std::string& destination) const {
    std::string text = serialize(segments);
    detail::write_file_atomic(destination, text);

    std::cout << "[Bragi] Wrote " << segments.size() << " subtitle blocks to "
              << destination << std::endl;
    return text;
}

// ═══════════════════════════════════════════════════════════
// Utilities
// ═══════════════════════════════════════════════════════════

std::string SubtitleSerializer::generate_output_path(const std::string& media_path) {
    std::filesystem::path media(media_path);
    std::filesystem::path output = media.parent_path();
    output /= media.stem().string() + ".srt";
    return output.string();
}

} // namespace bragi
