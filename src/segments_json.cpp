#include "bragi/segments_json.h"
#include "bragi/errors.h"
#include "file_utils.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>

namespace bragi {

namespace SegmentsJson {

std::string generate_output_path(const std::string& media_path) {
    std::filesystem::path media(media_path);
    std::filesystem::path output = media.parent_path();
    output /= media.stem().string() + "_segments.json";
    return output.string();
}

std::string to_json(const std::vector<Segment>& segments, const Metadata& metadata) {
    nlohmann::json doc;

    auto now = std::chrono::system_clock::now();
    doc["media_file"] = std::filesystem::path(metadata.media_file).filename().string();
    doc["processed_date"] = std::chrono::system_clock::to_time_t(now);
    doc["engine"] = "bragi";
    doc["language"] = metadata.language;
    doc["source_language"] = metadata.source_language;
    doc["duration"] = metadata.duration;

    std::string full_text;
    nlohmann::json items = nlohmann::json::array();
    int index = 1;
    for (const auto& seg : segments) {
        if (!full_text.empty()) {
            full_text += " ";
        }
        full_text += seg.text;

        items.push_back({
            {"index", index++},
            {"start", seg.start},
            {"end", seg.end},
            {"text", seg.text}
        });
    }

    doc["text"] = full_text;
    doc["segments"] = items;

    return doc.dump(2) + "\n";
}

void write(const std::vector<Segment>& segments, const Metadata& metadata, const std::string& path) {
    detail::write_file_atomic(path, to_json(segments, metadata));
}

std::vector<Segment> from_json(const std::string& json, Metadata* metadata) {
    std::vector<Segment> segments;

    try {
        nlohmann::json doc = nlohmann::json::parse(json);

        for (const auto& item : doc.at("segments")) {
            segments.emplace_back(item.at("start").get<double>(),
                                  item.at("end").get<double>(),
                                  item.at("text").get<std::string>(),
                                  static_cast<int>(segments.size()) + 1);
        }

        if (metadata) {
            metadata->media_file = doc.value("media_file", "");
            metadata->language = doc.value("language", "");
            metadata->source_language = doc.value("source_language", "");
            metadata->duration = doc.value("duration", 0.0);
        }
    } catch (const nlohmann::json::exception& e) {
        throw FormatError(std::string("Invalid segments JSON: ") + e.what());
    }

    return segments;
}

std::vector<Segment> load(const std::string& path, Metadata* metadata) {
    return from_json(detail::read_file(path), metadata);
}

} // namespace SegmentsJson

} // namespace bragi
