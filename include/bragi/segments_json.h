#pragma once

#include "bragi/export.h"
#include "bragi/types.h"
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief Segments JSON sidecar written next to the subtitles
 *
 * Layout:
 * @code
 * {
 *   "media_file": "video.mp4",
 *   "processed_date": 1718000000,
 *   "engine": "bragi",
 *   "language": "km",
 *   "source_language": "en",
 *   "duration": 12.5,
 *   "text": "...",
 *   "segments": [ { "index": 1, "start": 0.0, "end": 2.5, "text": "..." } ]
 * }
 * @endcode
 */
namespace SegmentsJson {

    /**
     * @brief Metadata stored beside the segments
     */
    struct Metadata {
        std::string media_file;
        std::string language;           // Language of the segment texts
        std::string source_language;    // Spoken language
        double duration = 0.0;
    };

    /**
     * @brief Default sidecar path: <media dir>/<media stem>_segments.json
     */
    BRAGI_API std::string generate_output_path(const std::string& media_path);

    /**
     * @brief Render the sidecar document
     */
    BRAGI_API std::string to_json(const std::vector<Segment>& segments, const Metadata& metadata);

    /**
     * @brief Write the sidecar (atomic replace)
     * @throws ResourceError on write failure
     */
    BRAGI_API void write(const std::vector<Segment>& segments,
                         const Metadata& metadata,
                         const std::string& path);

    /**
     * @brief Parse segments from a sidecar document
     * @param metadata Optional, receives the metadata fields
     * @throws FormatError if the document is not a valid sidecar
     */
    BRAGI_API std::vector<Segment> from_json(const std::string& json, Metadata* metadata = nullptr);

    /**
     * @brief Load segments from a sidecar file
     * @throws ResourceError if unreadable, FormatError if malformed
     */
    BRAGI_API std::vector<Segment> load(const std::string& path, Metadata* metadata = nullptr);
}

} // namespace bragi
