#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief SubRip (.srt) serializer
 *
 * Renders segments into subtitle text. Indices are renumbered from 1 in
 * sequence order; timing is written as given (no overlap or duration checks).
 *
 * Example usage:
 * @code
 * bragi::SubtitleSerializer serializer;
 * std::string text = serializer.serialize(segments);
 * serializer.write_srt(segments,
 *     bragi::SubtitleSerializer::generate_output_path("video.mp4"));  // video.srt
 * @endcode
 */
class BRAGI_API SubtitleSerializer {
public:
    SubtitleSerializer() = default;
    ~SubtitleSerializer() = default;

    // ═══════════════════════════════════════════════════════════
    // Serialization
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Render segments into subtitle text
     *
     * Each block is "<i>\n<start> --> <end>\n<text>\n\n". Trailing whitespace
     * of the text is trimmed; leading whitespace and inner line breaks are kept.
     *
     * @param segments Segments in playback order
     * @return Subtitle text (empty for an empty sequence)
     */
    static std::string serialize(const std::vector<Segment>& segments);

    /**
     * @brief Format a single block
     *
     * @param index 1-based block number
     * @param segment Segment to format
     * @return Block text including the separating blank line
     */
    static std::string format_block(int index, const Segment& segment);

    // ═══════════════════════════════════════════════════════════
    // Export
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Serialize and write to a destination file
     *
     * The text is built fully in memory before the file is touched, then
     * written through a temporary sibling that is renamed into place.
     *
     * @param segments Segments in playback order
     * @param destination Output file path
     * @return Subtitle text that was written
     * @throws ResourceError if the file cannot be written
     */
    std::string write_srt(const std::vector<Segment>& segments,
                          const std::string& destination) const;

    // ═══════════════════════════════════════════════════════════
    // Utilities
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Default subtitle path for a media file
     *
     * @param media_path Media file path
     * @return <media dir>/<media stem>.srt
     */
    static std::string generate_output_path(const std::string& media_path);
};

} // namespace bragi
