#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace bragi {

/**
 * @brief Tolerant SubRip (.srt) reader
 *
 * Recovers segments from subtitle text, typically text a person has edited.
 * Blocks that cannot be understood are skipped without error:
 *   - fewer than three lines
 *   - no "-->" on the timing line
 *   - a timestamp that does not decode
 *
 * The block number written in the file is ignored; recovered segments are
 * numbered by their position in the result.
 */
class BRAGI_API SubtitleParser {
public:
    /**
     * @brief Parse subtitle text
     *
     * Accepts LF, CRLF or CR line endings and a leading UTF-8 BOM. Blocks are
     * separated by one or more blank (empty or whitespace-only) lines.
     *
     * @param text Subtitle text
     * @return Segments in block order (possibly empty)
     */
    static std::vector<Segment> parse(const std::string& text);

    /**
     * @brief Read and parse a subtitle file
     *
     * @param path Subtitle file path
     * @return Segments in block order (possibly empty)
     * @throws ResourceError if the file cannot be read
     */
    static std::vector<Segment> load_srt(const std::string& path);

    /**
     * @brief Parse one block (lines without the separating blank line)
     *
     * @param lines Block lines
     * @param segment Receives the segment on success
     * @return false if the block is malformed
     */
    static bool parse_block(const std::vector<std::string>& lines, Segment& segment);
};

} // namespace bragi
