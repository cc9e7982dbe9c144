#pragma once

#include "export.h"
#include <cstdint>
#include <string>

namespace bragi {

/**
 * @brief SubRip timestamp codec (HH:MM:SS,mmm)
 *
 * Milliseconds are truncated, never rounded, so encode() is reproducible and
 * decode(encode(x)) == x holds exactly for millisecond-aligned values.
 * Hours are not wrapped at 24.
 */
class BRAGI_API TimestampCodec {
public:
    /**
     * @brief Format seconds as HH:MM:SS,mmm
     * @param seconds Time in seconds (negative values clamp to zero)
     * @throws FormatError for infinity or a millisecond count beyond int64_t
     */
    static std::string encode(double seconds);

    /**
     * @brief Parse HH:MM:SS,mmm (grammar \d+:\d{2}:\d{2},\d{3})
     * @throws FormatError if the text does not match the grammar
     */
    static double decode(const std::string& text);

    /**
     * @brief Truncated whole-millisecond count for a time in seconds
     * @throws FormatError for infinity or a count beyond int64_t
     */
    static int64_t to_milliseconds(double seconds);
};

} // namespace bragi
