#pragma once

#include "bragi/export.h"
#include "bragi/types.h"
#include <string>

namespace bragi {

/**
 * @brief Sample rate and channel layout conversion (libswresample)
 *
 * Used when a synthesis backend returns audio in a format different from the
 * timeline's.
 */
class BRAGI_API AudioResampler {
public:
    /**
     * @brief Convert a clip to another rate and channel count
     *
     * @param input Source clip
     * @param sample_rate Target sample rate
     * @param channels Target channel count
     * @param output Receives the converted clip
     * @return True if successful
     */
    bool convert(const AudioClip& input, int sample_rate, int channels, AudioClip& output);

    std::string get_last_error() const { return last_error_; }

private:
    std::string last_error_;
};

} // namespace bragi
