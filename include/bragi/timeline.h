#pragma once

#include "bragi/export.h"
#include "bragi/types.h"
#include <vector>

namespace bragi {

/**
 * @brief Append-only audio buffer with a timing cursor
 *
 * The cursor is the declared end time of the last processed segment, not the
 * length of the audio; the two drift apart whenever a clip is shorter or
 * longer than its slot.
 */
class BRAGI_API Timeline {
public:
    Timeline(int sample_rate, int channels);

    /**
     * @brief Append silence
     * @param seconds Duration (values <= 0 append nothing)
     */
    void append_silence(double seconds);

    /**
     * @brief Append a clip, converting it to the timeline format if needed
     * @throws ExternalServiceError if the clip cannot be converted
     */
    void append(const AudioClip& clip);

    double cursor() const { return cursor_; }
    void set_cursor(double seconds) { cursor_ = seconds; }

    /**
     * @brief Length of the assembled audio in seconds
     */
    double duration() const;

    int sample_rate() const { return sample_rate_; }
    int channels() const { return channels_; }
    bool empty() const { return samples_.empty(); }

    /**
     * @brief Move the assembled audio out (the timeline is left empty)
     */
    AudioClip take();

private:
    int sample_rate_;
    int channels_;
    double cursor_ = 0.0;
    std::vector<float> samples_;
};

} // namespace bragi
