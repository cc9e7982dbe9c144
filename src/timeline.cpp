#include "bragi/timeline.h"
#include "bragi/audio_resampler.h"
#include "bragi/errors.h"
#include <cmath>
#include <utility>

namespace bragi {

Timeline::Timeline(int sample_rate, int channels)
    : sample_rate_(sample_rate > 0 ? sample_rate : 24000)
    , channels_(channels > 0 ? channels : 1)
{
}

void Timeline::append_silence(double seconds) {
    if (seconds <= 0.0) {
        return;
    }
    long long frames = std::llround(seconds * sample_rate_);
    if (frames <= 0) {
        return;
    }
    samples_.insert(samples_.end(), static_cast<size_t>(frames) * channels_, 0.0f);
}

void Timeline::append(const AudioClip& clip) {
    if (clip.empty()) {
        return;
    }

    if (clip.sample_rate == sample_rate_ && clip.channels == channels_) {
        samples_.insert(samples_.end(), clip.samples.begin(), clip.samples.end());
        return;
    }

    AudioResampler resampler;
    AudioClip converted;
    if (!resampler.convert(clip, sample_rate_, channels_, converted)) {
        throw ExternalServiceError("Cannot convert synthesized audio: " + resampler.get_last_error());
    }
    samples_.insert(samples_.end(), converted.samples.begin(), converted.samples.end());
}

double Timeline::duration() const {
    return static_cast<double>(samples_.size() / static_cast<size_t>(channels_)) / sample_rate_;
}

AudioClip Timeline::take() {
    AudioClip clip(std::move(samples_), sample_rate_, channels_);
    samples_.clear();
    return clip;
}

} // namespace bragi
