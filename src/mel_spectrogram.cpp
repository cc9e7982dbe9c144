#include "bragi/mel_spectrogram.h"
#include <algorithm>
#include <cmath>
#include <limits>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace bragi {

// Slaney mel scale (librosa default, used by Whisper's filters):
// linear below 1 kHz, logarithmic above
namespace {

const float kMelLinearStep = 200.0f / 3.0f;
const float kMelLogStartHz = 1000.0f;
const float kMelLogStart = kMelLogStartHz / kMelLinearStep;
const float kMelLogStep = std::log(6.4f) / 27.0f;

} // namespace

MelSpectrogram::MelSpectrogram(int sample_rate, int n_fft, int n_mels, int hop_length)
    : sample_rate_(sample_rate)
    , n_fft_(n_fft)
    , n_mels_(n_mels)
    , hop_length_(hop_length)
{
    hann_window_ = createHannWindow(n_fft);
    mel_filters_ = createMelFilters(sample_rate, n_fft, n_mels);

    // DFT twiddle factors, indexed by (k * n) % n_fft
    cos_table_.resize(n_fft);
    sin_table_.resize(n_fft);
    for (int i = 0; i < n_fft; i++) {
        double angle = 2.0 * M_PI * i / n_fft;
        cos_table_[i] = static_cast<float>(std::cos(angle));
        sin_table_[i] = static_cast<float>(std::sin(angle));
    }
}

std::vector<float> MelSpectrogram::createHannWindow(int size)
{
    // Periodic window (torch.hann_window default)
    std::vector<float> window(size);
    for (int i = 0; i < size; i++) {
        window[i] = static_cast<float>(0.5 * (1.0 - std::cos(2.0 * M_PI * i / size)));
    }
    return window;
}

float MelSpectrogram::hzToMel(float hz)
{
    return hz < kMelLogStartHz
        ? hz / kMelLinearStep
        : kMelLogStart + std::log(hz / kMelLogStartHz) / kMelLogStep;
}

float MelSpectrogram::melToHz(float mel)
{
    return mel < kMelLogStart
        ? mel * kMelLinearStep
        : kMelLogStartHz * std::exp(kMelLogStep * (mel - kMelLogStart));
}

std::vector<std::vector<float>> MelSpectrogram::createMelFilters(int sample_rate, int n_fft, int n_mels)
{
    const int bins = n_fft / 2 + 1;
    const float top_mel = hzToMel(sample_rate / 2.0f);
    const float bin_hz = sample_rate / static_cast<float>(n_fft);

    // n_mels + 2 equally spaced mel points give each triangle its edges
    std::vector<float> edges_hz(n_mels + 2);
    for (size_t i = 0; i < edges_hz.size(); i++) {
        edges_hz[i] = melToHz(top_mel * i / (n_mels + 1));
    }

    std::vector<std::vector<float>> filters(n_mels, std::vector<float>(bins, 0.0f));
    for (int m = 0; m < n_mels; m++) {
        const float lower = edges_hz[m];
        const float peak = edges_hz[m + 1];
        const float upper = edges_hz[m + 2];
        const float area_norm = 2.0f / (upper - lower);

        for (int bin = 0; bin < bins; bin++) {
            float hz = bin * bin_hz;
            float rising = (hz - lower) / (peak - lower);
            float falling = (upper - hz) / (upper - peak);
            filters[m][bin] = area_norm * std::max(0.0f, std::min(rising, falling));
        }
    }

    return filters;
}

std::vector<std::vector<float>> MelSpectrogram::computePowerSpectrum(const std::vector<float>& samples)
{
    int pad = n_fft_ / 2;
    int n_samples = static_cast<int>(samples.size());
    if (n_samples <= pad) {
        return {};
    }

    // Reflect padding (center=True)
    std::vector<float> padded(n_samples + 2 * pad);
    for (int i = 0; i < pad; i++) {
        padded[i] = samples[pad - i];
        padded[pad + n_samples + i] = samples[n_samples - 2 - i];
    }
    std::copy(samples.begin(), samples.end(), padded.begin() + pad);

    int n_frames = n_samples / hop_length_;  // Last centered frame dropped
    int n_freqs = n_fft_ / 2 + 1;
    std::vector<std::vector<float>> power(n_frames, std::vector<float>(n_freqs));
    std::vector<float> windowed(n_fft_);

    for (int frame = 0; frame < n_frames; frame++) {
        int offset = frame * hop_length_;
        for (int n = 0; n < n_fft_; n++) {
            windowed[n] = padded[offset + n] * hann_window_[n];
        }

        for (int k = 0; k < n_freqs; k++) {
            float re = 0.0f;
            float im = 0.0f;
            for (int n = 0; n < n_fft_; n++) {
                int idx = (k * n) % n_fft_;
                re += windowed[n] * cos_table_[idx];
                im -= windowed[n] * sin_table_[idx];
            }
            power[frame][k] = re * re + im * im;
        }
    }

    return power;
}

int MelSpectrogram::compute(const std::vector<float>& samples, std::vector<std::vector<float>>& mel_output)
{
    std::vector<std::vector<float>> power = computePowerSpectrum(samples);
    int n_frames = static_cast<int>(power.size());

    mel_output.assign(n_frames, std::vector<float>(n_mels_));
    if (n_frames == 0) {
        return 0;
    }

    int n_freqs = n_fft_ / 2 + 1;
    float max_log = -std::numeric_limits<float>::infinity();

    for (int frame = 0; frame < n_frames; frame++) {
        for (int mel = 0; mel < n_mels_; mel++) {
            float mel_value = 0.0f;
            for (int freq = 0; freq < n_freqs; freq++) {
                mel_value += mel_filters_[mel][freq] * power[frame][freq];
            }

            float log_mel = std::log10(std::max(mel_value, 1e-10f));
            mel_output[frame][mel] = log_mel;
            max_log = std::max(max_log, log_mel);
        }
    }

    // Dynamic range clamp relative to the global maximum
    for (auto& frame : mel_output) {
        for (auto& value : frame) {
            value = (std::max(value, max_log - 8.0f) + 4.0f) / 4.0f;
        }
    }

    return n_frames;
}

std::vector<float> MelSpectrogram::computeChunk(const float* samples, size_t count)
{
    size_t used = std::min(count, static_cast<size_t>(CHUNK_SAMPLES));
    std::vector<float> window(CHUNK_SAMPLES, 0.0f);
    std::copy(samples, samples + used, window.begin());

    std::vector<std::vector<float>> mel;
    int n_frames = compute(window, mel);

    std::vector<float> features(static_cast<size_t>(n_mels_) * CHUNK_FRAMES, 0.0f);
    for (int frame = 0; frame < std::min(n_frames, static_cast<int>(CHUNK_FRAMES)); frame++) {
        for (int m = 0; m < n_mels_; m++) {
            features[static_cast<size_t>(m) * CHUNK_FRAMES + frame] = mel[frame][m];
        }
    }
    return features;
}

} // namespace bragi
