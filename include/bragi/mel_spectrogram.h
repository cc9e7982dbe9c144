#pragma once

#include <cstddef>
#include <vector>

namespace bragi {

/**
 * @brief Whisper-compatible log-mel spectrogram
 *
 * Matches the Whisper front end: centered 400-point STFT with reflect
 * padding, 160-sample hop, power spectrum, mel filterbank, log10 clamped to
 * (max - 8) and scaled with (x + 4) / 4.
 *
 * Parameters match Whisper's defaults:
 * - 80 mel bins (128 for large-v3 models)
 * - 16kHz sample rate
 * - 30 second windows (3000 frames)
 */
class MelSpectrogram {
public:
    static constexpr int CHUNK_SAMPLES = 480000;   // 30s @ 16kHz
    static constexpr int CHUNK_FRAMES = 3000;

    MelSpectrogram(int sample_rate = 16000,
                   int n_fft = 400,
                   int n_mels = 80,
                   int hop_length = 160);

    /**
     * @brief Convert audio samples to a log-mel spectrogram
     *
     * @param samples Audio samples (mono, float32, normalized to [-1, 1])
     * @param mel_output Output (n_frames x n_mels)
     * @return Number of frames generated
     */
    int compute(const std::vector<float>& samples,
                std::vector<std::vector<float>>& mel_output);

    /**
     * @brief Features for one 30 second window
     *
     * Audio shorter than a window is zero padded.
     *
     * @param samples First sample of the window
     * @param count Number of valid samples (at most CHUNK_SAMPLES are used)
     * @return Row-major [n_mels x CHUNK_FRAMES] features
     */
    std::vector<float> computeChunk(const float* samples, size_t count);

    int getMelBins() const { return n_mels_; }

private:
    // Power spectrum of centered frames; drops the trailing frame like Whisper
    std::vector<std::vector<float>> computePowerSpectrum(const std::vector<float>& samples);

    std::vector<float> createHannWindow(int size);
    std::vector<std::vector<float>> createMelFilters(int sample_rate, int n_fft, int n_mels);

    float hzToMel(float hz);
    float melToHz(float mel);

    int sample_rate_;
    int n_fft_;
    int n_mels_;
    int hop_length_;
    std::vector<float> hann_window_;
    std::vector<std::vector<float>> mel_filters_;
    std::vector<float> cos_table_;
    std::vector<float> sin_table_;
};

} // namespace bragi
