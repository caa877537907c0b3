#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include "core/ring_buffer.hpp"

namespace eagle {

/**
 * Per analysis frame (25 ms window, 10 ms hop at 16 kHz) features.
 */
struct AnalysisFrame {
    std::vector<float> log_mel;   // natural log mel energies, n_mels
    std::vector<float> cepstrum;  // DCT-II of log_mel, n_ceps (c0 first)
    float energy_db = -100.0f;    // dBFS of the raw window
    float periodicity = 0.0f;     // max normalized autocorrelation in the pitch range
    float pitch_hz = 0.0f;        // 0 when unvoiced
    bool voiced = false;
};

/**
 * Streaming speech front end.
 *
 * Samples are pushed in arbitrary sized pieces; every complete window yields
 * one AnalysisFrame. Pushing a signal in pieces gives exactly the same frames
 * as pushing it at once.
 */
class MelFeatureExtractor {
public:
    struct Config {
        int sample_rate = 16000;
        int n_fft = 512;            // power of 2, >= win_length
        int win_length = 400;       // 25ms at 16kHz
        int hop_length = 160;       // 10ms at 16kHz
        int n_mels = 40;
        int n_ceps = 20;
        float fmin = 20.0f;
        float fmax = 7600.0f;
        float preemphasis = 0.97f;

        // Voicing decision
        float energy_floor_db = -55.0f;
        float periodicity_threshold = 0.5f;
        float pitch_min_hz = 80.0f;
        float pitch_max_hz = 400.0f;
    };

    MelFeatureExtractor();
    explicit MelFeatureExtractor(const Config& config);
    ~MelFeatureExtractor();

    MelFeatureExtractor(const MelFeatureExtractor&) = delete;
    MelFeatureExtractor& operator=(const MelFeatureExtractor&) = delete;

    /**
     * Append samples; completed frames are appended to `out`.
     * @return Number of frames appended
     */
    size_t push(const int16_t* pcm, size_t n_samples, std::vector<AnalysisFrame>& out);

    // One-shot analysis of a complete signal. Discards any streaming state.
    std::vector<AnalysisFrame> analyze(const int16_t* pcm, size_t n_samples);

    void reset();

    // Frames a fresh extractor produces from n_samples.
    size_t num_frames(size_t n_samples) const;

    const Config& config() const { return m_config; }

private:
    Config m_config;
    std::vector<float> m_mel_filters;   // [n_mels x n_bins]
    std::vector<float> m_hann_window;   // win_length
    std::vector<float> m_dct;           // [n_ceps x n_mels], orthonormal DCT-II
    std::vector<float> m_fft_cos;       // n_fft / 2 twiddles
    std::vector<float> m_fft_sin;
    std::vector<int> m_fft_bitrev;
    int m_min_lag = 0;
    int m_max_lag = 0;

    core::RingBufferI16 m_pending;
    float m_prev_sample = 0.0f;         // sample preceding the pending window, for pre-emphasis

    // Scratch buffers reused across frames
    std::vector<int16_t> m_window_pcm;
    std::vector<float> m_raw;
    std::vector<float> m_fft_re;
    std::vector<float> m_fft_im;
    std::vector<float> m_power;

    void init_hann_window();
    void init_mel_filters();
    void init_dct();
    void init_fft();

    void fft_in_place(std::vector<float>& re, std::vector<float>& im) const;
    AnalysisFrame analyze_window();
    float periodicity(const float* x, int n, int& best_lag) const;

    static float hz_to_mel(float hz);
    static float mel_to_hz(float mel);
};

} // namespace eagle
