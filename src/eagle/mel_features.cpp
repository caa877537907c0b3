#include "eagle/mel_features.hpp"
#include "core/status.hpp"
#include <cmath>
#include <algorithm>
#include <string>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace eagle {

namespace {
constexpr size_t kPendingSlack = 4096;
constexpr int kMaxFft = 8192;
constexpr int kMaxMels = 512;
constexpr int kMaxSampleRate = 192000;

bool is_power_of_two(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

void check_config(const MelFeatureExtractor::Config& c) {
    auto bad = [](const std::string& what) {
        core::throw_error(core::Status::InvalidArgument, "invalid front end config: " + what);
    };
    if (c.sample_rate <= 0 || c.sample_rate > kMaxSampleRate) bad("sample_rate");
    if (c.n_fft > kMaxFft) bad("n_fft above " + std::to_string(kMaxFft));
    if (c.win_length <= 0 || !is_power_of_two(c.n_fft) || c.n_fft < c.win_length) bad("n_fft/win_length");
    if (c.hop_length <= 0 || c.hop_length > c.win_length) bad("hop_length");
    if (c.n_mels > kMaxMels) bad("n_mels above " + std::to_string(kMaxMels));
    if (c.n_mels <= 0 || c.n_ceps <= 1 || c.n_ceps > c.n_mels) bad("n_mels/n_ceps");
    if (c.fmin < 0.0f || c.fmax <= c.fmin || c.fmax > c.sample_rate / 2.0f) bad("fmin/fmax");
    if (c.preemphasis < 0.0f || c.preemphasis >= 1.0f) bad("preemphasis");
    if (c.pitch_min_hz <= 0.0f || c.pitch_max_hz <= c.pitch_min_hz) bad("pitch range");
    if (std::ceil(c.sample_rate / c.pitch_min_hz) >= c.win_length) bad("pitch_min_hz too low for window");
}
} // namespace

float MelFeatureExtractor::hz_to_mel(float hz) {
    return 2595.0f * std::log10(1.0f + hz / 700.0f);
}

float MelFeatureExtractor::mel_to_hz(float mel) {
    return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f);
}

MelFeatureExtractor::MelFeatureExtractor(const Config& config)
    : m_config((check_config(config), config))
    , m_pending(static_cast<size_t>(config.win_length) + kPendingSlack)
{
    init_hann_window();
    init_mel_filters();
    init_dct();
    init_fft();

    m_min_lag = static_cast<int>(std::floor(m_config.sample_rate / m_config.pitch_max_hz));
    m_max_lag = static_cast<int>(std::ceil(m_config.sample_rate / m_config.pitch_min_hz));
    m_min_lag = std::max(m_min_lag, 1);

    m_window_pcm.resize(m_config.win_length);
    m_raw.resize(m_config.win_length);
    m_fft_re.resize(m_config.n_fft);
    m_fft_im.resize(m_config.n_fft);
    m_power.resize(m_config.n_fft / 2 + 1);
}

MelFeatureExtractor::MelFeatureExtractor() : MelFeatureExtractor(Config{}) {}

MelFeatureExtractor::~MelFeatureExtractor() = default;

void MelFeatureExtractor::init_hann_window() {
    m_hann_window.resize(m_config.win_length);
    for (int i = 0; i < m_config.win_length; i++) {
        m_hann_window[i] = 0.5f * (1.0f - std::cos(2.0f * M_PI * i / (m_config.win_length - 1)));
    }
}

void MelFeatureExtractor::init_mel_filters() {
    const size_t n_bins = static_cast<size_t>(m_config.n_fft / 2 + 1);
    m_mel_filters.assign(static_cast<size_t>(m_config.n_mels) * n_bins, 0.0f);

    float mel_min = hz_to_mel(m_config.fmin);
    float mel_max = hz_to_mel(m_config.fmax);

    std::vector<float> hz_points(m_config.n_mels + 2);
    for (int i = 0; i < m_config.n_mels + 2; i++) {
        hz_points[i] = mel_to_hz(mel_min + (mel_max - mel_min) * i / (m_config.n_mels + 1));
    }

    // Triangular filters evaluated at bin centre frequencies
    for (int m = 0; m < m_config.n_mels; m++) {
        float left = hz_points[m];
        float center = hz_points[m + 1];
        float right = hz_points[m + 2];
        for (size_t k = 0; k < n_bins; k++) {
            float f = static_cast<float>(k) * m_config.sample_rate / m_config.n_fft;
            float w = 0.0f;
            if (f >= left && f <= center && center > left) {
                w = (f - left) / (center - left);
            } else if (f > center && f <= right && right > center) {
                w = (right - f) / (right - center);
            }
            m_mel_filters[static_cast<size_t>(m) * n_bins + k] = w;
        }
    }
}

void MelFeatureExtractor::init_dct() {
    const int n = m_config.n_mels;
    m_dct.resize(static_cast<size_t>(m_config.n_ceps) * static_cast<size_t>(n));
    for (int k = 0; k < m_config.n_ceps; k++) {
        float scale = std::sqrt((k == 0 ? 1.0f : 2.0f) / n);
        for (int j = 0; j < n; j++) {
            m_dct[static_cast<size_t>(k) * n + j] = scale * static_cast<float>(std::cos(M_PI * k * (j + 0.5) / n));
        }
    }
}

void MelFeatureExtractor::init_fft() {
    const int n = m_config.n_fft;
    m_fft_cos.resize(n / 2);
    m_fft_sin.resize(n / 2);
    for (int i = 0; i < n / 2; i++) {
        double theta = (2.0 * M_PI * i) / n;
        m_fft_cos[i] = static_cast<float>(std::cos(theta));
        m_fft_sin[i] = static_cast<float>(std::sin(theta));
    }
    int bits = 0;
    while ((1 << bits) < n) bits++;
    m_fft_bitrev.resize(n);
    for (int i = 0; i < n; i++) {
        int r = 0;
        for (int b = 0; b < bits; b++) {
            if (i & (1 << b)) r |= 1 << (bits - 1 - b);
        }
        m_fft_bitrev[i] = r;
    }
}

// Iterative Cooley-Tukey radix-2
void MelFeatureExtractor::fft_in_place(std::vector<float>& re, std::vector<float>& im) const {
    const int n = m_config.n_fft;
    for (int i = 0; i < n; i++) {
        int j = m_fft_bitrev[i];
        if (j > i) {
            std::swap(re[i], re[j]);
            std::swap(im[i], im[j]);
        }
    }
    for (int size = 2; size <= n; size *= 2) {
        const int half = size / 2;
        const int step = n / size;
        for (int start = 0; start < n; start += size) {
            for (int k = 0; k < half; k++) {
                float wr = m_fft_cos[k * step];
                float wi = -m_fft_sin[k * step];
                int a = start + k;
                int b = a + half;
                float tr = wr * re[b] - wi * im[b];
                float ti = wr * im[b] + wi * re[b];
                re[b] = re[a] - tr;
                im[b] = im[a] - ti;
                re[a] += tr;
                im[a] += ti;
            }
        }
    }
}

float MelFeatureExtractor::periodicity(const float* x, int n, int& best_lag) const {
    float best = 0.0f;
    best_lag = 0;
    const int max_lag = std::min(m_max_lag, n - 1);
    for (int lag = m_min_lag; lag <= max_lag; lag++) {
        double s = 0.0, e0 = 0.0, e1 = 0.0;
        for (int i = 0; i + lag < n; i++) {
            double a = x[i];
            double b = x[i + lag];
            s += a * b;
            e0 += a * a;
            e1 += b * b;
        }
        if (e0 > 0.0 && e1 > 0.0) {
            float r = static_cast<float>(s / std::sqrt(e0 * e1));
            if (r > best) {
                best = r;
                best_lag = lag;
            }
        }
    }
    return best;
}

AnalysisFrame MelFeatureExtractor::analyze_window() {
    const int win = m_config.win_length;
    const int n_bins = m_config.n_fft / 2 + 1;

    double energy = 0.0;
    for (int i = 0; i < win; i++) {
        m_raw[i] = m_window_pcm[i] / 32768.0f;
        energy += static_cast<double>(m_raw[i]) * m_raw[i];
    }

    AnalysisFrame frame;
    frame.energy_db = static_cast<float>(10.0 * std::log10(energy / win + 1e-10));

    std::fill(m_fft_re.begin(), m_fft_re.end(), 0.0f);
    std::fill(m_fft_im.begin(), m_fft_im.end(), 0.0f);
    float prev = m_prev_sample;
    for (int i = 0; i < win; i++) {
        m_fft_re[i] = (m_raw[i] - m_config.preemphasis * prev) * m_hann_window[i];
        prev = m_raw[i];
    }
    fft_in_place(m_fft_re, m_fft_im);
    for (int k = 0; k < n_bins; k++) {
        m_power[k] = m_fft_re[k] * m_fft_re[k] + m_fft_im[k] * m_fft_im[k];
    }

    frame.log_mel.resize(m_config.n_mels);
    for (int m = 0; m < m_config.n_mels; m++) {
        float mel_energy = 0.0f;
        const float* filt = &m_mel_filters[m * n_bins];
        for (int k = 0; k < n_bins; k++) {
            mel_energy += m_power[k] * filt[k];
        }
        frame.log_mel[m] = std::log(std::max(mel_energy, 1e-10f));
    }

    frame.cepstrum.resize(m_config.n_ceps);
    for (int k = 0; k < m_config.n_ceps; k++) {
        float c = 0.0f;
        const float* basis = &m_dct[k * m_config.n_mels];
        for (int j = 0; j < m_config.n_mels; j++) {
            c += basis[j] * frame.log_mel[j];
        }
        frame.cepstrum[k] = c;
    }

    // Autocorrelation is only worth computing above the energy floor
    if (frame.energy_db > m_config.energy_floor_db) {
        int lag = 0;
        frame.periodicity = periodicity(m_raw.data(), win, lag);
        frame.voiced = frame.periodicity > m_config.periodicity_threshold;
        if (frame.voiced && lag > 0) {
            frame.pitch_hz = static_cast<float>(m_config.sample_rate) / lag;
        }
    }
    return frame;
}

size_t MelFeatureExtractor::push(const int16_t* pcm, size_t n_samples, std::vector<AnalysisFrame>& out) {
    const size_t win = static_cast<size_t>(m_config.win_length);
    const size_t hop = static_cast<size_t>(m_config.hop_length);
    size_t produced = 0;
    size_t offset = 0;
    while (offset < n_samples) {
        offset += m_pending.push(pcm + offset, n_samples - offset);
        while (m_pending.size() >= win) {
            m_pending.peek(m_window_pcm.data(), win);
            out.push_back(analyze_window());
            produced++;
            m_prev_sample = m_window_pcm[hop - 1] / 32768.0f;
            m_pending.discard(hop);
        }
    }
    return produced;
}

std::vector<AnalysisFrame> MelFeatureExtractor::analyze(const int16_t* pcm, size_t n_samples) {
    reset();
    std::vector<AnalysisFrame> frames;
    frames.reserve(num_frames(n_samples));
    push(pcm, n_samples, frames);
    reset();
    return frames;
}

void MelFeatureExtractor::reset() {
    m_pending.clear();
    m_prev_sample = 0.0f;
}

size_t MelFeatureExtractor::num_frames(size_t n_samples) const {
    const size_t win = static_cast<size_t>(m_config.win_length);
    if (n_samples < win) {
        return 0;
    }
    return 1 + (n_samples - win) / m_config.hop_length;
}

} // namespace eagle
