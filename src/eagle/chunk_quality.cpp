#include "eagle/chunk_quality.hpp"
#include <algorithm>
#include <cstdlib>

namespace eagle {

namespace {
constexpr int kClipLevel = 32700;
constexpr size_t kMinNoiseFrames = 25;   // 0.25 s of pauses
}

ChunkQuality assess_chunk(const int16_t* pcm, size_t n_samples, const std::vector<AnalysisFrame>& frames) {
    ChunkQuality q;
    q.total_frames = frames.size();

    size_t clipped = 0;
    for (size_t i = 0; i < n_samples; ++i) {
        if (std::abs(static_cast<int>(pcm[i])) >= kClipLevel) clipped++;
    }
    q.clip_ratio = n_samples > 0 ? static_cast<float>(clipped) / n_samples : 0.0f;

    if (frames.empty()) return q;

    double voiced_energy = 0.0;
    std::vector<float> unvoiced;
    unvoiced.reserve(frames.size());
    for (const auto& f : frames) {
        if (f.voiced) {
            voiced_energy += f.energy_db;
            q.voiced_frames++;
        } else {
            unvoiced.push_back(f.energy_db);
        }
    }
    if (q.voiced_frames == 0) return q;

    q.speech_level_db = static_cast<float>(voiced_energy / q.voiced_frames);

    // Noise floor comes from the pauses; trimmed speech has too few to measure
    if (unvoiced.size() >= kMinNoiseFrames) {
        size_t idx = unvoiced.size() / 10;
        std::nth_element(unvoiced.begin(), unvoiced.begin() + idx, unvoiced.end());
        q.snr_db = q.speech_level_db - unvoiced[idx];
        q.snr_measured = true;
    }
    return q;
}

} // namespace eagle
