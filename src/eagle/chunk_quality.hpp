#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "eagle/mel_features.hpp"

namespace eagle {

struct QualityGates {
    float max_clip_ratio = 0.01f;       // fraction of samples at full scale
    float min_snr_db = 15.0f;
    float min_speech_level_db = -45.0f; // mean energy of voiced frames, dBFS
};

// Measurements of one enrollment chunk.
struct ChunkQuality {
    size_t total_frames = 0;
    size_t voiced_frames = 0;
    float clip_ratio = 0.0f;
    float snr_db = 0.0f;             // speech level over the 10th percentile unvoiced frame energy
    float speech_level_db = -100.0f;
    bool snr_measured = false;       // false when the chunk has too few pauses

    bool clipped(const QualityGates& g) const { return clip_ratio > g.max_clip_ratio; }
    bool noisy(const QualityGates& g) const { return snr_measured && snr_db < g.min_snr_db; }
    bool too_quiet(const QualityGates& g) const { return speech_level_db < g.min_speech_level_db; }
    bool acceptable(const QualityGates& g) const { return !clipped(g) && !noisy(g) && !too_quiet(g); }
};

ChunkQuality assess_chunk(const int16_t* pcm, size_t n_samples, const std::vector<AnalysisFrame>& frames);

} // namespace eagle
