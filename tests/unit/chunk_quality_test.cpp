#include <cassert>
#include <vector>
#include "eagle/chunk_quality.hpp"
#include "eagle/mel_features.hpp"
#include "support/synthetic_voice.hpp"

static eagle::ChunkQuality measure(eagle::MelFeatureExtractor& fx, const std::vector<int16_t>& pcm) {
    auto frames = fx.analyze(pcm.data(), pcm.size());
    return eagle::assess_chunk(pcm.data(), pcm.size(), frames);
}

int main() {
    eagle::MelFeatureExtractor fx;
    eagle::QualityGates gates;
    auto clean_wave = testsupport::voice(testsupport::speaker_a(), 3.0, 7);

    eagle::ChunkQuality clean = measure(fx, testsupport::to_pcm(clean_wave));
    assert(clean.voiced_frames > 100);
    assert(clean.clip_ratio == 0.0f);
    assert(clean.snr_measured);
    assert(clean.snr_db > 40.0f);
    assert(clean.speech_level_db > -45.0f);
    assert(clean.acceptable(gates));

    eagle::ChunkQuality clipped = measure(fx, testsupport::to_pcm(clean_wave, 10.0));
    assert(clipped.clipped(gates));
    assert(!clipped.acceptable(gates));

    auto noisy_wave = clean_wave;
    testsupport::add_noise(noisy_wave, 0.03, 9);
    eagle::ChunkQuality noisy = measure(fx, testsupport::to_pcm(noisy_wave));
    assert(noisy.voiced_frames > 0);
    assert(noisy.snr_measured);
    assert(noisy.noisy(gates));

    // Pause-trimmed speech has no noise floor to measure and is not called noisy
    auto trimmed_pcm = testsupport::trim_pauses(testsupport::voice_pcm(testsupport::speaker_a(), 6.0, 20));
    eagle::ChunkQuality trimmed = measure(fx, trimmed_pcm);
    assert(trimmed.voiced_frames > 100);
    assert(!trimmed.snr_measured);
    assert(!trimmed.noisy(gates));
    assert(trimmed.acceptable(gates));

    std::vector<int16_t> silence(16000, 0);
    eagle::ChunkQuality quiet = measure(fx, silence);
    assert(quiet.voiced_frames == 0);
    assert(quiet.total_frames == 98);
    assert(quiet.too_quiet(gates));
    return 0;
}
