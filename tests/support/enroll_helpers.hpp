#pragma once
#include <cassert>
#include <cstdint>
#include <vector>
#include "eagle/profiler.hpp"
#include "support/synthetic_voice.hpp"

namespace testsupport {

// Enrolls 3 s utterances (seeds first_seed, first_seed + 1, ...) until 100%.
inline eagle::Profile enroll_speaker(eagle::EagleProfiler& profiler, const Speaker& spk, uint32_t first_seed) {
    for (uint32_t i = 0; i < 10 && profiler.percentage() < 100.0f; ++i) {
        profiler.enroll(voice_pcm(spk, 3.0, first_seed + i));
    }
    assert(profiler.percentage() == 100.0f);
    return profiler.export_profile();
}

// Runs `pcm` through process() frame by frame; the tail that does not fill a frame is dropped.
template <typename Engine>
std::vector<std::vector<float>> stream_scores(Engine& engine, const std::vector<int16_t>& pcm) {
    const size_t frame = static_cast<size_t>(engine.frame_length());
    std::vector<std::vector<float>> out;
    for (size_t pos = 0; pos + frame <= pcm.size(); pos += frame) {
        out.push_back(engine.process(pcm.data() + pos, frame));
    }
    return out;
}

} // namespace testsupport
