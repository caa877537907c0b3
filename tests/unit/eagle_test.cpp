#include <algorithm>
#include <cassert>
#include <functional>
#include <vector>
#include "core/status.hpp"
#include "eagle/eagle.hpp"
#include "eagle/model.hpp"
#include "eagle/profiler.hpp"
#include "support/enroll_helpers.hpp"
#include "support/synthetic_voice.hpp"

using testsupport::speaker_a;
using testsupport::speaker_b;
using testsupport::voice_pcm;

static core::Status status_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const core::EagleError& e) {
        return e.status();
    }
    return core::Status::Success;
}

static eagle::Profile enroll(const testsupport::Speaker& spk, uint32_t seed) {
    eagle::EagleProfiler profiler(testsupport::test_access_key(), "");
    return testsupport::enroll_speaker(profiler, spk, seed);
}

int main() {
    const std::string key = testsupport::test_access_key();
    const eagle::Profile a = enroll(speaker_a(), 1);
    const eagle::Profile b = enroll(speaker_b(), 11);

    // Construction errors
    assert(status_of([&] { eagle::Eagle e(key, "", {}); }) == core::Status::InvalidArgument);
    assert(status_of([&] { eagle::Eagle e("", "", {a}); }) == core::Status::InvalidArgument);
    assert(status_of([&] {
        eagle::Eagle e(key, "", {a, eagle::Profile::from_bytes(std::vector<uint8_t>(10, 1))});
    }) == core::Status::InvalidArgument);

    // A profile is bound to the model that made it
    eagle::ModelParams other_params;
    other_params.score_sigma = 0.9f;
    auto other_model = eagle::Model::from_params(other_params);
    assert(status_of([&] { eagle::Eagle e(key, other_model, {a}); }) == core::Status::InvalidArgument);

    eagle::Eagle engine(key, "", {a, b});
    assert(engine.frame_length() == 512);
    assert(engine.sample_rate() == 16000);
    assert(engine.num_speakers() == 2);

    // Frame length is exact
    for (size_t n : {size_t(0), size_t(511), size_t(513), size_t(1024)}) {
        std::vector<int16_t> frame(n, 0);
        assert(status_of([&] { engine.process(frame.data(), frame.size()); }) == core::Status::InvalidArgument);
    }

    // Speaker A talks: A outscores B
    std::vector<int16_t> speech_a = voice_pcm(speaker_a(), 5.0, 50);
    auto run1 = testsupport::stream_scores(engine, speech_a);
    double sum_a = 0.0, sum_b = 0.0, max_a = 0.0, max_b = 0.0;
    for (const auto& s : run1) {
        assert(s.size() == 2);
        for (float v : s) assert(v >= 0.0f && v <= 1.0f);
        sum_a += s[0];
        sum_b += s[1];
        max_a = std::max(max_a, static_cast<double>(s[0]));
        max_b = std::max(max_b, static_cast<double>(s[1]));
    }
    assert(sum_a > sum_b);
    assert(max_a > 0.5);
    assert(max_b < 0.5);

    // Replaying after reset reproduces the scores exactly
    engine.reset();
    auto run2 = testsupport::stream_scores(engine, speech_a);
    assert(run1 == run2);

    // Silence after reset scores zero
    engine.reset();
    std::vector<int16_t> silence(512, 0);
    for (int i = 0; i < 20; ++i) {
        std::vector<float> s = engine.process(silence);
        assert(s[0] == 0.0f && s[1] == 0.0f);
    }

    // Score count follows profile count
    for (size_t n = 1; n <= 4; ++n) {
        std::vector<eagle::Profile> profiles;
        for (size_t i = 0; i < n; ++i) profiles.push_back(i % 2 ? b : a);
        eagle::Eagle multi(key, "", profiles);
        assert(multi.process(speech_a.data(), 512).size() == n);
    }

    engine.release();
    assert(engine.released());
    assert(status_of([&] { engine.process(silence); }) == core::Status::InvalidState);
    assert(status_of([&] { engine.reset(); }) == core::Status::InvalidState);
    assert(status_of([&] { engine.frame_length(); }) == core::Status::InvalidState);
    assert(status_of([&] { engine.release(); }) == core::Status::InvalidState);
    return 0;
}
