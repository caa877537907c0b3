// End to end: params file on disk, WAV enrollment, profile file, streamed WAV recognition,
// and two engines sharing one loaded model from separate threads.
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <thread>
#include <vector>
#include "audio/file_capture.hpp"
#include "eagle/eagle.hpp"
#include "eagle/model.hpp"
#include "eagle/profiler.hpp"
#include "support/synthetic_voice.hpp"

using testsupport::temp_path;

static std::vector<float> stream_file(eagle::Eagle& engine, const std::string& wav, size_t speaker) {
    audio::FileCapture cap;
    assert(cap.open(wav));
    assert(cap.sample_rate() == engine.sample_rate());
    std::vector<float> scores;
    for (auto f = cap.read_frame(engine.frame_length()); !f.empty(); f = cap.read_frame(engine.frame_length())) {
        scores.push_back(engine.process(f)[speaker]);
    }
    return scores;
}

int main() {
    const std::string key = testsupport::test_access_key();
    const std::string params_path = temp_path("integration_params.pv");
    eagle::Model::save(eagle::ModelParams{}, params_path);

    std::vector<std::string> files;
    for (uint32_t seed = 1; seed <= 8; ++seed) {
        std::string wav = temp_path("enroll_" + std::to_string(seed) + ".wav");
        auto pcm = testsupport::voice_pcm(testsupport::speaker_a(), 3.0, seed);
        assert(audio::write_wav_pcm16(wav, pcm.data(), pcm.size(), 16000));
        files.push_back(wav);
    }

    eagle::EagleProfiler profiler(key, params_path);
    for (const auto& wav : files) {
        audio::FileCapture cap;
        assert(cap.open(wav));
        profiler.enroll(cap.samples());
        if (profiler.percentage() >= 100.0f) break;
    }
    assert(profiler.percentage() == 100.0f);

    const std::string profile_path = temp_path("speaker_a.egl");
    {
        eagle::Profile p = profiler.export_profile();
        std::ofstream out(profile_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(p.bytes().data()), static_cast<std::streamsize>(p.size()));
    }
    profiler.release();

    std::ifstream in(profile_path, std::ios::binary);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    eagle::Profile stored = eagle::Profile::from_bytes(bytes);

    const std::string same_wav = temp_path("test_a.wav");
    const std::string other_wav = temp_path("test_b.wav");
    auto same = testsupport::voice_pcm(testsupport::speaker_a(), 5.0, 50);
    auto other = testsupport::voice_pcm(testsupport::speaker_b(), 5.0, 60);
    assert(audio::write_wav_pcm16(same_wav, same.data(), same.size(), 16000));
    assert(audio::write_wav_pcm16(other_wav, other.data(), other.size(), 16000));

    eagle::Eagle engine(key, params_path, {stored});
    std::vector<float> same_scores = stream_file(engine, same_wav, 0);
    engine.reset();
    std::vector<float> other_scores = stream_file(engine, other_wav, 0);
    float same_max = 0.0f, other_max = 0.0f;
    for (float s : same_scores) same_max = std::max(same_max, s);
    for (float s : other_scores) other_max = std::max(other_max, s);
    assert(same_max > 0.5f);
    assert(other_max < 0.5f);

    // Instances built from the same params file share the model and score independently
    auto model = eagle::Model::load(params_path);
    eagle::Eagle left(key, model, {stored});
    eagle::Eagle right(key, model, {stored});
    std::vector<float> left_scores, right_scores;
    std::thread t1([&] { left_scores = stream_file(left, same_wav, 0); });
    std::thread t2([&] { right_scores = stream_file(right, same_wav, 0); });
    t1.join();
    t2.join();
    assert(left_scores == right_scores);
    assert(left_scores == same_scores);

    for (const auto& f : files) std::remove(f.c_str());
    for (const auto& f : {params_path, profile_path, same_wav, other_wav}) std::remove(f.c_str());
    return 0;
}
