#include <cassert>
#include <functional>
#include <vector>
#include "core/status.hpp"
#include "eagle/model.hpp"
#include "eagle/profiler.hpp"
#include "support/enroll_helpers.hpp"
#include "support/synthetic_voice.hpp"

using eagle::EnrollFeedback;
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

static void test_enrollment_completes() {
    eagle::EagleProfiler profiler(testsupport::test_access_key(), "");
    assert(profiler.sample_rate() == 16000);
    assert(profiler.min_enroll_samples() == 16000);
    assert(profiler.percentage() == 0.0f);
    assert(profiler.export_size() == eagle::Model::default_model()->profile_size());

    float last = 0.0f;
    for (uint32_t seed = 1; seed <= 8 && last < 100.0f; ++seed) {
        eagle::EnrollResult r = profiler.enroll(voice_pcm(speaker_a(), 3.0, seed));
        assert(r.feedback == EnrollFeedback::AudioOk);
        assert(r.percentage > last);
        if (r.percentage < 100.0f) {
            assert(status_of([&] { profiler.export_profile(); }) == core::Status::InvalidState);
        }
        last = r.percentage;
    }
    assert(last == 100.0f);

    eagle::Profile profile = profiler.export_profile();
    assert(profile.size() == profiler.export_size());

    // More audio refines the voiceprint but stays at 100%
    eagle::EnrollResult more = profiler.enroll(voice_pcm(speaker_a(), 3.0, 40));
    assert(more.feedback == EnrollFeedback::AudioOk);
    assert(more.percentage == 100.0f);
    assert(profiler.export_profile() != profile);
}

static void test_feedback_codes() {
    eagle::EagleProfiler profiler(testsupport::test_access_key(), "");

    std::vector<int16_t> silence(16000, 0);
    assert(profiler.enroll(silence).feedback == EnrollFeedback::NoVoiceFound);

    std::vector<double> hiss(32000, 0.0);
    testsupport::add_noise(hiss, 0.01, 5);
    assert(profiler.enroll(testsupport::to_pcm(hiss)).feedback == EnrollFeedback::NoVoiceFound);

    auto wave = testsupport::voice(speaker_a(), 3.0, 7);
    assert(profiler.enroll(testsupport::to_pcm(wave, 10.0)).feedback == EnrollFeedback::QualityIssue);

    auto noisy = wave;
    testsupport::add_noise(noisy, 0.03, 9);
    assert(profiler.enroll(testsupport::to_pcm(noisy)).feedback == EnrollFeedback::QualityIssue);

    // 0.3 s of speech padded to the minimum length
    std::vector<int16_t> brief = voice_pcm(speaker_a(), 0.3, 8);
    brief.resize(16000, 0);
    assert(profiler.enroll(brief).feedback == EnrollFeedback::AudioTooShort);

    // Rejected chunks leave the session untouched
    assert(profiler.percentage() == 0.0f);

    // Two speakers inside one chunk
    auto mixed = testsupport::concat(voice_pcm(speaker_a(), 3.0, 21), voice_pcm(speaker_b(), 3.0, 22));
    assert(profiler.enroll(mixed).feedback == EnrollFeedback::UnknownSpeaker);
    assert(profiler.percentage() == 0.0f);

    // A different speaker after enrollment started
    eagle::EnrollResult first = profiler.enroll(voice_pcm(speaker_a(), 3.0, 1));
    assert(first.feedback == EnrollFeedback::AudioOk);
    eagle::EnrollResult other = profiler.enroll(voice_pcm(speaker_b(), 3.0, 11));
    assert(other.feedback == EnrollFeedback::UnknownSpeaker);
    assert(other.percentage == first.percentage);
}

static void test_argument_errors() {
    eagle::EagleProfiler profiler(testsupport::test_access_key(), "");
    std::vector<int16_t> short_chunk = voice_pcm(speaker_a(), 0.9, 2);
    assert(status_of([&] { profiler.enroll(short_chunk); }) == core::Status::InvalidArgument);
    assert(status_of([&] { profiler.enroll(nullptr, 16000); }) == core::Status::InvalidArgument);
    assert(profiler.percentage() == 0.0f);

    assert(status_of([] { eagle::EagleProfiler p("", ""); }) == core::Status::InvalidArgument);
    assert(status_of([] { eagle::EagleProfiler p(testsupport::test_access_key(),
                                                 testsupport::temp_path("nope.pv")); }) == core::Status::IOError);
}

static void test_reset() {
    eagle::EagleProfiler profiler(testsupport::test_access_key(), "");
    profiler.enroll(voice_pcm(speaker_a(), 3.0, 1));
    assert(profiler.percentage() > 0.0f);
    profiler.reset();
    assert(profiler.percentage() == 0.0f);
    assert(status_of([&] { profiler.export_profile(); }) == core::Status::InvalidState);

    // A fresh session after reset may enroll someone else
    eagle::Profile b = testsupport::enroll_speaker(profiler, speaker_b(), 11);
    assert(!b.empty());
}

static void test_trimmed_speech_enrolls() {
    eagle::EagleProfiler profiler(testsupport::test_access_key(), "");
    std::vector<int16_t> trimmed = testsupport::trim_pauses(voice_pcm(speaker_a(), 6.0, 20));
    assert(trimmed.size() >= profiler.min_enroll_samples());
    eagle::EnrollResult r = profiler.enroll(trimmed);
    assert(r.feedback == EnrollFeedback::AudioOk);
    assert(r.percentage > 0.0f);
}

static void test_release() {
    eagle::EagleProfiler profiler(testsupport::test_access_key(), "");
    profiler.release();
    assert(profiler.released());
    std::vector<int16_t> chunk = voice_pcm(speaker_a(), 3.0, 1);
    assert(status_of([&] { profiler.enroll(chunk); }) == core::Status::InvalidState);
    assert(status_of([&] { profiler.export_profile(); }) == core::Status::InvalidState);
    assert(status_of([&] { profiler.export_size(); }) == core::Status::InvalidState);
    assert(status_of([&] { profiler.reset(); }) == core::Status::InvalidState);
    assert(status_of([&] { profiler.percentage(); }) == core::Status::InvalidState);
    assert(status_of([&] { profiler.release(); }) == core::Status::InvalidState);
}

int main() {
    test_enrollment_completes();
    test_feedback_codes();
    test_argument_errors();
    test_reset();
    test_trimmed_speech_enrolls();
    test_release();
    return 0;
}
