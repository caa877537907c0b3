#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "eagle/profile.hpp"

namespace eagle {

class Model;
class EagleProfilerImpl;

// Numeric values are part of the C API.
enum class EnrollFeedback {
    AudioOk = 0,
    AudioTooShort = 1,
    UnknownSpeaker = 2,
    NoVoiceFound = 3,
    QualityIssue = 4,
};

const char* enroll_feedback_to_string(EnrollFeedback feedback);

struct EnrollResult {
    float percentage = 0.0f;    // [0, 100], non-decreasing until reset()
    EnrollFeedback feedback = EnrollFeedback::AudioOk;
};

/**
 * Enrollment session: turns utterances of one speaker into a Profile.
 *
 * Each call to enroll() analyses one chunk and either fuses it into the
 * voiceprint (AudioOk) or rejects it with a feedback code; rejected chunks do
 * not change state. export_profile() is available once percentage reaches 100.
 *
 * Every method serializes on an internal mutex. After release() every method
 * throws core::EagleError(InvalidState).
 */
class EagleProfiler {
public:
    // Empty model_path selects the built-in model.
    // Throws core::EagleError: InvalidArgument/Activation* for the key, IOError/InvalidArgument for the model.
    EagleProfiler(const std::string& access_key, const std::string& model_path,
                  const core::Config& config = core::Config{});
    EagleProfiler(const std::string& access_key, std::shared_ptr<const Model> model,
                  const core::Config& config = core::Config{});
    ~EagleProfiler();

    EagleProfiler(const EagleProfiler&) = delete;
    EagleProfiler& operator=(const EagleProfiler&) = delete;

    // Throws InvalidArgument when num_samples < min_enroll_samples().
    EnrollResult enroll(const int16_t* pcm, size_t num_samples);
    EnrollResult enroll(const std::vector<int16_t>& pcm) { return enroll(pcm.data(), pcm.size()); }

    // Throws InvalidState until percentage() reaches 100.
    Profile export_profile();
    size_t export_size() const;

    void reset();
    void release();
    bool released() const;

    float percentage() const;
    size_t min_enroll_samples() const;
    int sample_rate() const;

private:
    std::unique_ptr<EagleProfilerImpl> m_impl;
};

} // namespace eagle
