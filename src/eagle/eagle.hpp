#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "core/config.hpp"
#include "eagle/profile.hpp"

namespace eagle {

class Model;
class EagleImpl;

/**
 * Streaming speaker recognizer.
 *
 * process() takes exactly frame_length() samples and returns one score in
 * [0, 1] per Profile, in the order the Profiles were given. Scores follow the
 * last ~1.5 s of speech and are smoothed across calls; stretches without
 * enough voiced audio decay towards 0.
 *
 * Every method serializes on an internal mutex. After release() every method
 * throws core::EagleError(InvalidState).
 */
class Eagle {
public:
    // Empty model_path selects the built-in model. Needs at least one Profile;
    // a Profile that is malformed or made for another model is InvalidArgument.
    Eagle(const std::string& access_key, const std::string& model_path,
          const std::vector<Profile>& profiles, const core::Config& config = core::Config{});
    Eagle(const std::string& access_key, std::shared_ptr<const Model> model,
          const std::vector<Profile>& profiles, const core::Config& config = core::Config{});
    ~Eagle();

    Eagle(const Eagle&) = delete;
    Eagle& operator=(const Eagle&) = delete;

    // Throws InvalidArgument unless num_samples == frame_length().
    std::vector<float> process(const int16_t* pcm, size_t num_samples);
    std::vector<float> process(const std::vector<int16_t>& pcm) { return process(pcm.data(), pcm.size()); }

    // Clears streaming state; Profiles stay loaded.
    void reset();
    void release();
    bool released() const;

    int frame_length() const;
    int sample_rate() const;
    size_t num_speakers() const;

private:
    std::unique_ptr<EagleImpl> m_impl;
};

} // namespace eagle
