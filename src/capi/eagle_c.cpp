#include "capi/eagle_c.h"
#include "eagle/eagle.hpp"
#include "eagle/model.hpp"
#include "eagle/profiler.hpp"
#include "eagle/version.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <new>
#include <string>
#include <vector>

struct eagle_profiler_object {
    std::unique_ptr<eagle::EagleProfiler> profiler;
};

struct eagle_object {
    std::unique_ptr<eagle::Eagle> engine;
    int32_t frame_length = 0;
};

namespace {

thread_local std::vector<std::string> g_error_stack;
thread_local std::string g_sdk = "c";

eagle_status_t to_c_status(core::Status status) {
    return static_cast<eagle_status_t>(static_cast<int>(status));
}

core::Config thread_config() {
    core::Config config = core::Config::from_env();
    config.sdk = g_sdk;
    return config;
}

void record_error(const std::string& message, const std::vector<std::string>& stack = {}) {
    g_error_stack.clear();
    g_error_stack.push_back(message);
    g_error_stack.insert(g_error_stack.end(), stack.begin(), stack.end());
}

eagle_status_t fail(eagle_status_t status, const std::string& message) {
    record_error(message);
    return status;
}

// Runs `fn`, turning exceptions into a status plus the thread's error stack.
template <typename F>
eagle_status_t guarded(F&& fn) {
    try {
        fn();
        return EAGLE_STATUS_SUCCESS;
    } catch (const core::EagleError& e) {
        record_error(e.message(), e.message_stack());
        return to_c_status(e.status());
    } catch (const std::bad_alloc&) {
        record_error("out of memory");
        return EAGLE_STATUS_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        record_error(e.what());
        return EAGLE_STATUS_RUNTIME_ERROR;
    }
}

char* copy_string(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (out) std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

} // namespace

extern "C" {

const char* eagle_status_to_string(eagle_status_t status) {
    if (status < EAGLE_STATUS_SUCCESS || status > EAGLE_STATUS_ACTIVATION_REFUSED) {
        return "UNKNOWN_STATUS";
    }
    return core::status_to_string(static_cast<core::Status>(status));
}

eagle_status_t eagle_get_error_stack(char*** message_stack, int32_t* message_stack_depth) {
    if (!message_stack || !message_stack_depth) {
        return EAGLE_STATUS_INVALID_ARGUMENT;
    }
    const size_t depth = g_error_stack.size();
    // NULL terminated so eagle_free_error_stack needs no depth
    char** out = static_cast<char**>(std::calloc(depth + 1, sizeof(char*)));
    if (!out) {
        return EAGLE_STATUS_OUT_OF_MEMORY;
    }
    for (size_t i = 0; i < depth; ++i) {
        out[i] = copy_string(g_error_stack[i]);
        if (!out[i]) {
            eagle_free_error_stack(out);
            return EAGLE_STATUS_OUT_OF_MEMORY;
        }
    }
    *message_stack = out;
    *message_stack_depth = static_cast<int32_t>(depth);
    return EAGLE_STATUS_SUCCESS;
}

void eagle_free_error_stack(char** message_stack) {
    if (!message_stack) return;
    for (char** p = message_stack; *p; ++p) {
        std::free(*p);
    }
    std::free(message_stack);
}

void eagle_set_sdk(const char* sdk) {
    g_sdk = (sdk && sdk[0] != '\0') ? sdk : "c";
}

const char* eagle_version(void) {
    return eagle::version();
}

const char* eagle_profiler_enroll_feedback_to_string(eagle_profiler_enroll_feedback_t feedback) {
    if (feedback < EAGLE_PROFILER_ENROLL_FEEDBACK_AUDIO_OK ||
        feedback > EAGLE_PROFILER_ENROLL_FEEDBACK_QUALITY_ISSUE) {
        return "UNKNOWN_FEEDBACK";
    }
    return eagle::enroll_feedback_to_string(static_cast<eagle::EnrollFeedback>(feedback));
}

eagle_status_t eagle_profiler_init(const char* access_key, const char* model_path, eagle_profiler_t** object) {
    if (!object) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object is null");
    *object = nullptr;
    if (!access_key) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "access_key is null");
    return guarded([&] {
        auto handle = std::make_unique<eagle_profiler_object>();
        handle->profiler = std::make_unique<eagle::EagleProfiler>(
            access_key, model_path ? model_path : "", thread_config());
        *object = handle.release();
    });
}

void eagle_profiler_delete(eagle_profiler_t* object) {
    delete object;
}

eagle_status_t eagle_profiler_enroll(eagle_profiler_t* object, const int16_t* pcm, int32_t num_samples,
                                     eagle_profiler_enroll_feedback_t* feedback, float* percentage) {
    if (!object || !pcm || !feedback || !percentage) {
        return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object, pcm, feedback and percentage must be non-null");
    }
    if (num_samples < 0) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "num_samples is negative");
    return guarded([&] {
        eagle::EnrollResult r = object->profiler->enroll(pcm, static_cast<size_t>(num_samples));
        *feedback = static_cast<eagle_profiler_enroll_feedback_t>(static_cast<int>(r.feedback));
        *percentage = r.percentage;
    });
}

eagle_status_t eagle_profiler_enroll_min_audio_length_samples(const eagle_profiler_t* object, int32_t* num_samples) {
    if (!object || !num_samples) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object and num_samples must be non-null");
    return guarded([&] {
        *num_samples = static_cast<int32_t>(object->profiler->min_enroll_samples());
    });
}

eagle_status_t eagle_profiler_export_size(const eagle_profiler_t* object, int32_t* speaker_profile_size_bytes) {
    if (!object || !speaker_profile_size_bytes) {
        return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object and speaker_profile_size_bytes must be non-null");
    }
    return guarded([&] {
        *speaker_profile_size_bytes = static_cast<int32_t>(object->profiler->export_size());
    });
}

eagle_status_t eagle_profiler_export(const eagle_profiler_t* object, void* speaker_profile) {
    if (!object || !speaker_profile) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object and speaker_profile must be non-null");
    return guarded([&] {
        eagle::Profile profile = object->profiler->export_profile();
        std::memcpy(speaker_profile, profile.bytes().data(), profile.size());
    });
}

eagle_status_t eagle_profiler_reset(eagle_profiler_t* object) {
    if (!object) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object is null");
    return guarded([&] { object->profiler->reset(); });
}

eagle_status_t eagle_profiler_sample_rate(const eagle_profiler_t* object, int32_t* sample_rate) {
    if (!object || !sample_rate) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object and sample_rate must be non-null");
    return guarded([&] { *sample_rate = object->profiler->sample_rate(); });
}

eagle_status_t eagle_init(const char* access_key, const char* model_path, int32_t num_speakers,
                          const void* const* speaker_profiles, eagle_t** object) {
    if (!object) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object is null");
    *object = nullptr;
    if (!access_key) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "access_key is null");
    if (num_speakers <= 0) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "num_speakers must be positive");
    if (!speaker_profiles) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "speaker_profiles is null");
    for (int32_t i = 0; i < num_speakers; ++i) {
        if (!speaker_profiles[i]) {
            return fail(EAGLE_STATUS_INVALID_ARGUMENT, "speaker profile " + std::to_string(i) + " is null");
        }
    }
    return guarded([&] {
        core::Config config = thread_config();
        std::shared_ptr<const eagle::Model> model = eagle::load_model_or_default(model_path ? model_path : "");
        // Profiles carry no length; they are exactly the model's profile size.
        std::vector<eagle::Profile> profiles;
        profiles.reserve(static_cast<size_t>(num_speakers));
        for (int32_t i = 0; i < num_speakers; ++i) {
            profiles.push_back(eagle::Profile::from_bytes(
                static_cast<const uint8_t*>(speaker_profiles[i]), model->profile_size()));
        }
        auto handle = std::make_unique<eagle_object>();
        handle->frame_length = model->params().frame_length;
        handle->engine = std::make_unique<eagle::Eagle>(access_key, model, profiles, config);
        *object = handle.release();
    });
}

void eagle_delete(eagle_t* object) {
    delete object;
}

eagle_status_t eagle_process(eagle_t* object, const int16_t* pcm, float* scores) {
    if (!object || !pcm || !scores) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object, pcm and scores must be non-null");
    return guarded([&] {
        std::vector<float> s = object->engine->process(pcm, static_cast<size_t>(object->frame_length));
        std::memcpy(scores, s.data(), s.size() * sizeof(float));
    });
}

eagle_status_t eagle_reset(eagle_t* object) {
    if (!object) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object is null");
    return guarded([&] { object->engine->reset(); });
}

eagle_status_t eagle_frame_length(const eagle_t* object, int32_t* frame_length) {
    if (!object || !frame_length) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object and frame_length must be non-null");
    *frame_length = object->frame_length;
    return EAGLE_STATUS_SUCCESS;
}

eagle_status_t eagle_sample_rate(const eagle_t* object, int32_t* sample_rate) {
    if (!object || !sample_rate) return fail(EAGLE_STATUS_INVALID_ARGUMENT, "object and sample_rate must be non-null");
    return guarded([&] { *sample_rate = object->engine->sample_rate(); });
}

} // extern "C"
