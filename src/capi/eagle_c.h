/*
 * C interface to the Eagle speaker recognition engine.
 *
 * Every function that can fail returns an eagle_status_t. On failure the
 * messages describing it are kept per thread and can be fetched with
 * eagle_get_error_stack() until the next failing call on that thread.
 */
#ifndef EAGLE_C_H
#define EAGLE_C_H

#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32)
#  if defined(EAGLE_BUILDING_LIBRARY)
#    define EAGLE_API __declspec(dllexport)
#  else
#    define EAGLE_API __declspec(dllimport)
#  endif
#else
#  define EAGLE_API __attribute__((visibility("default")))
#endif

typedef enum {
    EAGLE_STATUS_SUCCESS = 0,
    EAGLE_STATUS_OUT_OF_MEMORY = 1,
    EAGLE_STATUS_IO_ERROR = 2,
    EAGLE_STATUS_INVALID_ARGUMENT = 3,
    EAGLE_STATUS_STOP_ITERATION = 4,
    EAGLE_STATUS_KEY_ERROR = 5,
    EAGLE_STATUS_INVALID_STATE = 6,
    EAGLE_STATUS_RUNTIME_ERROR = 7,
    EAGLE_STATUS_ACTIVATION_ERROR = 8,
    EAGLE_STATUS_ACTIVATION_LIMIT_REACHED = 9,
    EAGLE_STATUS_ACTIVATION_THROTTLED = 10,
    EAGLE_STATUS_ACTIVATION_REFUSED = 11,
} eagle_status_t;

EAGLE_API const char *eagle_status_to_string(eagle_status_t status);

/* Messages of the last failure on the calling thread. Free with eagle_free_error_stack(). */
EAGLE_API eagle_status_t eagle_get_error_stack(char ***message_stack, int32_t *message_stack_depth);
EAGLE_API void eagle_free_error_stack(char **message_stack);

/* Caller identifier forwarded to AccessKey activation for objects created afterwards on this thread. */
EAGLE_API void eagle_set_sdk(const char *sdk);

EAGLE_API const char *eagle_version(void);

/* ---- Profiler ---- */

typedef struct eagle_profiler_object eagle_profiler_t;

typedef enum {
    EAGLE_PROFILER_ENROLL_FEEDBACK_AUDIO_OK = 0,
    EAGLE_PROFILER_ENROLL_FEEDBACK_AUDIO_TOO_SHORT = 1,
    EAGLE_PROFILER_ENROLL_FEEDBACK_UNKNOWN_SPEAKER = 2,
    EAGLE_PROFILER_ENROLL_FEEDBACK_NO_VOICE_FOUND = 3,
    EAGLE_PROFILER_ENROLL_FEEDBACK_QUALITY_ISSUE = 4,
} eagle_profiler_enroll_feedback_t;

EAGLE_API const char *eagle_profiler_enroll_feedback_to_string(eagle_profiler_enroll_feedback_t feedback);

/* model_path may be NULL or empty for the built-in model. */
EAGLE_API eagle_status_t eagle_profiler_init(
        const char *access_key,
        const char *model_path,
        eagle_profiler_t **object);

EAGLE_API void eagle_profiler_delete(eagle_profiler_t *object);

EAGLE_API eagle_status_t eagle_profiler_enroll(
        eagle_profiler_t *object,
        const int16_t *pcm,
        int32_t num_samples,
        eagle_profiler_enroll_feedback_t *feedback,
        float *percentage);

EAGLE_API eagle_status_t eagle_profiler_enroll_min_audio_length_samples(
        const eagle_profiler_t *object,
        int32_t *num_samples);

EAGLE_API eagle_status_t eagle_profiler_export_size(const eagle_profiler_t *object, int32_t *speaker_profile_size_bytes);

/* speaker_profile must hold eagle_profiler_export_size() bytes. */
EAGLE_API eagle_status_t eagle_profiler_export(const eagle_profiler_t *object, void *speaker_profile);

EAGLE_API eagle_status_t eagle_profiler_reset(eagle_profiler_t *object);

EAGLE_API eagle_status_t eagle_profiler_sample_rate(const eagle_profiler_t *object, int32_t *sample_rate);

/* ---- Recognizer ---- */

typedef struct eagle_object eagle_t;

/* Each profile holds the model's profile size in bytes (see eagle_profiler_export_size). */
EAGLE_API eagle_status_t eagle_init(
        const char *access_key,
        const char *model_path,
        int32_t num_speakers,
        const void *const *speaker_profiles,
        eagle_t **object);

EAGLE_API void eagle_delete(eagle_t *object);

/* pcm holds eagle_frame_length() samples; scores receives num_speakers values. */
EAGLE_API eagle_status_t eagle_process(eagle_t *object, const int16_t *pcm, float *scores);

EAGLE_API eagle_status_t eagle_reset(eagle_t *object);

EAGLE_API eagle_status_t eagle_frame_length(const eagle_t *object, int32_t *frame_length);

EAGLE_API eagle_status_t eagle_sample_rate(const eagle_t *object, int32_t *sample_rate);

#ifdef __cplusplus
}
#endif

#endif /* EAGLE_C_H */
