#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "eagle/chunk_quality.hpp"
#include "eagle/embedding_backend.hpp"
#include "eagle/mel_features.hpp"

namespace core { class Logger; }

namespace eagle {

/**
 * Everything that defines a model: stream format, front end, quality gates,
 * enrollment and recognition tuning, and the embedding backend.
 * Stored in a versioned binary params file ("eagle_params.pv").
 */
struct ModelParams {
    std::string name = "eagle-cepstral-16k";
    int sample_rate = 16000;
    int frame_length = 512;             // samples per Eagle::process call
    int min_enroll_samples = 16000;     // shortest chunk Profiler::enroll accepts

    BackendKind backend = BackendKind::HandCrafted;
    std::string backend_model;          // ONNX file, relative to the params file

    MelFeatureExtractor::Config features;
    QualityGates quality;

    // Enrollment
    int min_voiced_frames_detect = 10;  // below: NO_VOICE_FOUND
    int min_voiced_frames_chunk = 50;   // below: AUDIO_TOO_SHORT
    int enroll_voiced_frames = 800;     // voiced frames for 100%
    float consistency_threshold = 0.4f; // chunk vs voiceprint so far
    float mixed_speaker_threshold = 0.25f; // first half vs second half of a chunk
    int min_half_voiced_frames = 80;    // halves check needs this many per half

    // Recognition
    int window_frames = 150;            // rolling window, analysis frames
    int min_window_voiced_frames = 30;
    float smoothing = 0.3f;             // weight of the previous score

    // Scoring
    float score_sigma = 0.8f;           // handcrafted
    float score_center = 0.45f;         // onnx
    float score_slope = 10.0f;          // onnx
    int onnx_threads = 1;

    // Throws core::EagleError(InvalidArgument) naming the first bad field.
    void validate() const;
};

// File layout: "EGLM", u32 format version, u32 body size, body, u32 FNV-1a of body.
std::vector<uint8_t> encode_model_params(const ModelParams& params);
// Throws core::EagleError(InvalidArgument) on any format problem. `model_id` gets the body checksum.
ModelParams decode_model_params(const uint8_t* data, size_t size, uint32_t* model_id = nullptr);

/**
 * A loaded model: validated parameters plus the embedding backend built from them.
 * Immutable, so a single instance is shared by every Profiler and Eagle that use it.
 */
class Model {
public:
    ~Model();
    Model(const Model&) = delete;
    Model& operator=(const Model&) = delete;

    /**
     * Load a params file. Repeated loads of the same unchanged file return the
     * same instance while any holder keeps it alive.
     * Throws IOError when the file cannot be read, InvalidArgument when it is malformed.
     */
    static std::shared_ptr<const Model> load(const std::string& path, const core::Logger* log = nullptr);

    // `base_dir` resolves a relative backend_model path.
    static std::shared_ptr<const Model> from_params(const ModelParams& params,
                                                    const std::string& base_dir = "",
                                                    const core::Logger* log = nullptr);

    // Built-in hand-crafted model; same id as its saved params file.
    static std::shared_ptr<const Model> default_model();

    // Throws IOError when the file cannot be written.
    static void save(const ModelParams& params, const std::string& path);

    const ModelParams& params() const { return m_params; }
    uint32_t id() const { return m_id; }
    const IEmbeddingBackend& backend() const { return *m_backend; }
    size_t profile_size() const;

private:
    Model(ModelParams params, uint32_t id, std::unique_ptr<IEmbeddingBackend> backend);

    ModelParams m_params;
    uint32_t m_id;
    std::unique_ptr<IEmbeddingBackend> m_backend;
};

// Model::load(path), or the built-in model when path is empty.
std::shared_ptr<const Model> load_model_or_default(const std::string& path, const core::Logger* log = nullptr);

} // namespace eagle
