#pragma once

#include <vector>
#include <string>
#include <memory>
#include "eagle/embedding_backend.hpp"

// Forward declarations to avoid including onnxruntime headers here
namespace Ort {
    struct Env;
    struct Session;
    struct SessionOptions;
    struct MemoryInfo;
}

namespace eagle {

/**
 * ONNX-based neural speaker embedding extractor.
 * Feeds log-mel filterbank frames [1, T, n_mels] to a pretrained network
 * (WeSpeaker ResNet34, CAM++, ECAPA-TDNN exports) and scores embeddings by
 * cosine similarity mapped through a logistic curve.
 */
class OnnxEmbedder : public IEmbeddingBackend {
public:
    struct Config {
        std::string model_path = "models/speaker_embedding.onnx";
        int n_mels = 80;
        int intra_op_threads = 1;
        bool mean_normalize = true;         // per-utterance CMN on the fbank input
        float score_center = 0.45f;         // cosine mapped to 0.5
        float score_slope = 10.0f;
        bool verbose = false;
    };

    // Throws core::EagleError (IOError when the file is missing, RuntimeError on ONNX failures).
    explicit OnnxEmbedder(const Config& config);
    ~OnnxEmbedder() override;

    // Disable copy/move (ONNX session is non-copyable)
    OnnxEmbedder(const OnnxEmbedder&) = delete;
    OnnxEmbedder& operator=(const OnnxEmbedder&) = delete;

    BackendKind kind() const override { return BackendKind::NeuralOnnx; }
    size_t dim() const override { return static_cast<size_t>(m_embedding_dim); }

    std::vector<float> embed(const std::vector<const AnalysisFrame*>& frames) const override;
    float similarity(const std::vector<float>& a, const std::vector<float>& b) const override;
    void finalize_voiceprint(std::vector<float>& weighted_sum, double total_weight) const override;

private:
    Config m_config;

    std::unique_ptr<Ort::Env> m_env;
    std::unique_ptr<Ort::SessionOptions> m_session_options;
    std::unique_ptr<Ort::Session> m_session;
    std::unique_ptr<Ort::MemoryInfo> m_memory_info;

    std::vector<std::string> m_input_name_strings;
    std::vector<std::string> m_output_name_strings;
    std::vector<const char*> m_input_names;
    std::vector<const char*> m_output_names;
    int m_embedding_dim = 0;

    std::vector<float> run(std::vector<float>& fbank, size_t n_frames) const;
    static void normalize_embedding(std::vector<float>& emb);
};

} // namespace eagle
