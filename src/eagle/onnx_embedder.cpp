#include "eagle/onnx_embedder.hpp"
#include "core/status.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>

#ifdef _WIN32
#define NOMINMAX  // Prevent Windows.h from defining min/max macros
#include <windows.h>
#endif

namespace eagle {

namespace {
// Frames fed once at load time when the graph leaves the embedding size dynamic.
constexpr size_t kProbeFrames = 100;
}

OnnxEmbedder::OnnxEmbedder(const Config& config)
    : m_config(config)
{
    if (m_config.verbose) {
        fprintf(stderr, "[OnnxEmbedder] Initializing with model: %s\n", m_config.model_path.c_str());
    }
    if (m_config.n_mels <= 0) {
        core::throw_error(core::Status::InvalidArgument, "ONNX backend needs n_mels > 0");
    }
    if (!std::ifstream(m_config.model_path, std::ios::binary)) {
        core::throw_error(core::Status::IOError, "cannot open ONNX model '" + m_config.model_path + "'");
    }

    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "EagleSpeakerEmbedding");

        m_session_options = std::make_unique<Ort::SessionOptions>();
        m_session_options->SetIntraOpNumThreads(std::max(1, m_config.intra_op_threads));
        m_session_options->SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

#ifdef _WIN32
        // Windows: convert UTF-8 to wide string
        std::wstring wide_path;
        wide_path.resize(m_config.model_path.size() + 1);
        int len = MultiByteToWideChar(CP_UTF8, 0, m_config.model_path.c_str(),
                                       static_cast<int>(m_config.model_path.size()),
                                       &wide_path[0], static_cast<int>(wide_path.size()));
        wide_path.resize(len);
        m_session = std::make_unique<Ort::Session>(*m_env, wide_path.c_str(), *m_session_options);
#else
        m_session = std::make_unique<Ort::Session>(*m_env, m_config.model_path.c_str(), *m_session_options);
#endif

        if (m_session->GetInputCount() < 1 || m_session->GetOutputCount() < 1) {
            core::throw_error(core::Status::InvalidArgument,
                              "ONNX model must have at least one input and one output");
        }

        Ort::AllocatorWithDefaultOptions allocator;
        m_input_name_strings.emplace_back(m_session->GetInputNameAllocated(0, allocator).get());
        m_output_name_strings.emplace_back(m_session->GetOutputNameAllocated(0, allocator).get());
        m_input_names.push_back(m_input_name_strings.back().c_str());
        m_output_names.push_back(m_output_name_strings.back().c_str());

        Ort::TypeInfo type_info = m_session->GetOutputTypeInfo(0);
        auto shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() >= 2 && shape[1] > 0) {
            m_embedding_dim = static_cast<int>(shape[1]);  // (batch, embedding_dim)
        }

        m_memory_info = std::make_unique<Ort::MemoryInfo>(
            Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)
        );

        if (m_embedding_dim <= 0) {
            std::vector<float> probe(kProbeFrames * m_config.n_mels, 0.0f);
            m_embedding_dim = static_cast<int>(run(probe, kProbeFrames).size());
        }
        if (m_embedding_dim <= 0) {
            core::throw_error(core::Status::InvalidArgument, "ONNX model produced an empty embedding");
        }

        if (m_config.verbose) {
            fprintf(stderr, "[OnnxEmbedder] Input: %s, output: %s, embedding_dim: %d\n",
                    m_input_name_strings[0].c_str(), m_output_name_strings[0].c_str(), m_embedding_dim);
        }
    } catch (const Ort::Exception& e) {
        fprintf(stderr, "[OnnxEmbedder] ONNX Runtime error: %s\n", e.what());
        throw core::EagleError(core::Status::RuntimeError,
                               std::string("Failed to initialize ONNX embedder: ") + e.what());
    }
}

OnnxEmbedder::~OnnxEmbedder() = default;

void OnnxEmbedder::normalize_embedding(std::vector<float>& emb) {
    double norm = 0.0;
    for (float val : emb) {
        norm += static_cast<double>(val) * val;
    }
    norm = std::sqrt(norm);

    if (norm > 1e-8) {
        for (float& val : emb) {
            val /= static_cast<float>(norm);
        }
    }
}

std::vector<float> OnnxEmbedder::run(std::vector<float>& fbank, size_t n_frames) const {
    // Input tensor: [batch=1, time_frames, n_mels]
    std::vector<int64_t> input_shape = {1, static_cast<int64_t>(n_frames), m_config.n_mels};
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        *m_memory_info,
        fbank.data(),
        fbank.size(),
        input_shape.data(),
        input_shape.size()
    );

    auto output_tensors = m_session->Run(
        Ort::RunOptions{nullptr},
        m_input_names.data(),
        &input_tensor,
        1,
        m_output_names.data(),
        1
    );

    const float* output_data = output_tensors[0].GetTensorData<float>();
    auto output_shape = output_tensors[0].GetTensorTypeAndShapeInfo().GetShape();
    size_t output_dim = output_shape.size() >= 2 ? static_cast<size_t>(output_shape[1])
                                                 : static_cast<size_t>(output_shape[0]);
    return std::vector<float>(output_data, output_data + output_dim);
}

std::vector<float> OnnxEmbedder::embed(const std::vector<const AnalysisFrame*>& frames) const {
    const size_t n_mels = static_cast<size_t>(m_config.n_mels);
    std::vector<float> fbank;
    fbank.reserve(frames.size() * n_mels);
    for (const AnalysisFrame* f : frames) {
        if (f->log_mel.size() != n_mels) {
            core::throw_error(core::Status::InvalidArgument,
                              "front end produces " + std::to_string(f->log_mel.size()) +
                              " mel bands, ONNX backend expects " + std::to_string(n_mels));
        }
        fbank.insert(fbank.end(), f->log_mel.begin(), f->log_mel.end());
    }
    if (frames.empty()) {
        return std::vector<float>(dim(), 0.0f);
    }

    if (m_config.mean_normalize) {
        std::vector<double> mean(n_mels, 0.0);
        for (size_t t = 0; t < frames.size(); ++t) {
            for (size_t m = 0; m < n_mels; ++m) mean[m] += fbank[t * n_mels + m];
        }
        for (size_t m = 0; m < n_mels; ++m) mean[m] /= frames.size();
        for (size_t t = 0; t < frames.size(); ++t) {
            for (size_t m = 0; m < n_mels; ++m) fbank[t * n_mels + m] -= static_cast<float>(mean[m]);
        }
    }

    try {
        std::vector<float> embedding = run(fbank, frames.size());
        if (embedding.size() != dim()) {
            core::throw_error(core::Status::RuntimeError,
                              "ONNX model returned " + std::to_string(embedding.size()) +
                              " values, expected " + std::to_string(dim()));
        }
        normalize_embedding(embedding);
        return embedding;
    } catch (const Ort::Exception& e) {
        fprintf(stderr, "[OnnxEmbedder] Inference error: %s\n", e.what());
        throw core::EagleError(core::Status::RuntimeError, std::string("ONNX inference failed: ") + e.what());
    }
}

float OnnxEmbedder::similarity(const std::vector<float>& a, const std::vector<float>& b) const {
    const size_t n = std::min(a.size(), b.size());
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) return 0.0f;
    double cosine = dot / std::sqrt(na * nb);
    double s = 1.0 / (1.0 + std::exp(-m_config.score_slope * (cosine - m_config.score_center)));
    return std::clamp(static_cast<float>(s), 0.0f, 1.0f);
}

void OnnxEmbedder::finalize_voiceprint(std::vector<float>& weighted_sum, double total_weight) const {
    if (total_weight <= 0.0) return;
    for (float& v : weighted_sum) {
        v = static_cast<float>(v / total_weight);
    }
    normalize_embedding(weighted_sum);
}

} // namespace eagle
