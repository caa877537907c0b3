#include "eagle/handcrafted_embedder.hpp"
#include "core/status.hpp"
#include <algorithm>
#include <cmath>

namespace eagle {

const char* backend_kind_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::HandCrafted: return "handcrafted";
        case BackendKind::NeuralOnnx: return "onnx";
    }
    return "unknown";
}

HandcraftedEmbedder::HandcraftedEmbedder(const Config& config) : m_config(config) {
    if (m_config.n_ceps < 2) {
        core::throw_error(core::Status::InvalidArgument, "handcrafted backend needs at least 2 cepstra");
    }
    if (!(m_config.sigma > 0.0f)) {
        core::throw_error(core::Status::InvalidArgument, "handcrafted backend sigma must be positive");
    }
}

std::vector<float> HandcraftedEmbedder::embed(const std::vector<const AnalysisFrame*>& frames) const {
    const size_t d = dim();
    std::vector<double> sum(d, 0.0);
    size_t used = 0;
    for (const AnalysisFrame* f : frames) {
        if (f->cepstrum.size() < d + 1) continue;
        for (size_t i = 0; i < d; ++i) {
            sum[i] += f->cepstrum[i + 1];
        }
        used++;
    }
    std::vector<float> emb(d, 0.0f);
    if (used == 0) return emb;
    for (size_t i = 0; i < d; ++i) {
        emb[i] = static_cast<float>(sum[i] / used);
    }
    return emb;
}

float HandcraftedEmbedder::distance(const std::vector<float>& a, const std::vector<float>& b) {
    const size_t n = std::min(a.size(), b.size());
    if (n == 0) return 0.0f;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double diff = a[i] - b[i];
        acc += diff * diff;
    }
    return static_cast<float>(std::sqrt(acc / n));
}

float HandcraftedEmbedder::similarity(const std::vector<float>& a, const std::vector<float>& b) const {
    float d = distance(a, b) / m_config.sigma;
    float s = std::exp(-0.5f * d * d);
    return std::clamp(s, 0.0f, 1.0f);
}

void HandcraftedEmbedder::finalize_voiceprint(std::vector<float>& weighted_sum, double total_weight) const {
    if (total_weight <= 0.0) return;
    for (float& v : weighted_sum) {
        v = static_cast<float>(v / total_weight);
    }
}

} // namespace eagle
