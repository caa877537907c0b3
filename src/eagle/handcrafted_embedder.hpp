#pragma once

#include "eagle/embedding_backend.hpp"

namespace eagle {

// Voiceprint = mean cepstrum (c1 onwards) over voiced frames. Scores with a
// Gaussian kernel on the RMS cepstral distance.
class HandcraftedEmbedder : public IEmbeddingBackend {
public:
    struct Config {
        int n_ceps = 20;
        float sigma = 0.8f;   // RMS distance at which the score drops to exp(-0.5)
    };

    explicit HandcraftedEmbedder(const Config& config);

    BackendKind kind() const override { return BackendKind::HandCrafted; }
    size_t dim() const override { return static_cast<size_t>(m_config.n_ceps - 1); }

    std::vector<float> embed(const std::vector<const AnalysisFrame*>& frames) const override;
    float similarity(const std::vector<float>& a, const std::vector<float>& b) const override;
    void finalize_voiceprint(std::vector<float>& weighted_sum, double total_weight) const override;

    // RMS difference; exposed for diagnostics.
    static float distance(const std::vector<float>& a, const std::vector<float>& b);

private:
    Config m_config;
};

} // namespace eagle
