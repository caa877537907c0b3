#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "eagle/mel_features.hpp"

namespace eagle {

enum class BackendKind : uint32_t {
    HandCrafted = 0,   // cepstral mean voiceprint
    NeuralOnnx = 1,    // ONNX speaker embedding network
};

const char* backend_kind_to_string(BackendKind kind);

/**
 * Maps voiced analysis frames to a fixed-size speaker embedding and scores
 * two embeddings against each other.
 *
 * Backends are immutable after construction and shared by every engine
 * instance created from the same model, so all methods are const and must be
 * safe to call concurrently.
 */
class IEmbeddingBackend {
public:
    virtual ~IEmbeddingBackend() = default;

    virtual BackendKind kind() const = 0;
    virtual size_t dim() const = 0;

    // `frames` is non-empty and holds voiced frames only.
    virtual std::vector<float> embed(const std::vector<const AnalysisFrame*>& frames) const = 0;

    // Similarity in [0, 1]; 1 means same speaker.
    virtual float similarity(const std::vector<float>& a, const std::vector<float>& b) const = 0;

    // Turns a weighted sum of chunk embeddings into a voiceprint, in place.
    virtual void finalize_voiceprint(std::vector<float>& weighted_sum, double total_weight) const = 0;
};

} // namespace eagle
