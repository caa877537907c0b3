#include "eagle/eagle.hpp"
#include "eagle/mel_features.hpp"
#include "eagle/model.hpp"
#include "core/activation.hpp"
#include "core/logging.hpp"
#include "core/status.hpp"
#include <algorithm>
#include <deque>
#include <mutex>

namespace eagle {

class EagleImpl {
public:
    explicit EagleImpl(const core::Config& config)
        : m_config(config), m_log("Eagle", config.log_level) {}

    void activate(const std::string& access_key) {
        core::activate_or_throw(m_config.activation.get(), access_key, m_config.sdk);
    }

    void attach(std::shared_ptr<const Model> model, const std::vector<Profile>& profiles);
    std::vector<float> process(const int16_t* pcm, size_t num_samples);
    void reset();
    void release();

    void ensure_alive() const {
        if (m_released) {
            core::throw_error(core::Status::InvalidState, "Eagle has been released");
        }
    }

    mutable std::mutex m_mutex;
    core::Config m_config;
    core::Logger m_log;
    std::shared_ptr<const Model> m_model;
    std::unique_ptr<MelFeatureExtractor> m_extractor;
    std::vector<std::vector<float>> m_speakers;  // voiceprints, score order
    std::deque<AnalysisFrame> m_window;
    std::vector<AnalysisFrame> m_new_frames;
    std::vector<float> m_scores;
    size_t m_window_voiced = 0;
    bool m_released = false;
};

void EagleImpl::attach(std::shared_ptr<const Model> model, const std::vector<Profile>& profiles) {
    if (!model) {
        core::throw_error(core::Status::InvalidArgument, "model is null");
    }
    if (profiles.empty()) {
        core::throw_error(core::Status::InvalidArgument, "at least one speaker profile is required");
    }

    std::vector<std::vector<float>> speakers;
    speakers.reserve(profiles.size());
    for (size_t i = 0; i < profiles.size(); ++i) {
        try {
            speakers.push_back(decode_profile(profiles[i], model->id(), model->backend().dim()).embedding);
        } catch (const core::EagleError& e) {
            throw e.with_context("speaker profile " + std::to_string(i) + " cannot be loaded");
        }
    }

    m_model = std::move(model);
    m_speakers = std::move(speakers);
    m_extractor = std::make_unique<MelFeatureExtractor>(m_model->params().features);
    m_scores.assign(m_speakers.size(), 0.0f);
    m_log.info("Ready: %zu speaker(s), frame_length=%d, sample_rate=%d",
               m_speakers.size(), m_model->params().frame_length, m_model->params().sample_rate);
}

std::vector<float> EagleImpl::process(const int16_t* pcm, size_t num_samples) {
    const ModelParams& p = m_model->params();
    if (!pcm) {
        core::throw_error(core::Status::InvalidArgument, "audio frame is null");
    }
    if (num_samples != static_cast<size_t>(p.frame_length)) {
        core::throw_error(core::Status::InvalidArgument,
                          "audio frame has " + std::to_string(num_samples) + " samples, expected " +
                          std::to_string(p.frame_length));
    }

    m_new_frames.clear();
    m_extractor->push(pcm, num_samples, m_new_frames);
    for (auto& f : m_new_frames) {
        if (f.voiced) m_window_voiced++;
        m_window.push_back(std::move(f));
    }
    while (m_window.size() > static_cast<size_t>(p.window_frames)) {
        if (m_window.front().voiced) m_window_voiced--;
        m_window.pop_front();
    }

    std::vector<float> raw(m_speakers.size(), 0.0f);
    if (m_window_voiced >= static_cast<size_t>(p.min_window_voiced_frames)) {
        std::vector<const AnalysisFrame*> voiced;
        voiced.reserve(m_window_voiced);
        for (const auto& f : m_window) {
            if (f.voiced) voiced.push_back(&f);
        }
        const IEmbeddingBackend& backend = m_model->backend();
        std::vector<float> emb = backend.embed(voiced);
        for (size_t i = 0; i < m_speakers.size(); ++i) {
            raw[i] = backend.similarity(emb, m_speakers[i]);
        }
    }

    for (size_t i = 0; i < m_scores.size(); ++i) {
        float s = p.smoothing * m_scores[i] + (1.0f - p.smoothing) * raw[i];
        m_scores[i] = std::clamp(s, 0.0f, 1.0f);
    }
    return m_scores;
}

void EagleImpl::reset() {
    m_extractor->reset();
    m_window.clear();
    m_window_voiced = 0;
    std::fill(m_scores.begin(), m_scores.end(), 0.0f);
    m_log.debug("Reset");
}

void EagleImpl::release() {
    m_released = true;
    m_window.clear();
    m_speakers.clear();
    m_extractor.reset();
    m_model.reset();
}

Eagle::Eagle(const std::string& access_key, const std::string& model_path,
             const std::vector<Profile>& profiles, const core::Config& config)
    : m_impl(std::make_unique<EagleImpl>(config))
{
    m_impl->activate(access_key);
    m_impl->attach(load_model_or_default(model_path, &m_impl->m_log), profiles);
}

Eagle::Eagle(const std::string& access_key, std::shared_ptr<const Model> model,
             const std::vector<Profile>& profiles, const core::Config& config)
    : m_impl(std::make_unique<EagleImpl>(config))
{
    m_impl->activate(access_key);
    m_impl->attach(std::move(model), profiles);
}

Eagle::~Eagle() = default;

std::vector<float> Eagle::process(const int16_t* pcm, size_t num_samples) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->process(pcm, num_samples);
}

void Eagle::reset() {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    m_impl->reset();
}

void Eagle::release() {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    m_impl->release();
}

bool Eagle::released() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    return m_impl->m_released;
}

int Eagle::frame_length() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->m_model->params().frame_length;
}

int Eagle::sample_rate() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->m_model->params().sample_rate;
}

size_t Eagle::num_speakers() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->m_speakers.size();
}

} // namespace eagle
