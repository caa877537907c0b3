#include "eagle/profiler.hpp"
#include "eagle/chunk_quality.hpp"
#include "eagle/mel_features.hpp"
#include "eagle/model.hpp"
#include "core/activation.hpp"
#include "core/logging.hpp"
#include "core/status.hpp"
#include <algorithm>
#include <limits>
#include <mutex>

namespace eagle {

const char* enroll_feedback_to_string(EnrollFeedback feedback) {
    switch (feedback) {
        case EnrollFeedback::AudioOk: return "AUDIO_OK";
        case EnrollFeedback::AudioTooShort: return "AUDIO_TOO_SHORT";
        case EnrollFeedback::UnknownSpeaker: return "UNKNOWN_SPEAKER";
        case EnrollFeedback::NoVoiceFound: return "NO_VOICE_FOUND";
        case EnrollFeedback::QualityIssue: return "QUALITY_ISSUE";
    }
    return "UNKNOWN_FEEDBACK";
}

class EagleProfilerImpl {
public:
    explicit EagleProfilerImpl(const core::Config& config)
        : m_config(config), m_log("EagleProfiler", config.log_level) {}

    void activate(const std::string& access_key) {
        core::activate_or_throw(m_config.activation.get(), access_key, m_config.sdk);
    }

    void attach(std::shared_ptr<const Model> model) {
        if (!model) {
            core::throw_error(core::Status::InvalidArgument, "model is null");
        }
        m_model = std::move(model);
        m_extractor = std::make_unique<MelFeatureExtractor>(m_model->params().features);
        m_sum.assign(m_model->backend().dim(), 0.0f);
        m_log.info("Ready: sample_rate=%d, min_enroll_samples=%d",
                   m_model->params().sample_rate, m_model->params().min_enroll_samples);
    }

    EnrollResult enroll(const int16_t* pcm, size_t num_samples);
    Profile export_profile() const;
    void reset();
    void release();

    void ensure_alive() const {
        if (m_released) {
            core::throw_error(core::Status::InvalidState, "EagleProfiler has been released");
        }
    }

    std::vector<float> voiceprint() const {
        std::vector<float> vp = m_sum;
        m_model->backend().finalize_voiceprint(vp, static_cast<double>(m_voiced_frames));
        return vp;
    }

    mutable std::mutex m_mutex;
    core::Config m_config;
    core::Logger m_log;
    std::shared_ptr<const Model> m_model;
    std::unique_ptr<MelFeatureExtractor> m_extractor;
    std::vector<float> m_sum;           // voiced-frame weighted sum of chunk embeddings
    uint64_t m_voiced_frames = 0;
    float m_percentage = 0.0f;
    bool m_released = false;
};

EnrollResult EagleProfilerImpl::enroll(const int16_t* pcm, size_t num_samples) {
    const ModelParams& p = m_model->params();
    if (!pcm) {
        core::throw_error(core::Status::InvalidArgument, "enrollment audio is null");
    }
    if (num_samples < static_cast<size_t>(p.min_enroll_samples)) {
        core::throw_error(core::Status::InvalidArgument,
                          "enrollment audio has " + std::to_string(num_samples) +
                          " samples, at least " + std::to_string(p.min_enroll_samples) + " are required");
    }

    std::vector<AnalysisFrame> frames = m_extractor->analyze(pcm, num_samples);
    ChunkQuality quality = assess_chunk(pcm, num_samples, frames);

    std::vector<const AnalysisFrame*> voiced;
    voiced.reserve(quality.voiced_frames);
    for (const auto& f : frames) {
        if (f.voiced) voiced.push_back(&f);
    }

    EnrollResult result;
    if (voiced.size() < static_cast<size_t>(p.min_voiced_frames_detect)) {
        result.feedback = EnrollFeedback::NoVoiceFound;
    } else if (!quality.acceptable(p.quality)) {
        m_log.debug("Quality gate: clip_ratio=%.4f snr=%.1fdB level=%.1fdB",
                    quality.clip_ratio, quality.snr_db, quality.speech_level_db);
        result.feedback = EnrollFeedback::QualityIssue;
    } else if (voiced.size() < static_cast<size_t>(p.min_voiced_frames_chunk)) {
        result.feedback = EnrollFeedback::AudioTooShort;
    } else {
        const IEmbeddingBackend& backend = m_model->backend();
        std::vector<float> emb = backend.embed(voiced);
        result.feedback = EnrollFeedback::AudioOk;

        // Two speakers in one chunk show up as disagreeing halves
        if (voiced.size() >= 2 * static_cast<size_t>(p.min_half_voiced_frames)) {
            const size_t mid = voiced.size() / 2;
            std::vector<const AnalysisFrame*> first(voiced.begin(), voiced.begin() + mid);
            std::vector<const AnalysisFrame*> second(voiced.begin() + mid, voiced.end());
            float halves = backend.similarity(backend.embed(first), backend.embed(second));
            m_log.debug("Chunk halves similarity %.3f", halves);
            if (halves < p.mixed_speaker_threshold) {
                result.feedback = EnrollFeedback::UnknownSpeaker;
            }
        }

        if (result.feedback == EnrollFeedback::AudioOk && m_voiced_frames > 0) {
            float consistency = backend.similarity(emb, voiceprint());
            m_log.debug("Chunk vs voiceprint similarity %.3f", consistency);
            if (consistency < p.consistency_threshold) {
                result.feedback = EnrollFeedback::UnknownSpeaker;
            }
        }

        if (result.feedback == EnrollFeedback::AudioOk) {
            const float weight = static_cast<float>(voiced.size());
            for (size_t i = 0; i < m_sum.size() && i < emb.size(); ++i) {
                m_sum[i] += weight * emb[i];
            }
            m_voiced_frames += voiced.size();
            double pct = 100.0 * static_cast<double>(m_voiced_frames) / p.enroll_voiced_frames;
            m_percentage = static_cast<float>(std::min(100.0, pct));
        }
    }

    result.percentage = m_percentage;
    m_log.info("Enrolled %zu samples: %zu/%zu voiced frames, %s, %.1f%%",
               num_samples, voiced.size(), frames.size(),
               enroll_feedback_to_string(result.feedback), result.percentage);
    return result;
}

Profile EagleProfilerImpl::export_profile() const {
    if (m_percentage < 100.0f) {
        core::throw_error(core::Status::InvalidState,
                          "enrollment is at " + std::to_string(static_cast<int>(m_percentage)) +
                          "%, export requires 100%");
    }
    uint64_t frames = std::min<uint64_t>(m_voiced_frames, std::numeric_limits<uint32_t>::max());
    return encode_profile(m_model->id(), static_cast<uint32_t>(frames), voiceprint());
}

void EagleProfilerImpl::reset() {
    m_extractor->reset();
    std::fill(m_sum.begin(), m_sum.end(), 0.0f);
    m_voiced_frames = 0;
    m_percentage = 0.0f;
    m_log.debug("Reset");
}

void EagleProfilerImpl::release() {
    m_released = true;
    m_extractor.reset();
    m_model.reset();
    m_sum.clear();
}

EagleProfiler::EagleProfiler(const std::string& access_key, const std::string& model_path,
                             const core::Config& config)
    : m_impl(std::make_unique<EagleProfilerImpl>(config))
{
    m_impl->activate(access_key);
    m_impl->attach(load_model_or_default(model_path, &m_impl->m_log));
}

EagleProfiler::EagleProfiler(const std::string& access_key, std::shared_ptr<const Model> model,
                             const core::Config& config)
    : m_impl(std::make_unique<EagleProfilerImpl>(config))
{
    m_impl->activate(access_key);
    m_impl->attach(std::move(model));
}

EagleProfiler::~EagleProfiler() = default;

EnrollResult EagleProfiler::enroll(const int16_t* pcm, size_t num_samples) {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->enroll(pcm, num_samples);
}

Profile EagleProfiler::export_profile() {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->export_profile();
}

size_t EagleProfiler::export_size() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->m_model->profile_size();
}

void EagleProfiler::reset() {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    m_impl->reset();
}

void EagleProfiler::release() {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    m_impl->release();
}

bool EagleProfiler::released() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    return m_impl->m_released;
}

float EagleProfiler::percentage() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->m_percentage;
}

size_t EagleProfiler::min_enroll_samples() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return static_cast<size_t>(m_impl->m_model->params().min_enroll_samples);
}

int EagleProfiler::sample_rate() const {
    std::lock_guard<std::mutex> lock(m_impl->m_mutex);
    m_impl->ensure_alive();
    return m_impl->m_model->params().sample_rate;
}

} // namespace eagle
