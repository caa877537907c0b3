#include "eagle/model.hpp"
#include "eagle/handcrafted_embedder.hpp"
#include "eagle/profile.hpp"
#include "core/byte_io.hpp"
#include "core/logging.hpp"
#include "core/status.hpp"
#ifdef EAGLE_HAVE_ONNXRUNTIME
#include "eagle/onnx_embedder.hpp"
#endif
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>

namespace eagle {

namespace fs = std::filesystem;

namespace {

constexpr char kMagic[4] = {'E', 'G', 'L', 'M'};
constexpr uint32_t kFormatVersion = 1;
constexpr size_t kMaxBodySize = 1 << 20;

void bad_param(const std::string& field, const std::string& why) {
    core::throw_error(core::Status::InvalidArgument, "model parameter '" + field + "' " + why);
}

void check_range(const std::string& field, double value, double lo, double hi) {
    if (!std::isfinite(value) || value < lo || value > hi) {
        bad_param(field, "out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]: " +
                  std::to_string(value));
    }
}

std::unique_ptr<IEmbeddingBackend> make_backend(const ModelParams& p, const std::string& base_dir,
                                                const core::Logger* log) {
    if (p.backend == BackendKind::HandCrafted) {
        HandcraftedEmbedder::Config cfg;
        cfg.n_ceps = p.features.n_ceps;
        cfg.sigma = p.score_sigma;
        return std::make_unique<HandcraftedEmbedder>(cfg);
    }
#ifdef EAGLE_HAVE_ONNXRUNTIME
    fs::path onnx_path(p.backend_model);
    if (onnx_path.is_relative() && !base_dir.empty()) {
        onnx_path = fs::path(base_dir) / onnx_path;
    }
    OnnxEmbedder::Config cfg;
    cfg.model_path = onnx_path.string();
    cfg.n_mels = p.features.n_mels;
    cfg.intra_op_threads = p.onnx_threads;
    cfg.score_center = p.score_center;
    cfg.score_slope = p.score_slope;
    cfg.verbose = log && log->enabled(core::LogLevel::Debug);
    return std::make_unique<OnnxEmbedder>(cfg);
#else
    (void)base_dir;
    (void)log;
    core::throw_error(core::Status::InvalidArgument,
                      "model '" + p.name + "' needs the ONNX backend, which this build does not include");
#endif
}

struct CacheKey {
    std::string path;
    uintmax_t size;
    int64_t mtime;
    bool operator<(const CacheKey& o) const {
        if (path != o.path) return path < o.path;
        if (size != o.size) return size < o.size;
        return mtime < o.mtime;
    }
};

std::mutex g_cache_mutex;
std::map<CacheKey, std::weak_ptr<const Model>> g_cache;

} // namespace

void ModelParams::validate() const {
    if (name.empty()) bad_param("name", "is empty");
    check_range("sample_rate", sample_rate, 8000, 48000);
    if (features.sample_rate != sample_rate) bad_param("features.sample_rate", "differs from sample_rate");
    check_range("frame_length", frame_length, 16, sample_rate);
    check_range("min_enroll_samples", min_enroll_samples, features.win_length, 60.0 * sample_rate);
    if (backend != BackendKind::HandCrafted && backend != BackendKind::NeuralOnnx) {
        bad_param("backend", "is unknown");
    }
    if (backend == BackendKind::NeuralOnnx && backend_model.empty()) {
        bad_param("backend_model", "is required for the onnx backend");
    }
    check_range("features.n_fft", features.n_fft, 64, 8192);
    check_range("features.win_length", features.win_length, 16, features.n_fft);
    check_range("features.hop_length", features.hop_length, 1, features.win_length);
    check_range("features.n_mels", features.n_mels, 2, 512);
    check_range("features.n_ceps", features.n_ceps, 2, features.n_mels);
    // Throws for inconsistent front end settings
    MelFeatureExtractor front_end(features);

    check_range("quality.max_clip_ratio", quality.max_clip_ratio, 0.0, 1.0);
    check_range("quality.min_snr_db", quality.min_snr_db, -100.0, 200.0);
    check_range("quality.min_speech_level_db", quality.min_speech_level_db, -100.0, 0.0);

    check_range("min_voiced_frames_detect", min_voiced_frames_detect, 1, 1e6);
    check_range("min_voiced_frames_chunk", min_voiced_frames_chunk, min_voiced_frames_detect, 1e6);
    check_range("enroll_voiced_frames", enroll_voiced_frames, min_voiced_frames_chunk, 1e7);
    check_range("consistency_threshold", consistency_threshold, 0.0, 1.0);
    check_range("mixed_speaker_threshold", mixed_speaker_threshold, 0.0, 1.0);
    check_range("min_half_voiced_frames", min_half_voiced_frames, 1, 1e6);

    check_range("window_frames", window_frames, 1, 1e5);
    check_range("min_window_voiced_frames", min_window_voiced_frames, 1, window_frames);
    check_range("smoothing", smoothing, 0.0, 0.999);

    check_range("score_sigma", score_sigma, 1e-3, 1e3);
    check_range("score_center", score_center, -1.0, 1.0);
    check_range("score_slope", score_slope, 1e-3, 1e3);
    check_range("onnx_threads", onnx_threads, 1, 256);
}

std::vector<uint8_t> encode_model_params(const ModelParams& p) {
    core::ByteWriter body;
    body.put_string(p.name);
    body.put_i32(p.sample_rate);
    body.put_i32(p.frame_length);
    body.put_i32(p.min_enroll_samples);
    body.put_u32(static_cast<uint32_t>(p.backend));
    body.put_string(p.backend_model);

    const auto& f = p.features;
    body.put_i32(f.n_fft);
    body.put_i32(f.win_length);
    body.put_i32(f.hop_length);
    body.put_i32(f.n_mels);
    body.put_i32(f.n_ceps);
    body.put_f32(f.fmin);
    body.put_f32(f.fmax);
    body.put_f32(f.preemphasis);
    body.put_f32(f.energy_floor_db);
    body.put_f32(f.periodicity_threshold);
    body.put_f32(f.pitch_min_hz);
    body.put_f32(f.pitch_max_hz);

    body.put_f32(p.quality.max_clip_ratio);
    body.put_f32(p.quality.min_snr_db);
    body.put_f32(p.quality.min_speech_level_db);

    body.put_i32(p.min_voiced_frames_detect);
    body.put_i32(p.min_voiced_frames_chunk);
    body.put_i32(p.enroll_voiced_frames);
    body.put_f32(p.consistency_threshold);
    body.put_f32(p.mixed_speaker_threshold);
    body.put_i32(p.min_half_voiced_frames);

    body.put_i32(p.window_frames);
    body.put_i32(p.min_window_voiced_frames);
    body.put_f32(p.smoothing);

    body.put_f32(p.score_sigma);
    body.put_f32(p.score_center);
    body.put_f32(p.score_slope);
    body.put_i32(p.onnx_threads);

    const std::vector<uint8_t>& b = body.bytes();
    core::ByteWriter out;
    out.put_bytes(kMagic, sizeof(kMagic));
    out.put_u32(kFormatVersion);
    out.put_u32(static_cast<uint32_t>(b.size()));
    out.put_bytes(b.data(), b.size());
    out.put_u32(core::fnv1a32(b.data(), b.size()));
    return out.take();
}

ModelParams decode_model_params(const uint8_t* data, size_t size, uint32_t* model_id) {
    auto bad = [](const std::string& why) {
        core::throw_error(core::Status::InvalidArgument, "invalid model params: " + why);
    };
    if (!data) bad("no data");

    core::ByteReader header(data, size);
    char magic[4];
    uint32_t version = 0;
    uint32_t body_size = 0;
    if (!header.get_bytes(magic, sizeof(magic)) || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        bad("bad magic");
    }
    if (!header.get_u32(version)) bad("truncated header");
    if (version != kFormatVersion) bad("unsupported format version " + std::to_string(version));
    if (!header.get_u32(body_size)) bad("truncated header");
    if (body_size > kMaxBodySize || header.remaining() != static_cast<size_t>(body_size) + 4) {
        bad("size mismatch");
    }

    const uint8_t* body_data = data + header.position();
    uint32_t checksum = 0;
    core::ByteReader trailer(body_data + body_size, 4);
    trailer.get_u32(checksum);
    const uint32_t actual = core::fnv1a32(body_data, body_size);
    if (checksum != actual) bad("checksum mismatch");

    ModelParams p;
    core::ByteReader r(body_data, body_size);
    uint32_t backend = 0;
    r.get_string(p.name, 256);
    r.get_i32(p.sample_rate);
    r.get_i32(p.frame_length);
    r.get_i32(p.min_enroll_samples);
    r.get_u32(backend);
    r.get_string(p.backend_model);

    auto& f = p.features;
    r.get_i32(f.n_fft);
    r.get_i32(f.win_length);
    r.get_i32(f.hop_length);
    r.get_i32(f.n_mels);
    r.get_i32(f.n_ceps);
    r.get_f32(f.fmin);
    r.get_f32(f.fmax);
    r.get_f32(f.preemphasis);
    r.get_f32(f.energy_floor_db);
    r.get_f32(f.periodicity_threshold);
    r.get_f32(f.pitch_min_hz);
    r.get_f32(f.pitch_max_hz);

    r.get_f32(p.quality.max_clip_ratio);
    r.get_f32(p.quality.min_snr_db);
    r.get_f32(p.quality.min_speech_level_db);

    r.get_i32(p.min_voiced_frames_detect);
    r.get_i32(p.min_voiced_frames_chunk);
    r.get_i32(p.enroll_voiced_frames);
    r.get_f32(p.consistency_threshold);
    r.get_f32(p.mixed_speaker_threshold);
    r.get_i32(p.min_half_voiced_frames);

    r.get_i32(p.window_frames);
    r.get_i32(p.min_window_voiced_frames);
    r.get_f32(p.smoothing);

    r.get_f32(p.score_sigma);
    r.get_f32(p.score_center);
    r.get_f32(p.score_slope);
    r.get_i32(p.onnx_threads);

    if (r.failed()) bad("truncated body");
    if (r.remaining() != 0) bad("trailing bytes in body");

    p.backend = static_cast<BackendKind>(backend);
    f.sample_rate = p.sample_rate;
    p.validate();

    if (model_id) *model_id = actual;
    return p;
}

Model::Model(ModelParams params, uint32_t id, std::unique_ptr<IEmbeddingBackend> backend)
    : m_params(std::move(params)), m_id(id), m_backend(std::move(backend)) {}

Model::~Model() = default;

size_t Model::profile_size() const {
    return profile_size_for_dim(m_backend->dim());
}

std::shared_ptr<const Model> Model::from_params(const ModelParams& params, const std::string& base_dir,
                                                const core::Logger* log) {
    params.validate();
    std::vector<uint8_t> encoded = encode_model_params(params);
    uint32_t id = 0;
    ModelParams decoded = decode_model_params(encoded.data(), encoded.size(), &id);
    std::unique_ptr<IEmbeddingBackend> backend = make_backend(decoded, base_dir, log);
    if (log) {
        log->info("Model '%s' (id %08x, %s backend, %zu-dim embedding)", decoded.name.c_str(), id,
                  backend_kind_to_string(decoded.backend), backend->dim());
    }
    return std::shared_ptr<const Model>(new Model(std::move(decoded), id, std::move(backend)));
}

std::shared_ptr<const Model> Model::default_model() {
    static const std::shared_ptr<const Model> model = from_params(ModelParams{});
    return model;
}

std::shared_ptr<const Model> Model::load(const std::string& path, const core::Logger* log) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(path), ec);
    if (ec) canonical = fs::path(path);
    const uintmax_t size = fs::file_size(canonical, ec);
    if (ec) {
        core::throw_error(core::Status::IOError, "cannot open model file '" + path + "': " + ec.message());
    }
    auto mtime = fs::last_write_time(canonical, ec);
    if (ec) {
        core::throw_error(core::Status::IOError, "cannot stat model file '" + path + "': " + ec.message());
    }
    CacheKey key{canonical.string(), size, static_cast<int64_t>(mtime.time_since_epoch().count())};

    std::lock_guard<std::mutex> lock(g_cache_mutex);
    auto it = g_cache.find(key);
    if (it != g_cache.end()) {
        if (auto cached = it->second.lock()) {
            if (log) log->debug("Reusing loaded model '%s'", key.path.c_str());
            return cached;
        }
    }

    std::ifstream f(canonical, std::ios::binary);
    if (!f) {
        core::throw_error(core::Status::IOError, "cannot open model file '" + path + "'");
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        core::throw_error(core::Status::IOError, "cannot read model file '" + path + "'");
    }

    ModelParams params;
    try {
        params = decode_model_params(bytes.data(), bytes.size());
    } catch (const core::EagleError& e) {
        throw e.with_context("failed to load model '" + path + "'");
    }
    auto model = from_params(params, canonical.parent_path().string(), log);

    // Drop entries whose models are gone
    for (auto e = g_cache.begin(); e != g_cache.end();) {
        e = e->second.expired() ? g_cache.erase(e) : std::next(e);
    }
    g_cache[key] = model;
    return model;
}

std::shared_ptr<const Model> load_model_or_default(const std::string& path, const core::Logger* log) {
    if (path.empty()) {
        if (log) log->debug("Using the built-in model");
        return Model::default_model();
    }
    return Model::load(path, log);
}

void Model::save(const ModelParams& params, const std::string& path) {
    params.validate();
    std::vector<uint8_t> bytes = encode_model_params(params);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        core::throw_error(core::Status::IOError, "cannot create model file '" + path + "'");
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        core::throw_error(core::Status::IOError, "cannot write model file '" + path + "'");
    }
}

} // namespace eagle
