#include <cassert>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>
#include "core/status.hpp"
#include "eagle/model.hpp"
#include "support/synthetic_voice.hpp"

static core::Status load_status(const std::string& path) {
    try {
        eagle::Model::load(path);
    } catch (const core::EagleError& e) {
        return e.status();
    }
    return core::Status::Success;
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

static core::Status from_params_status(const eagle::ModelParams& params) {
    try {
        eagle::Model::from_params(params);
    } catch (const core::EagleError& e) {
        return e.status();
    }
    return core::Status::Success;
}

static void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

int main() {
    auto def = eagle::Model::default_model();
    assert(def == eagle::Model::default_model());
    assert(def->params().sample_rate == 16000);
    assert(def->params().frame_length == 512);
    assert(def->params().min_enroll_samples == 16000);
    assert(def->backend().kind() == eagle::BackendKind::HandCrafted);
    assert(def->backend().dim() == 19);
    assert(def->profile_size() == 24 + 4 * 19);

    // Saved default params load as the same model id, and repeated loads share one instance
    const std::string path = testsupport::temp_path("model_test.pv");
    eagle::Model::save(eagle::ModelParams{}, path);
    auto loaded = eagle::Model::load(path);
    assert(loaded->id() == def->id());
    assert(loaded->params().name == def->params().name);
    assert(eagle::Model::load(path) == loaded);
    assert(eagle::load_model_or_default("") == def);

    // Any tuning change is a different model
    eagle::ModelParams tuned;
    tuned.score_sigma = 0.9f;
    assert(eagle::Model::from_params(tuned)->id() != def->id());

    assert(load_status(testsupport::temp_path("missing_model.pv")) == core::Status::IOError);

    const std::vector<uint8_t> good = read_file(path);
    const std::string broken = testsupport::temp_path("model_broken.pv");

    std::vector<uint8_t> flipped = good;
    flipped[good.size() / 2] ^= 0x40;
    write_file(broken, flipped);
    assert(load_status(broken) == core::Status::InvalidArgument);

    std::vector<uint8_t> truncated(good.begin(), good.begin() + good.size() - 9);
    write_file(broken + "2", truncated);
    assert(load_status(broken + "2") == core::Status::InvalidArgument);

    std::vector<uint8_t> magic = good;
    magic[0] = 'X';
    write_file(broken + "3", magic);
    assert(load_status(broken + "3") == core::Status::InvalidArgument);

    // Out of range values never reach a file
    eagle::ModelParams bad;
    bad.frame_length = 0;
    bool thrown = false;
    try {
        eagle::Model::save(bad, broken + "4");
    } catch (const core::EagleError& e) {
        thrown = e.status() == core::Status::InvalidArgument;
    }
    assert(thrown);

    // Oversized front end settings are refused before any table is built
    eagle::ModelParams huge;
    huge.features.win_length = 960000;
    huge.features.n_fft = 1 << 20;
    huge.features.n_mels = 8192;
    huge.min_enroll_samples = 960000;
    assert(from_params_status(huge) == core::Status::InvalidArgument);
    {
        eagle::ModelParams p;
        p.features.n_fft = 16384;
        assert(from_params_status(p) == core::Status::InvalidArgument);
    }
    {
        eagle::ModelParams p;
        p.features.win_length = 1024;
        assert(from_params_status(p) == core::Status::InvalidArgument);
    }
    {
        eagle::ModelParams p;
        p.features.n_mels = 1024;
        assert(from_params_status(p) == core::Status::InvalidArgument);
    }
    {
        eagle::ModelParams p;
        p.features.n_ceps = 41;
        assert(from_params_status(p) == core::Status::InvalidArgument);
    }
    // The same settings in a well-formed file fail to load the same way
    write_file(broken + "6", eagle::encode_model_params(huge));
    assert(load_status(broken + "6") == core::Status::InvalidArgument);

    eagle::ModelParams onnx;
    onnx.backend = eagle::BackendKind::NeuralOnnx;
    onnx.backend_model = "no_such_network.onnx";
    onnx.features.n_mels = 80;
    eagle::Model::save(onnx, broken + "5");
#ifdef EAGLE_HAVE_ONNXRUNTIME
    assert(load_status(broken + "5") == core::Status::IOError);
#else
    assert(load_status(broken + "5") == core::Status::InvalidArgument);
#endif

    std::remove(path.c_str());
    for (const char* suffix : {"", "2", "3", "4", "5", "6"}) {
        std::remove((broken + suffix).c_str());
    }
    return 0;
}
