// Writes a model parameters file, optionally switched to an ONNX speaker embedding network
#include <cstdio>
#include <cstdlib>
#include <string>
#include "core/status.hpp"
#include "eagle/model.hpp"

static void print_usage(const char* program) {
    fprintf(stdout,
            "Usage: %s --output PATH [--onnx MODEL.onnx] [--n-mels N] [--name NAME]\n"
            "          [--frame-length N] [--min-enroll-samples N] [--enroll-seconds S]\n",
            program);
}

int main(int argc, char** argv) {
    std::string output;
    eagle::ModelParams params;
    double enroll_seconds = 0.0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--output" && i + 1 < argc) { output = argv[++i]; continue; }
        if (a == "--name" && i + 1 < argc) { params.name = argv[++i]; continue; }
        if (a == "--onnx" && i + 1 < argc) {
            params.backend = eagle::BackendKind::NeuralOnnx;
            params.backend_model = argv[++i];
            params.features.n_mels = 80;   // WeSpeaker/CAM++ exports expect 80-dim Fbank
            continue;
        }
        if (a == "--n-mels" && i + 1 < argc) { params.features.n_mels = std::atoi(argv[++i]); continue; }
        if (a == "--frame-length" && i + 1 < argc) { params.frame_length = std::atoi(argv[++i]); continue; }
        if (a == "--min-enroll-samples" && i + 1 < argc) { params.min_enroll_samples = std::atoi(argv[++i]); continue; }
        if (a == "--enroll-seconds" && i + 1 < argc) { enroll_seconds = std::atof(argv[++i]); continue; }
        if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        fprintf(stderr, "Unknown argument '%s'\n", a.c_str());
        print_usage(argv[0]);
        return 1;
    }
    if (output.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (enroll_seconds > 0.0) {
        // voiced speech needed for 100%, in analysis frames
        params.enroll_voiced_frames = static_cast<int>(enroll_seconds * params.sample_rate /
                                                       params.features.hop_length);
    }

    try {
        eagle::Model::save(params, output);
    } catch (const core::EagleError& e) {
        fprintf(stderr, "[ParamsTool] %s\n", e.what());
        return 1;
    }
    fprintf(stdout, "Wrote %s model '%s' to %s\n", eagle::backend_kind_to_string(params.backend),
            params.name.c_str(), output.c_str());
    return 0;
}
