// File demo: enroll a speaker from WAV files, or score WAV files against a stored profile
#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>
#include <string>
#include <chrono>
#include <cstdio>
#include "audio/file_capture.hpp"
#include "core/config.hpp"
#include "core/status.hpp"
#include "eagle/eagle.hpp"
#include "eagle/profiler.hpp"
#include "eagle/version.hpp"

namespace {

void print_usage(const char* program) {
    fprintf(stdout,
            "Usage: %s --access_key KEY [--model_path PATH] (--enroll OUTPUT_PROFILE | --test INPUT_PROFILE) WAV...\n"
            "  --enroll   enroll a speaker from the WAV files and write the profile\n"
            "  --test     score the WAV files against the profile, one score per frame\n"
            "Environment: EAGLE_LOG_LEVEL=debug|info|warning|error|off\n",
            program);
}

void print_error(const char* what, const core::EagleError& e) {
    fprintf(stderr, "%s: %s\n", what, core::status_to_string(e.status()));
    fprintf(stderr, "  [0] %s\n", e.message().c_str());
    const auto& stack = e.message_stack();
    for (size_t i = 0; i < stack.size(); ++i) {
        fprintf(stderr, "  [%zu] %s\n", i + 1, stack[i].c_str());
    }
}

bool open_wav(audio::FileCapture& cap, const std::string& path, int sample_rate) {
    if (!cap.open(path)) {
        fprintf(stderr, "Failed to open wav file at '%s': %s\n", path.c_str(), cap.error().c_str());
        return false;
    }
    if (cap.sample_rate() != sample_rate) {
        fprintf(stderr, "'%s': audio sample rate should be %d, got %d\n", path.c_str(), sample_rate,
                cap.sample_rate());
        return false;
    }
    if (cap.channels() != 1) {
        fprintf(stderr, "'%s': %d channels, mixing down to mono\n", path.c_str(), cap.channels());
    }
    return true;
}

int run_enroll(const std::string& access_key, const std::string& model_path, const std::string& output,
               const std::vector<std::string>& wavs, const core::Config& config) {
    eagle::EagleProfiler profiler(access_key, model_path, config);

    double audio_seconds = 0.0;
    double proc_seconds = 0.0;
    float percentage = 0.0f;
    for (const auto& wav : wavs) {
        audio::FileCapture cap;
        if (!open_wav(cap, wav, profiler.sample_rate())) return 1;
        if (cap.samples().size() < profiler.min_enroll_samples()) {
            fprintf(stderr, "'%s' is too short: %zu samples, at least %zu required\n", wav.c_str(),
                    cap.samples().size(), profiler.min_enroll_samples());
            continue;
        }
        auto t0 = std::chrono::steady_clock::now();
        eagle::EnrollResult r = profiler.enroll(cap.samples());
        proc_seconds += std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        audio_seconds += cap.duration_seconds();
        percentage = r.percentage;
        fprintf(stdout, "Enrolled audio file %s [Enrollment percentage: %.2f%% - Enrollment feedback: %s]\n",
                wav.c_str(), r.percentage, eagle::enroll_feedback_to_string(r.feedback));
    }
    if (audio_seconds > 0.0) {
        fprintf(stdout, "real time factor : %.3f\n\n", proc_seconds / audio_seconds);
    }

    if (percentage < 100.0f) {
        fprintf(stderr, "Failed to create speaker profile. Insufficient enrollment percentage: %.2f%%. "
                        "Please add more audio files for enrollment.\n", percentage);
        return 1;
    }

    eagle::Profile profile = profiler.export_profile();
    std::ofstream out(output, std::ios::binary);
    out.write(reinterpret_cast<const char*>(profile.bytes().data()), static_cast<std::streamsize>(profile.size()));
    if (!out) {
        fprintf(stderr, "Failed to open '%s' for writing\n", output.c_str());
        return 1;
    }
    fprintf(stdout, "Speaker profile is written to '%s'\n", output.c_str());
    return 0;
}

int run_test(const std::string& access_key, const std::string& model_path, const std::string& input,
             const std::vector<std::string>& wavs, const core::Config& config) {
    std::ifstream in(input, std::ios::binary);
    if (!in) {
        fprintf(stderr, "Failed to open speaker profile file at '%s'.\n", input.c_str());
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        fprintf(stderr, "Failed to read speaker profile from '%s'.\n", input.c_str());
        return 1;
    }

    eagle::Eagle engine(access_key, model_path, {eagle::Profile::from_bytes(bytes)}, config);
    const size_t frame_length = static_cast<size_t>(engine.frame_length());

    double audio_seconds = 0.0;
    double proc_seconds = 0.0;
    for (const auto& wav : wavs) {
        audio::FileCapture cap;
        if (!open_wav(cap, wav, engine.sample_rate())) return 1;
        fprintf(stdout, "audio file: %s\n", wav.c_str());
        engine.reset();
        for (auto frame = cap.read_frame(frame_length); !frame.empty(); frame = cap.read_frame(frame_length)) {
            auto t0 = std::chrono::steady_clock::now();
            std::vector<float> scores = engine.process(frame);
            proc_seconds += std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
            fprintf(stdout, "score: %.2f\n", scores[0]);
        }
        audio_seconds += cap.duration_seconds();
    }
    if (audio_seconds > 0.0) {
        fprintf(stdout, "real time factor : %.3f\n", proc_seconds / audio_seconds);
    }
    fprintf(stdout, "\n");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string access_key;
    std::string model_path;
    std::string enroll_output;
    std::string test_input;
    std::vector<std::string> wavs;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--access_key" || a == "-a") && i + 1 < argc) { access_key = argv[++i]; continue; }
        if ((a == "--model_path" || a == "-m") && i + 1 < argc) { model_path = argv[++i]; continue; }
        if ((a == "--enroll" || a == "-e") && i + 1 < argc) { enroll_output = argv[++i]; continue; }
        if ((a == "--test" || a == "-t") && i + 1 < argc) { test_input = argv[++i]; continue; }
        if (a == "--version") { fprintf(stdout, "Eagle %s\n", eagle::version()); return 0; }
        if (a == "--help" || a == "-h") { print_usage(argv[0]); return 0; }
        if (!a.empty() && a[0] == '-') {
            fprintf(stderr, "Unknown option '%s'\n", a.c_str());
            print_usage(argv[0]);
            return 1;
        }
        wavs.push_back(a);
    }

    if (access_key.empty() || wavs.empty() || enroll_output.empty() == test_input.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    core::Config config = core::Config::from_env();
    try {
        if (!enroll_output.empty()) {
            return run_enroll(access_key, model_path, enroll_output, wavs, config);
        }
        return run_test(access_key, model_path, test_input, wavs, config);
    } catch (const core::EagleError& e) {
        print_error("Eagle failed", e);
        return 1;
    }
}
