#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV-backed audio source. Decodes the whole file to mono int16 (channels are
// averaged) and hands it out either at once or in fixed-size frames.
class FileCapture {
public:
    // Supports PCM16 and float32 WAV. Returns false with error() set on failure.
    bool open(const std::string& path);
    void close();
    bool is_open() const { return sample_rate_ > 0; }

    int sample_rate() const { return sample_rate_; }
    const std::vector<int16_t>& samples() const { return mono_; }

    // Next `frame_length` samples; the last partial frame is zero padded.
    // Empty when no more data.
    std::vector<int16_t> read_frame(size_t frame_length);
    void rewind() { cursor_ = 0; }

    // Basic file info for reporting
    int channels() const { return channels_; }
    int bits_per_sample() const { return bits_per_sample_; }
    double duration_seconds() const { return duration_seconds_; }
    const std::string& source_path() const { return source_path_; }
    const std::string& error() const { return error_; }

private:
    bool fail(const std::string& message);

    std::string source_path_;
    std::string error_;
    std::vector<int16_t> mono_; // decoded mono PCM16
    size_t cursor_ = 0;
    int sample_rate_ = 0;
    int channels_ = 0;
    int bits_per_sample_ = 0;
    double duration_seconds_ = 0.0;
};

// Mono PCM16 writer, used for fixtures and for saving captured audio.
bool write_wav_pcm16(const std::string& path, const int16_t* pcm, size_t samples, int sample_rate);

} // namespace audio
