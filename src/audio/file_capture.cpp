#include "audio/file_capture.hpp"
#include <fstream>
#include <cstring>
#include <algorithm>
#include <cmath>

namespace audio {

namespace {
#pragma pack(push, 1)
struct RiffHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
};

struct ChunkHeader {
    char id[4];
    uint32_t size;
};

struct FmtChunk {
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};
#pragma pack(pop)
} // namespace

bool FileCapture::fail(const std::string& message) {
    close();
    error_ = message;
    return false;
}

bool FileCapture::open(const std::string& path) {
    close();
    error_.clear();

    std::ifstream f(path, std::ios::binary);
    if (!f) return fail("cannot open " + path);
    RiffHeader riff{};
    if (!f.read(reinterpret_cast<char*>(&riff), sizeof(riff))) return fail("truncated RIFF header");
    if (std::strncmp(riff.riff, "RIFF", 4) != 0 || std::strncmp(riff.wave, "WAVE", 4) != 0) {
        return fail("not a RIFF/WAVE file");
    }

    FmtChunk fmt{};
    bool have_fmt = false;
    uint32_t data_size = 0;
    bool have_data = false;
    ChunkHeader chunk{};
    while (f.read(reinterpret_cast<char*>(&chunk), sizeof(chunk))) {
        if (std::strncmp(chunk.id, "fmt ", 4) == 0) {
            if (chunk.size < sizeof(FmtChunk)) return fail("fmt chunk too small");
            if (!f.read(reinterpret_cast<char*>(&fmt), sizeof(fmt))) return fail("truncated fmt chunk");
            f.seekg(chunk.size - sizeof(FmtChunk) + (chunk.size & 1), std::ios::cur);
            have_fmt = true;
        } else if (std::strncmp(chunk.id, "data", 4) == 0) {
            data_size = chunk.size;
            have_data = true;
            break;
        } else {
            // chunks are word aligned
            f.seekg(chunk.size + (chunk.size & 1), std::ios::cur);
        }
    }
    if (!have_fmt) return fail("missing fmt chunk");
    if (!have_data) return fail("missing data chunk");
    if (fmt.numChannels == 0 || fmt.sampleRate == 0) return fail("invalid fmt chunk");

    const size_t bytesPerSample = fmt.bitsPerSample / 8;
    if (bytesPerSample == 0) return fail("invalid bits per sample");
    const size_t frameCount = data_size / (bytesPerSample * fmt.numChannels);
    const size_t valueCount = frameCount * fmt.numChannels;

    std::vector<int16_t> mono(frameCount);
    if (fmt.audioFormat == 1 && fmt.bitsPerSample == 16) {
        std::vector<int16_t> buf(valueCount);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(int16_t))) {
            return fail("truncated data chunk");
        }
        for (size_t i = 0; i < frameCount; ++i) {
            int sum = 0;
            for (uint16_t c = 0; c < fmt.numChannels; ++c) {
                sum += buf[i * fmt.numChannels + c];
            }
            mono[i] = static_cast<int16_t>(sum / fmt.numChannels);
        }
    } else if (fmt.audioFormat == 3 && fmt.bitsPerSample == 32) {
        std::vector<float> buf(valueCount);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(float))) {
            return fail("truncated data chunk");
        }
        for (size_t i = 0; i < frameCount; ++i) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < fmt.numChannels; ++c) {
                sum += buf[i * fmt.numChannels + c];
            }
            float v = std::clamp(sum / static_cast<float>(fmt.numChannels), -1.0f, 1.0f);
            mono[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
        }
    } else {
        return fail("unsupported format " + std::to_string(fmt.audioFormat) + " / " +
                    std::to_string(fmt.bitsPerSample) + " bits");
    }

    mono_ = std::move(mono);
    sample_rate_ = static_cast<int>(fmt.sampleRate);
    channels_ = fmt.numChannels;
    bits_per_sample_ = fmt.bitsPerSample;
    duration_seconds_ = static_cast<double>(frameCount) / fmt.sampleRate;
    source_path_ = path;
    return true;
}

void FileCapture::close() {
    source_path_.clear();
    mono_.clear();
    cursor_ = 0;
    sample_rate_ = 0;
    channels_ = 0;
    bits_per_sample_ = 0;
    duration_seconds_ = 0.0;
}

std::vector<int16_t> FileCapture::read_frame(size_t frame_length) {
    std::vector<int16_t> out;
    if (!is_open() || frame_length == 0 || cursor_ >= mono_.size()) return out;
    size_t n = std::min(frame_length, mono_.size() - cursor_);
    out.assign(mono_.begin() + cursor_, mono_.begin() + cursor_ + n);
    out.resize(frame_length, 0);
    cursor_ += n;
    return out;
}

bool write_wav_pcm16(const std::string& path, const int16_t* pcm, size_t samples, int sample_rate) {
    if (sample_rate <= 0 || (!pcm && samples > 0)) return false;
    std::ofstream f(path, std::ios::binary);
    if (!f) return false;

    const uint32_t data_bytes = static_cast<uint32_t>(samples * sizeof(int16_t));
    RiffHeader riff{};
    std::memcpy(riff.riff, "RIFF", 4);
    std::memcpy(riff.wave, "WAVE", 4);
    riff.chunkSize = 4 + sizeof(ChunkHeader) + sizeof(FmtChunk) + sizeof(ChunkHeader) + data_bytes;

    ChunkHeader fmt_hdr{};
    std::memcpy(fmt_hdr.id, "fmt ", 4);
    fmt_hdr.size = sizeof(FmtChunk);
    FmtChunk fmt{};
    fmt.audioFormat = 1;
    fmt.numChannels = 1;
    fmt.sampleRate = static_cast<uint32_t>(sample_rate);
    fmt.bitsPerSample = 16;
    fmt.blockAlign = 2;
    fmt.byteRate = fmt.sampleRate * fmt.blockAlign;

    ChunkHeader data_hdr{};
    std::memcpy(data_hdr.id, "data", 4);
    data_hdr.size = data_bytes;

    f.write(reinterpret_cast<const char*>(&riff), sizeof(riff));
    f.write(reinterpret_cast<const char*>(&fmt_hdr), sizeof(fmt_hdr));
    f.write(reinterpret_cast<const char*>(&fmt), sizeof(fmt));
    f.write(reinterpret_cast<const char*>(&data_hdr), sizeof(data_hdr));
    if (samples > 0) f.write(reinterpret_cast<const char*>(pcm), data_bytes);
    return static_cast<bool>(f);
}

} // namespace audio
