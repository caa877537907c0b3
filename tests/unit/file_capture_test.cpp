#include <cassert>
#include <cstdio>
#include <fstream>
#include <vector>
#include "audio/file_capture.hpp"
#include "support/synthetic_voice.hpp"

int main() {
    const std::string path = testsupport::temp_path("file_capture.wav");
    std::vector<int16_t> pcm = testsupport::voice_pcm(testsupport::speaker_a(), 0.5, 3);
    assert(audio::write_wav_pcm16(path, pcm.data(), pcm.size(), 16000));

    audio::FileCapture cap;
    assert(cap.open(path));
    assert(cap.sample_rate() == 16000);
    assert(cap.channels() == 1);
    assert(cap.bits_per_sample() == 16);
    assert(cap.samples() == pcm);
    assert(cap.duration_seconds() > 0.49 && cap.duration_seconds() < 0.51);

    // 8000 samples = 15 full frames of 512 plus a zero padded one
    size_t frames = 0;
    std::vector<int16_t> last;
    for (auto f = cap.read_frame(512); !f.empty(); f = cap.read_frame(512)) {
        assert(f.size() == 512);
        last = f;
        frames++;
    }
    assert(frames == 16);
    assert(last[8000 - 15 * 512] == 0);
    cap.rewind();
    assert(cap.read_frame(512).size() == 512);

    assert(!cap.open(testsupport::temp_path("does_not_exist.wav")));
    assert(!cap.error().empty());
    assert(!cap.is_open());

    const std::string junk = testsupport::temp_path("junk.wav");
    {
        std::ofstream f(junk, std::ios::binary);
        f << "this is not a wav file at all";
    }
    assert(!cap.open(junk));

    std::remove(path.c_str());
    std::remove(junk.c_str());
    return 0;
}
