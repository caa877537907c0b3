#include <cassert>
#include <vector>
#include "core/status.hpp"
#include "eagle/profile.hpp"

static core::Status decode_status(const eagle::Profile& p, uint32_t model_id, size_t dim) {
    try {
        eagle::decode_profile(p, model_id, dim);
    } catch (const core::EagleError& e) {
        return e.status();
    }
    return core::Status::Success;
}

int main() {
    std::vector<float> embedding{0.5f, -1.25f, 3.0f, 0.0f};
    eagle::Profile p = eagle::encode_profile(0xabcdef01u, 420, embedding);
    assert(p.size() == eagle::profile_size_for_dim(4));
    assert(p.size() == 24 + 16);

    // Bytes survive a trip through raw storage
    eagle::Profile copy = eagle::Profile::from_bytes(p.bytes().data(), p.size());
    assert(copy == p);
    eagle::Voiceprint vp = eagle::decode_profile(copy, 0xabcdef01u, 4);
    assert(vp.embedding == embedding);
    assert(vp.voiced_frames == 420);

    bool thrown = false;
    try {
        eagle::Profile::from_bytes(std::vector<uint8_t>{});
    } catch (const core::EagleError& e) {
        thrown = e.status() == core::Status::InvalidArgument;
    }
    assert(thrown);

    // from_bytes accepts anything non-empty; decoding is where it fails
    eagle::Profile junk = eagle::Profile::from_bytes(std::vector<uint8_t>(40, 0x7f));
    assert(decode_status(junk, 0xabcdef01u, 4) == core::Status::InvalidArgument);

    assert(decode_status(p, 0x12345678u, 4) == core::Status::InvalidArgument);
    assert(decode_status(p, 0xabcdef01u, 5) == core::Status::InvalidArgument);

    std::vector<uint8_t> tampered = p.bytes();
    tampered[26] ^= 0x01;
    assert(decode_status(eagle::Profile::from_bytes(tampered), 0xabcdef01u, 4) == core::Status::InvalidArgument);
    return 0;
}
