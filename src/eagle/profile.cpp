#include "eagle/profile.hpp"
#include "core/byte_io.hpp"
#include "core/status.hpp"
#include <cmath>
#include <cstring>
#include <cstdio>
#include <string>

namespace eagle {

namespace {
constexpr char kMagic[4] = {'E', 'G', 'L', 'P'};
constexpr uint16_t kFormatVersion = 1;
constexpr size_t kHeaderSize = 4 + 2 + 2 + 4 + 4 + 4;
constexpr size_t kTrailerSize = 4;

std::string hex32(uint32_t v) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%08x", v);
    return buf;
}
} // namespace

Profile Profile::from_bytes(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        core::throw_error(core::Status::InvalidArgument, "profile bytes are empty");
    }
    return Profile(bytes);
}

Profile Profile::from_bytes(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        core::throw_error(core::Status::InvalidArgument, "profile bytes are empty");
    }
    return Profile(std::vector<uint8_t>(data, data + size));
}

size_t profile_size_for_dim(size_t dim) {
    return kHeaderSize + dim * sizeof(float) + kTrailerSize;
}

Profile encode_profile(uint32_t model_id, uint32_t voiced_frames, const std::vector<float>& embedding) {
    core::ByteWriter w;
    w.put_bytes(kMagic, sizeof(kMagic));
    w.put_u16(kFormatVersion);
    w.put_u16(0);
    w.put_u32(model_id);
    w.put_u32(static_cast<uint32_t>(embedding.size()));
    w.put_u32(voiced_frames);
    for (float v : embedding) {
        w.put_f32(v);
    }
    w.put_u32(core::fnv1a32(w.bytes().data(), w.bytes().size()));
    return Profile(w.take());
}

Voiceprint decode_profile(const Profile& profile, uint32_t expected_model_id, size_t expected_dim) {
    auto bad = [](const std::string& why) {
        core::throw_error(core::Status::InvalidArgument, "invalid speaker profile: " + why);
    };
    const std::vector<uint8_t>& bytes = profile.bytes();
    if (bytes.size() != profile_size_for_dim(expected_dim)) {
        bad("expected " + std::to_string(profile_size_for_dim(expected_dim)) + " bytes, got " +
            std::to_string(bytes.size()));
    }

    const size_t body = bytes.size() - kTrailerSize;
    core::ByteReader trailer(bytes.data() + body, kTrailerSize);
    uint32_t checksum = 0;
    trailer.get_u32(checksum);
    if (checksum != core::fnv1a32(bytes.data(), body)) bad("checksum mismatch");

    core::ByteReader r(bytes.data(), body);
    char magic[4];
    uint16_t version = 0;
    uint16_t reserved = 0;
    uint32_t dim = 0;
    Voiceprint vp;
    r.get_bytes(magic, sizeof(magic));
    r.get_u16(version);
    r.get_u16(reserved);
    r.get_u32(vp.model_id);
    r.get_u32(dim);
    r.get_u32(vp.voiced_frames);
    if (r.failed() || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) bad("bad magic");
    if (version != kFormatVersion) bad("unsupported version " + std::to_string(version));
    if (dim != expected_dim) bad("dimension " + std::to_string(dim) + " does not match the model");
    if (vp.model_id != expected_model_id) {
        bad("made for model " + hex32(vp.model_id) + ", engine uses model " + hex32(expected_model_id));
    }
    if (vp.voiced_frames == 0) bad("profile holds no speech");

    vp.embedding.resize(dim);
    for (uint32_t i = 0; i < dim; ++i) {
        r.get_f32(vp.embedding[i]);
        if (!std::isfinite(vp.embedding[i])) bad("non-finite embedding value");
    }
    if (r.failed()) bad("truncated");
    return vp;
}

} // namespace eagle
