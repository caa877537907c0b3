#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace eagle {

/**
 * Exported voiceprint of one enrolled speaker.
 * Opaque bytes with a fixed size for a given model. Building a Profile from
 * bytes does not validate them; Eagle does that when it loads the Profile.
 */
class Profile {
public:
    Profile() = default;

    // Throws core::EagleError(InvalidArgument) for empty input.
    static Profile from_bytes(const std::vector<uint8_t>& bytes);
    static Profile from_bytes(const uint8_t* data, size_t size);

    const std::vector<uint8_t>& bytes() const { return m_bytes; }
    size_t size() const { return m_bytes.size(); }
    bool empty() const { return m_bytes.empty(); }

    bool operator==(const Profile& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const Profile& other) const { return !(*this == other); }

private:
    explicit Profile(std::vector<uint8_t> bytes) : m_bytes(std::move(bytes)) {}
    friend Profile encode_profile(uint32_t, uint32_t, const std::vector<float>&);

    std::vector<uint8_t> m_bytes;
};

// Decoded profile contents.
struct Voiceprint {
    uint32_t model_id = 0;
    uint32_t voiced_frames = 0;
    std::vector<float> embedding;
};

// "EGLP", u16 version, u16 reserved, u32 model id, u32 dim, u32 voiced frames,
// dim x f32, u32 FNV-1a of everything before it.
size_t profile_size_for_dim(size_t dim);

Profile encode_profile(uint32_t model_id, uint32_t voiced_frames, const std::vector<float>& embedding);

// Throws core::EagleError(InvalidArgument) when the bytes are malformed or were
// made for another model.
Voiceprint decode_profile(const Profile& profile, uint32_t expected_model_id, size_t expected_dim);

} // namespace eagle
