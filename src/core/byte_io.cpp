#include "core/byte_io.hpp"
#include <cstring>

namespace core {

uint32_t fnv1a32(const uint8_t* data, size_t size, uint32_t seed) {
    uint32_t hash = seed;
    for (size_t i = 0; i < size; ++i) {
        hash ^= data[i];
        hash *= 16777619u;
    }
    return hash;
}

void ByteWriter::put_bytes(const void* data, size_t size) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    buf_.insert(buf_.end(), p, p + size);
}

void ByteWriter::put_u16(uint16_t v) {
    buf_.push_back(static_cast<uint8_t>(v & 0xff));
    buf_.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void ByteWriter::put_u32(uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void ByteWriter::put_f32(float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    put_u32(bits);
}

void ByteWriter::put_string(const std::string& s) {
    put_u32(static_cast<uint32_t>(s.size()));
    put_bytes(s.data(), s.size());
}

bool ByteReader::get_bytes(void* out, size_t size) {
    if (failed_ || size > size_ - pos_) {
        failed_ = true;
        return false;
    }
    if (size > 0) std::memcpy(out, data_ + pos_, size);
    pos_ += size;
    return true;
}

bool ByteReader::get_u16(uint16_t& v) {
    uint8_t b[2];
    if (!get_bytes(b, 2)) return false;
    v = static_cast<uint16_t>(b[0] | (b[1] << 8));
    return true;
}

bool ByteReader::get_u32(uint32_t& v) {
    uint8_t b[4];
    if (!get_bytes(b, 4)) return false;
    v = static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
        (static_cast<uint32_t>(b[2]) << 16) | (static_cast<uint32_t>(b[3]) << 24);
    return true;
}

bool ByteReader::get_i32(int32_t& v) {
    uint32_t u;
    if (!get_u32(u)) return false;
    v = static_cast<int32_t>(u);
    return true;
}

bool ByteReader::get_f32(float& v) {
    uint32_t bits;
    if (!get_u32(bits)) return false;
    std::memcpy(&v, &bits, sizeof(v));
    return true;
}

bool ByteReader::get_string(std::string& s, size_t max_length) {
    uint32_t len;
    if (!get_u32(len)) return false;
    if (len > max_length || len > size_ - pos_) {
        failed_ = true;
        return false;
    }
    s.assign(reinterpret_cast<const char*>(data_ + pos_), len);
    pos_ += len;
    return true;
}

} // namespace core
