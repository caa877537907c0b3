#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace core {

// FNV-1a, 32 bit.
uint32_t fnv1a32(const uint8_t* data, size_t size, uint32_t seed = 2166136261u);

// Little-endian encoder used by the model and profile formats.
class ByteWriter {
public:
    void put_bytes(const void* data, size_t size);
    void put_u16(uint16_t v);
    void put_u32(uint32_t v);
    void put_i32(int32_t v) { put_u32(static_cast<uint32_t>(v)); }
    void put_f32(float v);
    void put_string(const std::string& s);  // u32 length + bytes

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

// Little-endian decoder. get_* return false once the input is exhausted;
// the reader stays failed afterwards.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool get_bytes(void* out, size_t size);
    bool get_u16(uint16_t& v);
    bool get_u32(uint32_t& v);
    bool get_i32(int32_t& v);
    bool get_f32(float& v);
    bool get_string(std::string& s, size_t max_length = 4096);

    size_t position() const { return pos_; }
    size_t remaining() const { return failed_ ? 0 : size_ - pos_; }
    bool failed() const { return failed_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
    bool failed_ = false;
};

} // namespace core
