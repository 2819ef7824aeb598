#include "../include/serialization.hpp"
#include <limits>
#include <utility>

namespace tokbench {
namespace serialization {

// --- Serializer Implementation ---

void Serializer::write_uint8(uint8_t value) {
    buffer_.push_back(static_cast<char>(value));
}

void Serializer::write_uint32(uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer_.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

void Serializer::write_uint64(uint64_t value) {
    write_uint32(static_cast<uint32_t>(value >> 32));
    write_uint32(static_cast<uint32_t>(value & 0xFFFFFFFFULL));
}

void Serializer::write_string(const std::string& str) {
    if (str.length() > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("String size exceeds maximum limit for serialization.");
    }
    write_uint32(static_cast<uint32_t>(str.length()));
    buffer_.append(str);
}

void Serializer::write_raw(const std::string& bytes) {
    buffer_.append(bytes);
}

std::string Serializer::take_buffer() {
    return std::move(buffer_);
}

// --- Deserializer Implementation ---

Deserializer::Deserializer(const std::string& buffer)
    : data_(buffer.data()), size_(buffer.size()) {}

void Deserializer::check_bounds(size_t size) {
    if (size > size_ - offset_) {
        throw std::runtime_error("Deserialization error: read out of bounds.");
    }
}

uint8_t Deserializer::read_uint8() {
    check_bounds(1);
    return static_cast<uint8_t>(data_[offset_++]);
}

uint32_t Deserializer::read_uint32() {
    check_bounds(sizeof(uint32_t));
    uint32_t value = 0;
    for (size_t i = 0; i < sizeof(uint32_t); ++i) {
        value = (value << 8) | static_cast<uint8_t>(data_[offset_ + i]);
    }
    offset_ += sizeof(uint32_t);
    return value;
}

uint64_t Deserializer::read_uint64() {
    uint64_t high = read_uint32();
    uint64_t low = read_uint32();
    return (high << 32) | low;
}

std::string Deserializer::read_string() {
    uint32_t len = read_uint32();
    return read_raw(len);
}

std::string Deserializer::read_raw(size_t size) {
    check_bounds(size);
    std::string result(data_ + offset_, size);
    offset_ += size;
    return result;
}

bool Deserializer::has_more() const {
    return offset_ < size_;
}

} // namespace serialization
} // namespace tokbench
