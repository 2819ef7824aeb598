#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>
#include <stdexcept>

namespace tokbench {
namespace serialization {

/**
 * @brief Appends fixed-width big-endian integers and length-prefixed strings.
 *
 * Big-endian layout keeps the byte order of encoded integers equal to their
 * numeric order, which the store relies on for its ordered keys.
 */
class Serializer {
public:
    Serializer() = default;

    void write_uint8(uint8_t value);
    void write_uint32(uint32_t value);
    void write_uint64(uint64_t value);
    void write_string(const std::string& str);
    void write_raw(const std::string& bytes);

    std::string take_buffer();

private:
    std::string buffer_;
};

class Deserializer {
public:
    explicit Deserializer(const std::string& buffer);

    uint8_t read_uint8();
    uint32_t read_uint32();
    uint64_t read_uint64();
    std::string read_string();
    std::string read_raw(size_t size);

    bool has_more() const;

private:
    const char* data_;
    size_t size_;
    size_t offset_ = 0;

    void check_bounds(size_t size);
};

} // namespace serialization
} // namespace tokbench
