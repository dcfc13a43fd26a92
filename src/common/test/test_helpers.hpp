#pragma once

#include <cbor_inspector/binary_io.hpp>
#include <cbor_inspector/types.hpp>

#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace cbi::test {

// Shortest-form item header for the given major type and argument
inline byte_vector encode_head(uint8_t major_type, uint64_t argument) {
    byte_vector bytes;
    uint8_t type_bits = static_cast<uint8_t>(major_type << 5);

    if (argument < 24) {
        bytes.push_back(type_bits | static_cast<uint8_t>(argument));
    } else if (argument <= 0xff) {
        bytes.push_back(type_bits | 24);
        bytes.push_back(static_cast<uint8_t>(argument));
    } else if (argument <= 0xffff) {
        bytes.push_back(type_bits | 25);
        auto be = integer_to_be_bytes(static_cast<uint16_t>(argument));
        bytes.insert(bytes.end(), be.begin(), be.end());
    } else if (argument <= 0xffffffff) {
        bytes.push_back(type_bits | 26);
        auto be = integer_to_be_bytes(static_cast<uint32_t>(argument));
        bytes.insert(bytes.end(), be.begin(), be.end());
    } else {
        bytes.push_back(type_bits | 27);
        auto be = integer_to_be_bytes(argument);
        bytes.insert(bytes.end(), be.begin(), be.end());
    }

    return bytes;
}

inline byte_vector concat(std::initializer_list<byte_vector> parts) {
    byte_vector result;
    for (auto&& part : parts) {
        result.insert(result.end(), part.begin(), part.end());
    }

    return result;
}

inline byte_vector encode_text(std::string_view str) {
    byte_vector bytes = encode_head(3, str.size());
    bytes.insert(bytes.end(), str.begin(), str.end());
    return bytes;
}

// count nested single-element arrays around a 0
inline byte_vector nested_arrays(size_t count) {
    byte_vector bytes(count, 0x81);
    bytes.push_back(0x00);
    return bytes;
}

}  // namespace cbi::test
