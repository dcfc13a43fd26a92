#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cbi {

using byte_vector = std::vector<uint8_t>;
template <size_t N> using byte_array = std::array<uint8_t, N>;
using byte_string = std::basic_string<uint8_t>;
using byte_span = std::span<const uint8_t>;

// Wide enough to hold every CBOR negative integer, down to -2^64
using int128_t = __int128;

namespace literals {

inline const uint8_t* operator "" _bytes(const char* chars, size_t size) {
    return reinterpret_cast<const uint8_t*>(chars);
}

}  // namespace literals

}  // namespace cbi
