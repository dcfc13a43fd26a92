#pragma once

#include <cbor_inspector/types.hpp>

#include <cstdint>
#include <string>

namespace cbi {

std::string base64_encode(const uint8_t* buffer, size_t length);
std::string base64url_encode(const uint8_t* buffer, size_t length);

inline std::string base64url_encode(byte_span buffer) {
    return base64url_encode(buffer.data(), buffer.size());
}

}  // namespace cbi
