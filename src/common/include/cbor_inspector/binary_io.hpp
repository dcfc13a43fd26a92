#pragma once

#include <cbor_inspector/cbor/errors.hpp>
#include <cbor_inspector/types.hpp>
#include <cbor_inspector/util.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <type_traits>

namespace cbi {

// Big-endian encoding of an integer, most significant byte first
template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
byte_array<sizeof(T)> integer_to_be_bytes(T value) {
    byte_array<sizeof(T)> bytes;
    for (size_t i = 0; i < sizeof(T); i++) {
        bytes[sizeof(T) - i - 1] = static_cast<uint8_t>(value >> (i * 8));
    }

    return bytes;
}

template <typename T, std::enable_if_t<std::is_integral_v<T>, int> = 0>
T be_bytes_to_integer(const uint8_t* buffer) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        value = static_cast<T>((value << 8) | buffer[i]);
    }

    return value;
}

// Bounds-checked cursor over a byte buffer the caller keeps alive. The
// position only ever moves forward and never passes the end of the buffer;
// every read that would go past the end throws cbor_out_of_bounds_error
// without consuming anything.
class binary_reader {
public:
    explicit binary_reader(byte_span buffer) : _buffer(buffer) {}

    binary_reader(const byte_vector& buffer) : _buffer(buffer.data(), buffer.size()) {}

    template <size_t N>
    binary_reader(const byte_array<N>& buffer) : _buffer(buffer.data(), buffer.size()) {}

    binary_reader(const uint8_t* buffer, size_t length) : _buffer(buffer, length) {}

    NON_COPYABLE(binary_reader);
    MOVABLE(binary_reader);

    size_t index() const { return _pos; }
    size_t length() const { return _buffer.size(); }
    size_t bytes_remaining() const { return _buffer.size() - _pos; }
    bool at_end() const { return _pos == _buffer.size(); }

    void skip(size_t num_bytes) {
        _ensure_bytes_available(num_bytes);
        _pos += num_bytes;
    }

    // The returned span aliases the underlying buffer
    byte_span read_span(size_t num_bytes) {
        _ensure_bytes_available(num_bytes);

        byte_span result = _buffer.subspan(_pos, num_bytes);
        _pos += num_bytes;
        return result;
    }

    std::vector<uint8_t> read_vector(size_t num_bytes) {
        byte_span span = read_span(num_bytes);
        return std::vector<uint8_t>(span.begin(), span.end());
    }

    void read_into(uint8_t* dest, size_t num_bytes) {
        _ensure_bytes_available(num_bytes);

        std::memcpy(dest, _buffer.data() + _pos, num_bytes);
        _pos += num_bytes;
    }

    uint8_t read_uint8_t() {
        uint8_t value;
        read_into(&value, 1);
        return value;
    }

    uint8_t peek_uint8_t() const {
        _ensure_bytes_available(1);
        return _buffer[_pos];
    }

    uint16_t read_be_uint16_t() { return _read_be_primitive<uint16_t>(); }
    uint32_t read_be_uint32_t() { return _read_be_primitive<uint32_t>(); }
    uint64_t read_be_uint64_t() { return _read_be_primitive<uint64_t>(); }

private:
    byte_span _buffer;
    size_t _pos{0};

    void _ensure_bytes_available(size_t num_bytes) const {
        if (num_bytes > bytes_remaining()) {
            throw cbor_out_of_bounds_error(
                _pos,
                fmt::format(
                    "Cannot read {} bytes at offset {} because only {} bytes are left to read",
                    num_bytes, _pos, bytes_remaining()
                )
            );
        }
    }

    template <typename T>
    T _read_be_primitive() {
        std::array<uint8_t, sizeof(T)> buffer;
        read_into(buffer.data(), buffer.size());
        return be_bytes_to_integer<T>(buffer.data());
    }
};

}  // namespace cbi
