#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace cbi {

// Stand-in for a major type 7 item whose encoding is reserved or unassigned.
// Only produced when decode_options::reserved_simple_values_as_invalid is
// set.
class cbor_invalid {
public:
    constexpr cbor_invalid(uint8_t initial_byte, uint8_t simple_value)
        : _initial_byte(initial_byte), _simple_value(simple_value) {}

    constexpr uint8_t initial_byte() const { return _initial_byte; }

    // The simple value number: the additional information bits, or the
    // following byte for the one-byte extended form
    constexpr uint8_t simple_value() const { return _simple_value; }

    bool operator==(const cbor_invalid& rhs) const {
        return _initial_byte == rhs._initial_byte && _simple_value == rhs._simple_value;
    }

    bool operator<(const cbor_invalid& rhs) const {
        return _initial_byte == rhs._initial_byte
            ? _simple_value < rhs._simple_value
            : _initial_byte < rhs._initial_byte;
    }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    uint8_t _initial_byte;
    uint8_t _simple_value;
};

}  // namespace cbi
