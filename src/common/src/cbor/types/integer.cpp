#include "cbor_inspector/cbor/types/integer.hpp"

#include <cbor_inspector/binary_io.hpp>
#include <cbor_inspector/util.hpp>

#include <fmt/format.h>

namespace cbi {

cbor_unsigned_integer::cbor_unsigned_integer(binary_reader& reader, const cbor_parse_state& state) {
    cbor_argument argument = read_argument(reader, state.options);
    if (argument.major_type != CBOR_UNSIGNED_INTEGER) {
        throw std::runtime_error(
            fmt::format("Invalid type value {:02x} for cbor_unsigned_integer", argument.major_type)
        );
    }

    _value = argument.value;
}

std::string cbor_unsigned_integer::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_unsigned_integer::dump_debug(std::stringstream& ss) const {
    ss << _value;
}

cbor_negative_integer::cbor_negative_integer(binary_reader& reader, const cbor_parse_state& state) {
    cbor_argument argument = read_argument(reader, state.options);
    if (argument.major_type != CBOR_NEGATIVE_INTEGER) {
        throw std::runtime_error(
            fmt::format("Invalid type value {:02x} for cbor_negative_integer", argument.major_type)
        );
    }

    _raw_value = argument.value;
}

std::string cbor_negative_integer::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_negative_integer::dump_debug(std::stringstream& ss) const {
    // Go through 128 bits so that -2^64 prints correctly
    ss << int128_to_string(value());
}

}  // namespace cbi
