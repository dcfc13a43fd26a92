#include "cbor_inspector/cbor/types/simple.hpp"

#include "cbor_inspector/cbor/errors.hpp"

#include <cbor_inspector/binary_io.hpp>

#include <fmt/format.h>

namespace cbi {

std::string_view to_string(cbor_simple_value value) {
    switch (value) {
        case cbor_simple_value::false_value: return "false";
        case cbor_simple_value::true_value: return "true";
        case cbor_simple_value::null_value: return "null";
        case cbor_simple_value::undefined_value: return "undefined";
    }

    return "unknown";
}

cbor_simple::cbor_simple(binary_reader& reader, const cbor_parse_state& state) {
    uint8_t initial_byte = reader.peek_uint8_t();
    uint8_t type = initial_byte >> 5;
    uint8_t additional_info = initial_byte & 0x1f;

    if (type != CBOR_SIMPLE_OR_FLOAT ||
            additional_info < CBOR_VALUE_FALSE ||
            additional_info > CBOR_VALUE_UNDEFINED) {
        throw std::runtime_error(
            fmt::format("Invalid initial byte 0x{:02x} for cbor_simple", initial_byte)
        );
    }

    reader.skip(1);  // Consume the value
    _value = static_cast<cbor_simple_value>(additional_info);
}

bool cbor_simple::as_bool() const {
    if (!is_bool()) {
        throw cbor_bad_cast_error(fmt::format("CBOR simple value {} is not a boolean", to_string(_value)));
    }

    return _value == cbor_simple_value::true_value;
}

std::string cbor_simple::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_simple::dump_debug(std::stringstream& ss) const {
    ss << to_string(_value);
}

}  // namespace cbi
