#include "cbor_inspector/cbor/types/float.hpp"

#include "cbor_inspector/cbor/float.hpp"

#include <cbor_inspector/binary_io.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstring>

namespace cbi {

cbor_float::cbor_float(binary_reader& reader, const cbor_parse_state& state) {
    cbor_argument argument = read_argument(reader, state.options);
    if (argument.major_type != CBOR_SIMPLE_OR_FLOAT) {
        throw std::runtime_error(
            fmt::format("Invalid type value {:02x} for cbor_float", argument.major_type)
        );
    }

    switch (argument.additional_info) {
        case CBOR_VALUE_HALF_FLOAT:
            _value = decode_half_float(static_cast<uint16_t>(argument.value));
            break;
        case CBOR_VALUE_SINGLE_FLOAT:
            _value = decode_single_float(static_cast<uint32_t>(argument.value));
            break;
        case CBOR_VALUE_DOUBLE_FLOAT:
            _value = decode_double_float(argument.value);
            break;
        default:
            throw std::runtime_error(
                fmt::format("Invalid additional information value {} for cbor_float", argument.additional_info)
            );
    }
}

uint64_t cbor_float::bits() const {
    uint64_t bits;
    std::memcpy(&bits, &_value, sizeof(bits));
    return bits;
}

std::string cbor_float::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_float::dump_debug(std::stringstream& ss) const {
    if (std::isnan(_value)) {
        ss << "NaN";
    } else if (std::isinf(_value)) {
        ss << (_value < 0 ? "-Infinity" : "Infinity");
    } else {
        std::string str = fmt::format("{}", _value);

        // Keep floats visually distinct from integers
        if (str.find_first_of(".e") == std::string::npos) {
            str += ".0";
        }

        ss << str;
    }
}

}  // namespace cbi
