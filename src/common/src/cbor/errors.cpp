#include "cbor_inspector/cbor/errors.hpp"

namespace cbi {

std::string_view to_string(cbor_error_kind kind) {
    switch (kind) {
        case cbor_error_kind::out_of_bounds: return "out of bounds";
        case cbor_error_kind::unsupported_additional_info: return "unsupported additional information";
        case cbor_error_kind::invalid_utf8: return "invalid UTF-8";
        case cbor_error_kind::recursion_limit_exceeded: return "recursion limit exceeded";
        case cbor_error_kind::non_minimal_encoding: return "non-minimal encoding";
        case cbor_error_kind::trailing_data: return "trailing data";
    }

    return "unknown";
}

cbor_decode_error::cbor_decode_error(cbor_error_kind kind, size_t offset, const std::string& message)
    : std::runtime_error(message), _kind(kind), _offset(offset) {}

}  // namespace cbi
