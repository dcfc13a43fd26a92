#pragma once

#include <cbor_inspector/exceptions.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cbi {

enum class cbor_error_kind {
    out_of_bounds,
    unsupported_additional_info,
    invalid_utf8,
    recursion_limit_exceeded,
    non_minimal_encoding,
    trailing_data,
};

std::string_view to_string(cbor_error_kind kind);

// Base class of everything thrown while decoding CBOR. offset() is the byte
// position in the input at which the problem was detected.
class cbor_decode_error : public std::runtime_error {
public:
    cbor_decode_error(cbor_error_kind kind, size_t offset, const std::string& message);

    COPYABLE(cbor_decode_error);
    MOVABLE(cbor_decode_error);

    cbor_error_kind kind() const { return _kind; }
    size_t offset() const { return _offset; }

private:
    cbor_error_kind _kind;
    size_t _offset;
};

#define CBOR_DECODE_ERROR(name, error_kind) \
    class name : public cbor_decode_error { \
    public: \
        name(size_t offset, const std::string& message) \
            : cbor_decode_error(error_kind, offset, message) {} \
        \
        COPYABLE(name); \
        MOVABLE(name); \
    }

CBOR_DECODE_ERROR(cbor_out_of_bounds_error, cbor_error_kind::out_of_bounds);
CBOR_DECODE_ERROR(cbor_unsupported_additional_info_error, cbor_error_kind::unsupported_additional_info);
CBOR_DECODE_ERROR(cbor_invalid_utf8_error, cbor_error_kind::invalid_utf8);
CBOR_DECODE_ERROR(cbor_recursion_limit_error, cbor_error_kind::recursion_limit_exceeded);
CBOR_DECODE_ERROR(cbor_non_minimal_encoding_error, cbor_error_kind::non_minimal_encoding);
CBOR_DECODE_ERROR(cbor_trailing_data_error, cbor_error_kind::trailing_data);

CUSTOM_EXCEPTION(cbor_bad_cast_error, "Bad CBOR type cast");

}  // namespace cbi
