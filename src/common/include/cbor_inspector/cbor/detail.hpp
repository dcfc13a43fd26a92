#pragma once

#include <cbor_inspector/cbor/decode_options.hpp>

#include <cstddef>
#include <cstdint>

namespace cbi {

constexpr const uint8_t CBOR_UNSIGNED_INTEGER = 0;
constexpr const uint8_t CBOR_NEGATIVE_INTEGER = 1;
constexpr const uint8_t CBOR_BYTE_STRING = 2;
constexpr const uint8_t CBOR_TEXT_STRING = 3;
constexpr const uint8_t CBOR_ARRAY = 4;
constexpr const uint8_t CBOR_MAP = 5;
constexpr const uint8_t CBOR_TAG = 6;
constexpr const uint8_t CBOR_SIMPLE_OR_FLOAT = 7;

// Additional information values with a special meaning
constexpr const uint8_t CBOR_ARGUMENT_UINT8 = 24;
constexpr const uint8_t CBOR_ARGUMENT_UINT16 = 25;
constexpr const uint8_t CBOR_ARGUMENT_UINT32 = 26;
constexpr const uint8_t CBOR_ARGUMENT_UINT64 = 27;
constexpr const uint8_t CBOR_INDEFINITE_LENGTH = 31;

// Additional information values of major type 7
constexpr const uint8_t CBOR_VALUE_FALSE = 20;
constexpr const uint8_t CBOR_VALUE_TRUE = 21;
constexpr const uint8_t CBOR_VALUE_NULL = 22;
constexpr const uint8_t CBOR_VALUE_UNDEFINED = 23;
constexpr const uint8_t CBOR_VALUE_SIMPLE_EXTENDED = CBOR_ARGUMENT_UINT8;
constexpr const uint8_t CBOR_VALUE_HALF_FLOAT = CBOR_ARGUMENT_UINT16;
constexpr const uint8_t CBOR_VALUE_SINGLE_FLOAT = CBOR_ARGUMENT_UINT32;
constexpr const uint8_t CBOR_VALUE_DOUBLE_FLOAT = CBOR_ARGUMENT_UINT64;

class binary_reader;
class cbor_value;

// A decoded item header: the major type, the raw additional information
// bits and the argument they resolve to.
struct cbor_argument {
    uint8_t major_type;
    uint8_t additional_info;
    uint64_t value;
};

// Consumes the header byte at the reader's position plus the 0-8 bytes of
// argument that follow it.
cbor_argument read_argument(binary_reader& reader, const decode_options& options = {});

// Where a nested decode is happening: the caller's options and how many
// containers enclose the item about to be decoded.
struct cbor_parse_state {
    const decode_options& options;
    size_t depth;

    cbor_parse_state nested() const { return cbor_parse_state{options, depth + 1}; }
};

namespace detail {

cbor_value parse_cbor_item(binary_reader& reader, const cbor_parse_state& state);

// Throws cbor_out_of_bounds_error unless at least num_items * min_item_size
// bytes remain, so that a forged count cannot trigger a huge allocation
void ensure_items_can_fit(
    const binary_reader& reader,
    size_t header_offset,
    uint64_t num_items,
    size_t min_item_size
);

}  // namespace detail

}  // namespace cbi
