#pragma once

#include <cbor_inspector/cbor/decode_options.hpp>
#include <cbor_inspector/cbor/types/value.hpp>

#include <cbor_inspector/binary_io.hpp>
#include <cbor_inspector/types.hpp>

#include <type_traits>
#include <vector>

namespace cbi {

// Decodes the single top-level item at the reader's position and leaves the
// reader just past it.
cbor_value parse_cbor_item(binary_reader& reader, const decode_options& options = {});

// Decodes every top-level item in the buffer, in order. Throws if any of
// them fails; nothing is returned for the items before the failure.
std::vector<cbor_value> parse_cbor_sequence(byte_span bytes, const decode_options& options = {});

// Decodes a buffer that must hold exactly one item. Trailing bytes after
// the item are reported with cbor_trailing_data_error.
cbor_value parse_cbor_value(byte_span bytes, const decode_options& options = {});

template <typename T = cbor_value>
T parse_cbor(byte_span bytes, const decode_options& options = {}) {
    cbor_value value = parse_cbor_value(bytes, options);
    if constexpr (std::is_same_v<T, cbor_value>) {
        return value;
    } else {
        return value.get<T>();
    }
}

template <typename T = cbor_value>
T parse_cbor(binary_reader& reader, const decode_options& options = {}) {
    cbor_value value = parse_cbor_item(reader, options);
    if constexpr (std::is_same_v<T, cbor_value>) {
        return value;
    } else {
        return value.get<T>();
    }
}

// Renders every top-level item with dump_debug(), as "[item, item, ...]"
std::string dump_debug(const std::vector<cbor_value>& values);

}  // namespace cbi
