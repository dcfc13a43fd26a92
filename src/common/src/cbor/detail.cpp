#include "cbor_inspector/cbor/detail.hpp"

#include "cbor_inspector/cbor/errors.hpp"

#include <cbor_inspector/binary_io.hpp>

#include <fmt/format.h>

namespace cbi {

namespace {

// Smallest argument that needs the given additional information value
uint64_t minimal_argument_for(uint8_t additional_info) {
    switch (additional_info) {
        case CBOR_ARGUMENT_UINT8: return 24;
        case CBOR_ARGUMENT_UINT16: return 0x100;
        case CBOR_ARGUMENT_UINT32: return 0x10000;
        case CBOR_ARGUMENT_UINT64: return 0x100000000;
        default: return 0;
    }
}

}  // namespace

cbor_argument read_argument(binary_reader& reader, const decode_options& options) {
    size_t header_offset = reader.index();
    uint8_t initial_byte = reader.peek_uint8_t();

    cbor_argument argument{
        static_cast<uint8_t>(initial_byte >> 5),
        static_cast<uint8_t>(initial_byte & 0x1f),
        0
    };

    if (argument.additional_info < CBOR_ARGUMENT_UINT8) {
        reader.skip(1);
        argument.value = argument.additional_info;
        return argument;
    }

    if (argument.additional_info == CBOR_INDEFINITE_LENGTH) {
        throw cbor_unsupported_additional_info_error(
            header_offset,
            fmt::format(
                "Indefinite-length items are not supported (initial_byte = 0x{:02x} at offset {})",
                initial_byte, header_offset
            )
        );
    }

    if (argument.additional_info > CBOR_ARGUMENT_UINT64) {
        throw cbor_unsupported_additional_info_error(
            header_offset,
            fmt::format(
                "Reserved additional information value {} (initial_byte = 0x{:02x} at offset {})",
                argument.additional_info, initial_byte, header_offset
            )
        );
    }

    // Make sure the whole argument is present before consuming anything
    size_t argument_size = size_t{1} << (argument.additional_info - CBOR_ARGUMENT_UINT8);
    if (reader.bytes_remaining() < 1 + argument_size) {
        throw cbor_out_of_bounds_error(
            header_offset,
            fmt::format(
                "Item at offset {} needs {} bytes of argument but only {} bytes are left to read",
                header_offset, argument_size, reader.bytes_remaining() - 1
            )
        );
    }

    reader.skip(1);

    switch (argument.additional_info) {
        case CBOR_ARGUMENT_UINT8: argument.value = reader.read_uint8_t(); break;
        case CBOR_ARGUMENT_UINT16: argument.value = reader.read_be_uint16_t(); break;
        case CBOR_ARGUMENT_UINT32: argument.value = reader.read_be_uint32_t(); break;
        case CBOR_ARGUMENT_UINT64: argument.value = reader.read_be_uint64_t(); break;
    }

    // Major type 7 uses these widths for float bit patterns, not integers
    if (options.require_minimal_encoding &&
            argument.major_type != CBOR_SIMPLE_OR_FLOAT &&
            argument.value < minimal_argument_for(argument.additional_info)) {
        throw cbor_non_minimal_encoding_error(
            header_offset,
            fmt::format(
                "Argument {} at offset {} is encoded in {} bytes, more than necessary",
                argument.value, header_offset, argument_size
            )
        );
    }

    return argument;
}

namespace detail {

void ensure_items_can_fit(
    const binary_reader& reader,
    size_t header_offset,
    uint64_t num_items,
    size_t min_item_size
) {
    if (num_items > reader.bytes_remaining() / min_item_size) {
        throw cbor_out_of_bounds_error(
            header_offset,
            fmt::format(
                "Item at offset {} declares {} nested items but only {} bytes are left to read",
                header_offset, num_items, reader.bytes_remaining()
            )
        );
    }
}

}  // namespace detail

}  // namespace cbi
