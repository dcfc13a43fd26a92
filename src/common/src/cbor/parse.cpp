#include "cbor_inspector/cbor/parse.hpp"

#include "cbor_inspector/cbor/detail.hpp"
#include "cbor_inspector/cbor/errors.hpp"
#include "cbor_inspector/cbor/types/value.hpp"

#include <cbor_inspector/binary_io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <stdexcept>

namespace cbi {

namespace {

cbor_value parse_simple_or_float(binary_reader& reader, const cbor_parse_state& state) {
    size_t offset = reader.index();
    uint8_t initial_byte = reader.peek_uint8_t();
    uint8_t additional_info = initial_byte & 0x1f;

    switch (additional_info) {
        case CBOR_VALUE_FALSE:
        case CBOR_VALUE_TRUE:
        case CBOR_VALUE_NULL:
        case CBOR_VALUE_UNDEFINED: {
            return cbor_simple{reader, state};
        }
        case CBOR_VALUE_HALF_FLOAT:
        case CBOR_VALUE_SINGLE_FLOAT:
        case CBOR_VALUE_DOUBLE_FLOAT: {
            return cbor_float{reader, state};
        }
        case CBOR_INDEFINITE_LENGTH: {
            throw cbor_unsupported_additional_info_error(
                offset,
                fmt::format("Unexpected break code at offset {}; indefinite-length items are not supported", offset)
            );
        }
    }

    // Everything left is an unassigned or reserved simple value
    if (!state.options.reserved_simple_values_as_invalid) {
        throw cbor_unsupported_additional_info_error(
            offset,
            fmt::format(
                "Unsupported simple value encoding (initial_byte = 0x{:02x} at offset {})",
                initial_byte, offset
            )
        );
    }

    if (additional_info == CBOR_VALUE_SIMPLE_EXTENDED) {
        cbor_argument argument = read_argument(reader, state.options);
        return cbor_invalid{initial_byte, static_cast<uint8_t>(argument.value)};
    }

    reader.skip(1);
    return cbor_invalid{initial_byte, additional_info};
}

}  // namespace

namespace detail {

cbor_value parse_cbor_item(binary_reader& reader, const cbor_parse_state& state) {
    if (state.depth > state.options.max_depth) {
        throw cbor_recursion_limit_error(
            reader.index(),
            fmt::format(
                "Item at offset {} is nested {} levels deep, more than the maximum of {}",
                reader.index(), state.depth, state.options.max_depth
            )
        );
    }

    // Read the first byte to determine the type
    uint8_t initial_byte = reader.peek_uint8_t();
    uint8_t type = initial_byte >> 5;

    switch (type) {
        case CBOR_UNSIGNED_INTEGER: {
            return cbor_unsigned_integer{reader, state};
        }
        case CBOR_NEGATIVE_INTEGER: {
            return cbor_negative_integer{reader, state};
        }
        case CBOR_BYTE_STRING: {
            return cbor_byte_string{reader, state};
        }
        case CBOR_TEXT_STRING: {
            return cbor_text_string{reader, state};
        }
        case CBOR_ARRAY: {
            return cbor_array{reader, state};
        }
        case CBOR_MAP: {
            return cbor_map{reader, state};
        }
        case CBOR_TAG: {
            return cbor_tag{reader, state};
        }
        case CBOR_SIMPLE_OR_FLOAT: {
            return parse_simple_or_float(reader, state);
        }
    }

    throw std::logic_error(fmt::format("Unrecognized CBOR type {} at byte {}", type, reader.index()));
}

}  // namespace detail

cbor_value parse_cbor_item(binary_reader& reader, const decode_options& options) {
    return detail::parse_cbor_item(reader, cbor_parse_state{options, 0});
}

std::vector<cbor_value> parse_cbor_sequence(byte_span bytes, const decode_options& options) {
    binary_reader reader(bytes);
    std::vector<cbor_value> values;

    try {
        while (!reader.at_end()) {
            size_t offset = reader.index();
            values.push_back(parse_cbor_item(reader, options));

            spdlog::debug(
                "Decoded top-level CBOR {} at offset {} ({} bytes)",
                to_string(values.back().type()), offset, reader.index() - offset
            );
        }
    } catch (const cbor_decode_error& ex) {
        spdlog::debug("CBOR decoding failed ({}): {}", to_string(ex.kind()), ex.what());
        throw;
    }

    return values;
}

cbor_value parse_cbor_value(byte_span bytes, const decode_options& options) {
    binary_reader reader(bytes);
    cbor_value value = parse_cbor_item(reader, options);

    if (!reader.at_end()) {
        throw cbor_trailing_data_error(
            reader.index(),
            fmt::format(
                "Found {} bytes of trailing data after the CBOR item ending at offset {}",
                reader.bytes_remaining(), reader.index()
            )
        );
    }

    return value;
}

std::string dump_debug(const std::vector<cbor_value>& values) {
    std::stringstream ss;
    ss << '[';

    bool first = true;
    for (auto&& value : values) {
        if (!first) {
            ss << ", ";
        }

        value.dump_debug(ss);
        first = false;
    }

    ss << ']';
    return ss.str();
}

}  // namespace cbi
