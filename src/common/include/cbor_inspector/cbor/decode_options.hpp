#pragma once

#include <cstddef>

namespace cbi {

struct decode_options {
    // Deepest nesting level allowed for an item; top-level items are at
    // depth 0 and every array element, map key or value and tag content is
    // one level below its container.
    size_t max_depth = 128;

    // Reject integer, length and tag arguments that were not encoded in the
    // shortest possible form.
    bool require_minimal_encoding = false;

    // Decode unassigned simple values (major type 7, additional information
    // 0-19, 24 and 28-30) to cbor_invalid instead of throwing.
    bool reserved_simple_values_as_invalid = false;
};

}  // namespace cbi
