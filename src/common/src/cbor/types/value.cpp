#include "cbor_inspector/cbor/types/value.hpp"

namespace cbi {

std::string_view to_string(cbor_value_type type) {
    switch (type) {
        case cbor_value_type::unsigned_integer: return "unsigned integer";
        case cbor_value_type::negative_integer: return "negative integer";
        case cbor_value_type::byte_string: return "byte string";
        case cbor_value_type::text_string: return "text string";
        case cbor_value_type::array: return "array";
        case cbor_value_type::map: return "map";
        case cbor_value_type::tag: return "tag";
        case cbor_value_type::simple: return "simple value";
        case cbor_value_type::floating_point: return "float";
        case cbor_value_type::invalid: return "invalid item";
    }

    return "unknown";
}

std::string cbor_value::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_value::dump_debug(std::stringstream& ss) const {
    std::visit([&](auto&& value) { value.dump_debug(ss); }, _storage);
}

bool cbor_value::operator==(const cbor_value& rhs) const {
    return _storage == rhs._storage;
}

bool cbor_value::operator<(const cbor_value& rhs) const {
    return _storage < rhs._storage;
}

}  // namespace cbi
