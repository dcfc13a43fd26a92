#include "cbor_inspector/cbor/types/array.hpp"

#include "cbor_inspector/cbor/types/value.hpp"

#include <cbor_inspector/binary_io.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace cbi {

cbor_array::cbor_array() {}

cbor_array::cbor_array(binary_reader& reader, const cbor_parse_state& state) {
    size_t header_offset = reader.index();
    auto [type, additional_info, num_elements] = read_argument(reader, state.options);
    if (type != CBOR_ARRAY) {
        throw std::runtime_error(fmt::format("Invalid type value {:02x} for cbor_array", type));
    }

    // Every element takes at least one byte
    detail::ensure_items_can_fit(reader, header_offset, num_elements, 1);

    // Nested arrays may each claim the rest of the input, so never reserve
    // from the declared count
    for (uint64_t i = 0; i < num_elements; i++) {
        _array.emplace_back(detail::parse_cbor_item(reader, state.nested()));
    }
}

cbor_array::cbor_array(const std::vector<cbor_value>& vec)
    : _array(vec.cbegin(), vec.cend()) {}

cbor_array::cbor_array(std::initializer_list<cbor_value> list)
    : _array(list.begin(), list.end()) {}

const cbor_value& cbor_array::operator[](size_t index) const { return _array[index]; }
const cbor_value& cbor_array::at(size_t index) const { return _array.at(index); }

void cbor_array::push_back(cbor_value val) { _array.push_back(std::move(val)); }

size_t cbor_array::size() const { return _array.size(); }
bool cbor_array::empty() const { return _array.empty(); }

bool cbor_array::operator==(const cbor_array& rhs) const { return _array == rhs._array; }
bool cbor_array::operator<(const cbor_array& rhs) const { return _array < rhs._array; }

std::string cbor_array::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_array::dump_debug(std::stringstream& ss) const {
    ss << '[';

    bool first = true;
    for (auto&& value : _array) {
        if (!first) {
            ss << ", ";
        }

        value.dump_debug(ss);
        first = false;
    }

    ss << ']';
}

}  // namespace cbi
