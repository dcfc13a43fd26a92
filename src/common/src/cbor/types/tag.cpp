#include "cbor_inspector/cbor/types/tag.hpp"

#include "cbor_inspector/cbor/types/value.hpp"

#include <cbor_inspector/binary_io.hpp>

#include <fmt/format.h>

#include <memory>
#include <stdexcept>

namespace cbi {

cbor_tag::cbor_tag(binary_reader& reader, const cbor_parse_state& state) {
    cbor_argument argument = read_argument(reader, state.options);
    if (argument.major_type != CBOR_TAG) {
        throw std::runtime_error(fmt::format("Invalid type value {:02x} for cbor_tag", argument.major_type));
    }

    _tag = argument.value;
    _item = std::make_unique<cbor_value>(detail::parse_cbor_item(reader, state.nested()));
}

cbor_tag::cbor_tag(uint64_t tag, cbor_value item)
    : _tag(tag), _item(std::make_unique<cbor_value>(std::move(item))) {}

cbor_tag::cbor_tag(const cbor_tag& other)
    : _tag(other._tag), _item(std::make_unique<cbor_value>(other.item())) {}

cbor_tag& cbor_tag::operator=(const cbor_tag& other) {
    if (this != &other) {
        _tag = other._tag;
        _item = std::make_unique<cbor_value>(other.item());
    }

    return *this;
}

cbor_tag::cbor_tag(cbor_tag&& other) noexcept = default;
cbor_tag& cbor_tag::operator=(cbor_tag&& other) noexcept = default;
cbor_tag::~cbor_tag() = default;

const cbor_value& cbor_tag::item() const {
    static const cbor_value null_item;
    return _item ? *_item : null_item;
}

bool cbor_tag::operator==(const cbor_tag& rhs) const {
    return _tag == rhs._tag && item() == rhs.item();
}

bool cbor_tag::operator<(const cbor_tag& rhs) const {
    return _tag == rhs._tag
        ? item() < rhs.item()
        : _tag < rhs._tag;
}

std::string cbor_tag::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_tag::dump_debug(std::stringstream& ss) const {
    ss << "tag(" << _tag << ")(";
    item().dump_debug(ss);
    ss << ')';
}

}  // namespace cbi
