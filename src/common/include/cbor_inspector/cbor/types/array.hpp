#pragma once

#include <cbor_inspector/cbor/detail.hpp>

#include <cstdint>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace cbi {

class binary_reader;
class cbor_value;

class cbor_array {
public:
    cbor_array();

    cbor_array(binary_reader& reader, const cbor_parse_state& state);
    explicit cbor_array(const std::vector<cbor_value>& vec);
    cbor_array(std::initializer_list<cbor_value> list);

    const cbor_value& operator[](size_t index) const;
    const cbor_value& at(size_t index) const;

    void push_back(cbor_value val);

    size_t size() const;
    bool empty() const;

    const std::vector<cbor_value>& vector() const { return _array; }
    operator std::vector<cbor_value>() const { return vector(); }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    bool operator==(const cbor_array& rhs) const;
    bool operator<(const cbor_array& rhs) const;

private:
    std::vector<cbor_value> _array;
};

}  // namespace cbi
