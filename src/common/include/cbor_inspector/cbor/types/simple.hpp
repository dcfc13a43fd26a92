#pragma once

#include <cbor_inspector/cbor/detail.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace cbi {

class binary_reader;

enum class cbor_simple_value : uint8_t {
    false_value = CBOR_VALUE_FALSE,
    true_value = CBOR_VALUE_TRUE,
    null_value = CBOR_VALUE_NULL,
    undefined_value = CBOR_VALUE_UNDEFINED,
};

std::string_view to_string(cbor_simple_value value);

class cbor_simple {
public:
    cbor_simple(binary_reader& reader, const cbor_parse_state& state);
    constexpr cbor_simple(cbor_simple_value value) : _value(value) {}

    static constexpr cbor_simple from_bool(bool value) {
        return cbor_simple{value ? cbor_simple_value::true_value : cbor_simple_value::false_value};
    }

    constexpr cbor_simple_value value() const { return _value; }

    constexpr bool is_bool() const {
        return _value == cbor_simple_value::false_value || _value == cbor_simple_value::true_value;
    }

    constexpr bool is_null() const { return _value == cbor_simple_value::null_value; }
    constexpr bool is_undefined() const { return _value == cbor_simple_value::undefined_value; }

    // Throws cbor_bad_cast_error unless the value is false or true
    bool as_bool() const;

    bool operator==(const cbor_simple& rhs) const { return _value == rhs._value; }
    bool operator<(const cbor_simple& rhs) const { return _value < rhs._value; }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    cbor_simple_value _value;
};

}  // namespace cbi
