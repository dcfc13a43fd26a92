#pragma once

#include <cbor_inspector/cbor/detail.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <type_traits>

namespace cbi {

class binary_reader;

// Half, single and double precision items all decode to a double.
// Comparisons work on the bit pattern, so NaN equals itself and 0.0 and
// -0.0 are different values.
class cbor_float {
public:
    cbor_float(binary_reader& reader, const cbor_parse_state& state);
    constexpr cbor_float(double value) : _value(value) {}

    constexpr double value() const { return _value; }

    template <typename T, std::enable_if_t<std::is_same_v<T, double>, int> = 0>
    constexpr operator T() const { return _value; }

    uint64_t bits() const;

    bool operator==(const cbor_float& rhs) const { return bits() == rhs.bits(); }
    bool operator<(const cbor_float& rhs) const { return bits() < rhs.bits(); }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    double _value;
};

}  // namespace cbi
