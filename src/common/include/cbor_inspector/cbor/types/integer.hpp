#pragma once

#include <cbor_inspector/cbor/detail.hpp>
#include <cbor_inspector/types.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace cbi {

class binary_reader;

namespace detail {

template <typename T>
constexpr bool can_fit_in_cbor_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) <= sizeof(uint64_t);

}  // namespace detail

class cbor_unsigned_integer {
public:
    cbor_unsigned_integer(binary_reader& reader, const cbor_parse_state& state);

    constexpr cbor_unsigned_integer(uint64_t value) : _value(value) {}

    constexpr uint64_t value() const { return _value; }

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    constexpr operator T() const {
        if (_value > static_cast<std::make_unsigned_t<T>>(std::numeric_limits<T>::max())) {
            throw std::overflow_error("CBOR unsigned integer cannot fit in specified integer type");
        }

        return static_cast<T>(_value);
    }

    bool operator==(const cbor_unsigned_integer& rhs) const { return _value == rhs._value; }
    bool operator<(const cbor_unsigned_integer& rhs) const { return _value < rhs._value; }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    uint64_t _value;
};

// Negative integers are stored as the raw CBOR argument; the value they
// represent is -1 - argument, which for arguments above INT64_MAX only fits
// in 128 bits.
class cbor_negative_integer {
public:
    cbor_negative_integer(binary_reader& reader, const cbor_parse_state& state);

    template <typename T, std::enable_if_t<std::is_signed_v<T> && detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    static constexpr cbor_negative_integer from_value(T value) {
        if (value >= 0) {
            throw std::invalid_argument("cbor_negative_integer requires a negative value");
        }

        return cbor_negative_integer{static_cast<uint64_t>((value + 1) * -1)};
    }

    constexpr uint64_t raw_value() const { return _raw_value; }
    constexpr int128_t value() const { return -1 - static_cast<int128_t>(_raw_value); }

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    operator T() const {
        if constexpr (std::is_unsigned_v<T>) {
            throw std::overflow_error("Cannot represent CBOR negative integer with unsigned integer type");
        } else {
            if (_raw_value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
                throw std::overflow_error("CBOR negative integer cannot fit in specified integer type");
            }

            return static_cast<T>(-1 - static_cast<T>(_raw_value));
        }
    }

    bool operator==(const cbor_negative_integer& rhs) const { return _raw_value == rhs._raw_value; }

    // Larger raw values are more negative
    bool operator<(const cbor_negative_integer& rhs) const { return _raw_value > rhs._raw_value; }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    explicit constexpr cbor_negative_integer(uint64_t raw_value) : _raw_value(raw_value) {}

    uint64_t _raw_value;
};

}  // namespace cbi
