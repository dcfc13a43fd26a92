#pragma once

#include <cbor_inspector/cbor/types/array.hpp>
#include <cbor_inspector/cbor/types/float.hpp>
#include <cbor_inspector/cbor/types/integer.hpp>
#include <cbor_inspector/cbor/types/invalid.hpp>
#include <cbor_inspector/cbor/types/map.hpp>
#include <cbor_inspector/cbor/types/simple.hpp>
#include <cbor_inspector/cbor/types/string.hpp>
#include <cbor_inspector/cbor/types/tag.hpp>

#include <cbor_inspector/cbor/errors.hpp>
#include <cbor_inspector/util.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace cbi {

// Kind of a decoded value. Used for dispatch only; the numbering has nothing
// to do with CBOR major types.
enum class cbor_value_type {
    unsigned_integer,
    negative_integer,
    byte_string,
    text_string,
    array,
    map,
    tag,
    simple,
    floating_point,
    invalid,
};

std::string_view to_string(cbor_value_type type);

struct cbor_value_type_discoverer {
    cbor_value_type operator()(const cbor_unsigned_integer&) const { return cbor_value_type::unsigned_integer; }
    cbor_value_type operator()(const cbor_negative_integer&) const { return cbor_value_type::negative_integer; }
    cbor_value_type operator()(const cbor_byte_string&) const { return cbor_value_type::byte_string; }
    cbor_value_type operator()(const cbor_text_string&) const { return cbor_value_type::text_string; }
    cbor_value_type operator()(const cbor_array&) const { return cbor_value_type::array; }
    cbor_value_type operator()(const cbor_map&) const { return cbor_value_type::map; }
    cbor_value_type operator()(const cbor_tag&) const { return cbor_value_type::tag; }
    cbor_value_type operator()(const cbor_simple&) const { return cbor_value_type::simple; }
    cbor_value_type operator()(const cbor_float&) const { return cbor_value_type::floating_point; }
    cbor_value_type operator()(const cbor_invalid&) const { return cbor_value_type::invalid; }
};

template <typename TDestination>
struct cbor_value_converter {
    template <typename TSource>
    TDestination operator()(const TSource& value) const {
        if constexpr (std::is_same_v<TDestination, bool> && std::is_same_v<TSource, cbor_simple>) {
            return value.as_bool();
        } else if constexpr (std::is_convertible_v<const TSource&, TDestination>) {
            return static_cast<TDestination>(value);
        } else {
            throw cbor_bad_cast_error(fmt::format(
                "Cannot convert CBOR {} to the requested type",
                to_string(cbor_value_type_discoverer{}(value))
            ));
        }
    }
};

class cbor_value {
public:
    using storage_type = std::variant<
        cbor_unsigned_integer,
        cbor_negative_integer,
        cbor_byte_string,
        cbor_text_string,
        cbor_array,
        cbor_map,
        cbor_tag,
        cbor_simple,
        cbor_float,
        cbor_invalid
    >;

    cbor_value() : _storage(cbor_simple{cbor_simple_value::null_value}) {}

    template <typename T, std::enable_if_t<is_variant_alternative_v<T, storage_type>, int> = 0>
    cbor_value(T&& value) : _storage(std::forward<T>(value)) {}

    template <typename T, std::enable_if_t<detail::can_fit_in_cbor_integer_v<T>, int> = 0>
    cbor_value(T value) : _storage(_make_integer_storage(value)) {}

    cbor_value(bool value) : _storage(cbor_simple::from_bool(value)) {}
    cbor_value(std::nullptr_t) : _storage(cbor_simple{cbor_simple_value::null_value}) {}
    cbor_value(double value) : _storage(cbor_float{value}) {}
    cbor_value(const char* value) : _storage(cbor_text_string{value}) {}
    cbor_value(std::string value) : _storage(cbor_text_string{std::move(value)}) {}

    COPYABLE(cbor_value);
    MOVABLE(cbor_value);

    cbor_value_type type() const {
        return std::visit(cbor_value_type_discoverer{}, _storage);
    }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(_storage); }

    // Reference to the stored alternative; throws cbor_bad_cast_error if the
    // value holds a different kind
    template <typename T>
    const T& as() const {
        const T* value = std::get_if<T>(&_storage);
        if (value == nullptr) {
            throw cbor_bad_cast_error(fmt::format("CBOR value is a {}", to_string(type())));
        }

        return *value;
    }

    template <typename T>
    T get() const {
        return std::visit(cbor_value_converter<T>{}, _storage);
    }

    template <typename T> explicit operator T() const { return get<T>(); }

    const storage_type& storage() const { return _storage; }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    bool operator==(const cbor_value& rhs) const;
    bool operator!=(const cbor_value& rhs) const { return !(*this == rhs); }
    bool operator<(const cbor_value& rhs) const;

private:
    storage_type _storage;

    template <typename T>
    static storage_type _make_integer_storage(T value) {
        if constexpr (std::is_signed_v<T>) {
            if (value < 0) {
                return cbor_negative_integer::from_value(value);
            }
        }

        return cbor_unsigned_integer{static_cast<uint64_t>(value)};
    }
};

}  // namespace cbi
