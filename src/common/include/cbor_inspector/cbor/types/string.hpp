#pragma once

#include <cbor_inspector/cbor/detail.hpp>
#include <cbor_inspector/cbor/errors.hpp>

#include <cbor_inspector/binary_io.hpp>
#include <cbor_inspector/util.hpp>

#include <fmt/format.h>

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cbi {

namespace detail {

template <typename TChar>
struct basic_cbor_string_type;

template <typename TChar>
inline constexpr uint8_t basic_cbor_string_type_v = basic_cbor_string_type<TChar>::value;

template <> struct basic_cbor_string_type<uint8_t> { static constexpr uint8_t value = CBOR_BYTE_STRING; };
template <> struct basic_cbor_string_type<char> { static constexpr uint8_t value = CBOR_TEXT_STRING; };

}  // namespace detail

template <typename TString>
class basic_cbor_string {
public:
    using string_type = TString;
    using value_type = typename string_type::value_type;
    using string_view_type = std::basic_string_view<value_type, typename string_type::traits_type>;
    using vector_type = std::vector<value_type>;

    static constexpr bool is_text = std::is_same_v<value_type, char>;

    basic_cbor_string(binary_reader& reader, const cbor_parse_state& state) {
        size_t header_offset = reader.index();
        auto [type, additional_info, size] = read_argument(reader, state.options);
        if (type != detail::basic_cbor_string_type_v<value_type>) {
            throw std::runtime_error(fmt::format("Invalid type value {:02x} for basic_cbor_string", type));
        }

        // Check before touching the data so a forged length never allocates
        if (size > reader.bytes_remaining()) {
            throw cbor_out_of_bounds_error(
                header_offset,
                fmt::format(
                    "{} string at offset {} declares {} bytes but only {} bytes are left to read",
                    is_text ? "Text" : "Byte", header_offset, size, reader.bytes_remaining()
                )
            );
        }

        size_t data_offset = reader.index();
        byte_span data = reader.read_span(static_cast<size_t>(size));

        if constexpr (is_text) {
            if (!is_valid_utf8(data)) {
                throw cbor_invalid_utf8_error(
                    data_offset,
                    fmt::format("Text string at offset {} is not valid UTF-8", header_offset)
                );
            }
        }

        _str.assign(data.begin(), data.end());
    }

    basic_cbor_string(string_type str) : _str(std::move(str)) {}
    basic_cbor_string(const value_type* str) : _str(str) {}
    basic_cbor_string() {}

    const string_type& string() const { return _str; }
    string_view_type string_view() const { return _str; }
    vector_type vector() const { return vector_type{_str.cbegin(), _str.cend()}; }

    const value_type* data() const { return _str.data(); }
    size_t size() const { return _str.size(); }
    bool empty() const { return _str.empty(); }

    operator string_type() const { return string(); }
    operator string_view_type() const { return string_view(); }

    operator vector_type() const { return vector(); }

    bool operator==(const basic_cbor_string<TString>& rhs) const { return _str == rhs._str; }
    bool operator<(const basic_cbor_string<TString>& rhs) const { return _str < rhs._str; }

    std::string dump_debug() const {
        std::stringstream ss;
        dump_debug(ss);
        return ss.str();
    }

    void dump_debug(std::stringstream& ss) const {
        if constexpr (!is_text) {
            ss << 'b';
        }

        ss << '"';

        for (auto c : _str) {
            if constexpr (!is_text) {
                ss << fmt::format("{:02x}", c);
            } else {
                switch (c) {
                    case '"': ss << "\\\""; break;
                    case '\\': ss << "\\\\"; break;
                    case '\n': ss << "\\n"; break;
                    case '\r': ss << "\\r"; break;
                    case '\t': ss << "\\t"; break;
                    default:
                        // Keep every rendering on a single line
                        if (static_cast<uint8_t>(c) < 0x20 || c == 0x7f) {
                            ss << fmt::format("\\u{:04x}", static_cast<uint8_t>(c));
                        } else {
                            ss << c;
                        }
                }
            }
        }

        ss << '"';
    }

private:
    TString _str;
};

using cbor_byte_string = basic_cbor_string<std::basic_string<uint8_t>>;
using cbor_text_string = basic_cbor_string<std::basic_string<char>>;

}  // namespace cbi
