#pragma once

#include <cbor_inspector/types.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace cbi {

#define COPYABLE(class_name) \
    class_name(const class_name&) = default; \
    class_name& operator=(const class_name&) = default

#define NON_COPYABLE(class_name) \
    class_name(const class_name&) = delete; \
    class_name& operator=(const class_name&) = delete

#define MOVABLE(class_name) \
    class_name(class_name&&) = default; \
    class_name& operator=(class_name&&) = default

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

// Based on https://stackoverflow.com/a/45898325
template <typename T, typename TVariant>
struct is_variant_alternative;

template <typename T, typename... VariantTypes>
struct is_variant_alternative<T, std::variant<VariantTypes...>> {
    static constexpr bool value = (std::is_same_v<remove_cvref_t<T>, VariantTypes> || ...);
};

template <typename T, typename TVariant>
inline constexpr bool is_variant_alternative_v = is_variant_alternative<T, TVariant>::value;

void dump_binary(std::stringstream& ss, const uint8_t* buffer, size_t length, size_t indent = 0);

inline void dump_binary(std::stringstream& ss, byte_span binary, size_t indent = 0) {
    dump_binary(ss, binary.data(), binary.size(), indent);
}

bool is_valid_utf8(const uint8_t* buffer, size_t length);

inline bool is_valid_utf8(byte_span buffer) {
    return is_valid_utf8(buffer.data(), buffer.size());
}

std::string int128_to_string(int128_t value);

std::optional<std::string> get_environment_variable(const std::string& variable_name);
std::optional<std::string> get_environment_variable(const char* variable_name);

void set_up_logger(std::string_view log_name);

void log_multiline(const std::string& data, const std::string& indent_str = "");
void log_multiline(std::stringstream& data, const std::string& indent_str = "");
void log_multiline_binary(byte_span buffer, const std::string& indent_str = "");

}  // namespace cbi
