#include "cbor_inspector/util.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace cbi {

namespace {

constexpr const size_t DUMP_BINARY_LINE_LENGTH = 16;

template <typename Output>
void dump_binary_line(Output& output, const uint8_t* buffer, size_t length) {
    // Print hex values
    for (size_t i = 0; i < length; i++) {
        output << fmt::format("{:02x} ", buffer[i]);
    }

    // If we didn't print a full line, print some padding to line up this
    // partial line's ASCII output with the full lines above it
    if (length < DUMP_BINARY_LINE_LENGTH) {
        output << std::string((DUMP_BINARY_LINE_LENGTH - length) * 3, ' ');
    }

    output << ' ';

    // Print ASCII values
    for (size_t i = 0; i < length; i++) {
        char c = buffer[i];
        if (c < 0x20 || c > 0x7e) {
            // Non-printable ASCII, just print a placeholder
            c = '.';
        }

        output << c;
    }

    output << "\n";
}

// Number of continuation bytes implied by a UTF-8 lead byte, or -1 if the
// byte cannot start a sequence
int utf8_continuation_count(uint8_t lead) {
    if (lead < 0x80) return 0;
    if (lead < 0xc2) return -1;  // Continuation byte or overlong 2-byte lead
    if (lead < 0xe0) return 1;
    if (lead < 0xf0) return 2;
    if (lead < 0xf5) return 3;
    return -1;
}

}  // namespace

void dump_binary(std::stringstream& ss, const uint8_t* buffer, size_t length, size_t indent) {
    std::string indent_str(indent, ' ');

    // Print a header
    ss << indent_str << "      ";
    for (size_t i = 0; i < DUMP_BINARY_LINE_LENGTH; i++) {
        ss << fmt::format(" {:x} ", i);
    }

    ss << "\n";

    // Print the values
    for (size_t i = 0; i < length; i += DUMP_BINARY_LINE_LENGTH) {
        ss << indent_str << fmt::format("{:04x}: ", i);

        dump_binary_line(ss, buffer + i, std::min(DUMP_BINARY_LINE_LENGTH, length - i));
    }
}

bool is_valid_utf8(const uint8_t* buffer, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t lead = buffer[i];
        int continuation_count = utf8_continuation_count(lead);
        if (continuation_count < 0 || static_cast<size_t>(continuation_count) > length - i - 1) {
            return false;
        }

        // The second byte carries the remaining overlong, surrogate and
        // out-of-range restrictions
        uint8_t lower = 0x80;
        uint8_t upper = 0xbf;
        if (lead == 0xe0) {
            lower = 0xa0;
        } else if (lead == 0xed) {
            upper = 0x9f;
        } else if (lead == 0xf0) {
            lower = 0x90;
        } else if (lead == 0xf4) {
            upper = 0x8f;
        }

        for (int byte_i = 1; byte_i <= continuation_count; byte_i++) {
            uint8_t c = buffer[i + byte_i];
            if (byte_i == 1 ? (c < lower || c > upper) : (c & 0xc0) != 0x80) {
                return false;
            }
        }

        i += continuation_count + 1;
    }

    return true;
}

std::string int128_to_string(int128_t value) {
    if (value == 0) {
        return "0";
    }

    bool negative = value < 0;

    // Work with the magnitude in unsigned arithmetic so that the most
    // negative value does not overflow
    unsigned __int128 magnitude = negative
        ? static_cast<unsigned __int128>(-(value + 1)) + 1
        : static_cast<unsigned __int128>(value);

    std::string digits;
    while (magnitude != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    }

    if (negative) {
        digits.push_back('-');
    }

    return std::string(digits.rbegin(), digits.rend());
}

std::optional<std::string> get_environment_variable(const std::string& variable_name) {
    return get_environment_variable(variable_name.c_str());
}

std::optional<std::string> get_environment_variable(const char* variable_name) {
    const char* env_var_value = std::getenv(variable_name);
    if (env_var_value == nullptr) {
        return std::nullopt;
    }

    return std::string(env_var_value);
}

void set_up_logger(std::string_view log_name) {
    auto logger = spdlog::stderr_color_mt(std::string(log_name));
    logger->set_level(
        get_environment_variable("CBOR_INSPECTOR_DEBUG")
            ? spdlog::level::debug
            : spdlog::level::warn
    );
    spdlog::set_default_logger(logger);
}

void log_multiline(const std::string& data, const std::string& indent_str) {
    std::stringstream ss(data);
    log_multiline(ss, indent_str);
}

void log_multiline(std::stringstream& data, const std::string& indent_str) {
    std::string token;
    while (std::getline(data, token, '\n')) {
        spdlog::debug("{}{}", indent_str, token);
    }
}

void log_multiline_binary(byte_span buffer, const std::string& indent_str) {
    std::stringstream ss;
    dump_binary(ss, buffer);
    log_multiline(ss, indent_str);
}

}  // namespace cbi
