#include "test_helpers.hpp"

#include <cbor_inspector/binary_io.hpp>
#include <cbor_inspector/cbor.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace cbi::literals;

TEST(CBOR, ByteStrings) {
    // Examples explicitly mentioned by RFC
    {
        std::vector<uint8_t> bytes = {0b010'00101, 'a', 'b', 'c', 'd', 'e'};
        std::vector<uint8_t> expected_bytes = {'a', 'b', 'c', 'd', 'e'};
        auto actual_cbor_byte_string = cbi::parse_cbor<cbi::cbor_byte_string>(bytes);
        auto actual_string = actual_cbor_byte_string.string();
        auto actual_vector = actual_cbor_byte_string.vector();
        ASSERT_EQ(actual_string, "abcde"_bytes);
        ASSERT_EQ(actual_vector, expected_bytes);
    }

    {
        std::vector<uint8_t> bytes = {0x45, 0x01, 0x02, 0x03, 0x04, 0x05};
        std::vector<uint8_t> actual = cbi::parse_cbor<std::vector<uint8_t>>(bytes);
        ASSERT_EQ(actual, (std::vector<uint8_t>{1, 2, 3, 4, 5}));
        ASSERT_EQ(cbi::parse_cbor(bytes).dump_debug(), "b\"0102030405\"");
    }

    {
        std::vector<uint8_t> bytes;
        bytes.resize(503);
        bytes[0] = 0b010'11001;
        bytes[1] = 0x01;
        bytes[2] = 0xf4;

        std::vector<uint8_t> expected_byte_string;
        expected_byte_string.resize(500);

        for (size_t i = 0; i < 500; i++) {
            bytes[i + 3] = expected_byte_string[i] = i % 256;
        }

        std::vector<uint8_t> actual_byte_string = cbi::parse_cbor<cbi::cbor_byte_string>(bytes);
        ASSERT_EQ(actual_byte_string, expected_byte_string);
    }

    // Empty
    {
        std::vector<uint8_t> bytes = {0x40};
        auto actual = cbi::parse_cbor<cbi::cbor_byte_string>(bytes);
        ASSERT_TRUE(actual.empty());
        ASSERT_EQ(actual.dump_debug(), "b\"\"");
    }
}

TEST(CBOR, TextStrings) {
    {
        std::vector<uint8_t> bytes = cbi::test::encode_text("Hello World");
        ASSERT_EQ(cbi::parse_cbor<std::string>(bytes), "Hello World");
        ASSERT_EQ(cbi::parse_cbor(bytes).dump_debug(), "\"Hello World\"");
    }

    // Multi-byte sequences from RFC 8949 appendix A
    {
        std::vector<uint8_t> bytes = {0x62, 0xc3, 0xbc};
        ASSERT_EQ(cbi::parse_cbor<std::string>(bytes), "ü");
    }

    {
        std::vector<uint8_t> bytes = {0x63, 0xe6, 0xb0, 0xb4};
        ASSERT_EQ(cbi::parse_cbor<std::string>(bytes), "水");
    }

    {
        std::vector<uint8_t> bytes = {0x64, 0xf0, 0x90, 0x85, 0x91};
        ASSERT_EQ(cbi::parse_cbor<std::string>(bytes), "\xf0\x90\x85\x91");
    }

    {
        std::vector<uint8_t> bytes = {0x60};
        auto actual = cbi::parse_cbor<cbi::cbor_text_string>(bytes);
        ASSERT_TRUE(actual.empty());
        ASSERT_EQ(actual.string(), "");
    }

    // Longer than the immediate length range
    {
        std::string expected(1000, 'x');
        std::vector<uint8_t> bytes = cbi::test::encode_text(expected);
        ASSERT_EQ(bytes.size(), 1003);
        ASSERT_EQ(cbi::parse_cbor<std::string>(bytes), expected);
    }

    {
        std::vector<uint8_t> bytes = cbi::test::encode_text("say \"hi\"");
        ASSERT_EQ(cbi::parse_cbor(bytes).dump_debug(), "\"say \\\"hi\\\"\"");
    }

    // Control characters are escaped so a rendering never spans lines
    {
        std::vector<uint8_t> bytes = {0x62, 'a', 0x0a};
        ASSERT_EQ(cbi::parse_cbor(bytes).dump_debug(), "\"a\\n\"");
    }

    {
        std::vector<uint8_t> bytes = {0x66, '\t', 'x', '\r', 0x01, 0x1f, 0x7f};
        ASSERT_EQ(cbi::parse_cbor(bytes).dump_debug(), "\"\\tx\\r\\u0001\\u001f\\u007f\"");
    }

    {
        std::vector<uint8_t> bytes = {0x82, 0x62, 'a', 0x0a, 0x61, 0x0d};
        std::string dump = cbi::dump_debug(cbi::parse_cbor_sequence(bytes));
        ASSERT_EQ(dump.find('\n'), std::string::npos);
        ASSERT_EQ(dump.find('\r'), std::string::npos);
        ASSERT_EQ(dump, "[[\"a\\n\", \"\\r\"]]");
    }
}

TEST(CBOR, InvalidUtf8) {
    std::vector<std::vector<uint8_t>> invalid = {
        {0x61, 0xff},
        {0x61, 0x80},                    // Lone continuation byte
        {0x62, 0xc0, 0xaf},              // Overlong encoding of '/'
        {0x63, 0xe0, 0x80, 0xaf},        // Overlong 3-byte encoding
        {0x63, 0xed, 0xa0, 0x80},        // UTF-16 surrogate
        {0x64, 0xf4, 0x90, 0x80, 0x80},  // Above U+10FFFF
        {0x62, 0xe6, 0xb0},              // Truncated sequence
        {0x65, 'a', 'b', 'c', 'd', 0xc3},
    };

    for (auto&& bytes : invalid) {
        try {
            cbi::parse_cbor(bytes);
            FAIL() << "Invalid UTF-8 was accepted";
        } catch (const cbi::cbor_invalid_utf8_error& ex) {
            ASSERT_EQ(ex.kind(), cbi::cbor_error_kind::invalid_utf8);
            ASSERT_EQ(ex.offset(), 1);
        }
    }

    // The same bytes are fine in a byte string
    std::vector<uint8_t> bytes = {0x42, 0xc0, 0xaf};
    EXPECT_NO_THROW(cbi::parse_cbor(bytes));
}

TEST(CBOR, TruncatedStrings) {
    {
        std::vector<uint8_t> bytes = {0x45, 0x01, 0x02};
        EXPECT_THROW(cbi::parse_cbor(bytes), cbi::cbor_out_of_bounds_error);
    }

    {
        std::vector<uint8_t> bytes = {0x6b, 'H', 'e', 'l', 'l', 'o'};
        EXPECT_THROW(cbi::parse_cbor(bytes), cbi::cbor_out_of_bounds_error);
    }

    // A length of 2^64 - 1 must be rejected before anything is allocated
    {
        std::vector<uint8_t> bytes = {0x5b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x00};
        try {
            cbi::parse_cbor(bytes);
            FAIL() << "Oversized byte string was accepted";
        } catch (const cbi::cbor_out_of_bounds_error& ex) {
            ASSERT_EQ(ex.offset(), 0);
        }
    }

    {
        std::vector<uint8_t> bytes = {0x7a, 0x7f, 0xff, 0xff, 0xff, 'a'};
        EXPECT_THROW(cbi::parse_cbor(bytes), cbi::cbor_out_of_bounds_error);
    }
}

TEST(CBOR, StringComparisons) {
    cbi::cbor_text_string str{"hello world"};
    ASSERT_EQ(str, "hello world");
    ASSERT_EQ(str, std::string("hello world"));
    ASSERT_TRUE(cbi::cbor_text_string{"a"} < cbi::cbor_text_string{"b"});

    cbi::cbor_byte_string bytes{cbi::byte_string{0x01, 0x02}};
    ASSERT_EQ(bytes.size(), 2);
    ASSERT_TRUE(cbi::cbor_byte_string{cbi::byte_string{0x01}} < bytes);
}
