#include <cbor_inspector/base64.hpp>
#include <cbor_inspector/types.hpp>
#include <cbor_inspector/util.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace {

bool valid(std::vector<uint8_t> bytes) {
    return cbi::is_valid_utf8(bytes.data(), bytes.size());
}

}  // namespace

TEST(Util, ValidUtf8) {
    ASSERT_TRUE(valid({}));
    ASSERT_TRUE(valid({'a', 'b', 'c'}));
    ASSERT_TRUE(valid({0x00}));
    ASSERT_TRUE(valid({0x7f}));
    ASSERT_TRUE(valid({0xc2, 0x80}));
    ASSERT_TRUE(valid({0xc3, 0xbc}));
    ASSERT_TRUE(valid({0xdf, 0xbf}));
    ASSERT_TRUE(valid({0xe0, 0xa0, 0x80}));
    ASSERT_TRUE(valid({0xe6, 0xb0, 0xb4}));
    ASSERT_TRUE(valid({0xed, 0x9f, 0xbf}));
    ASSERT_TRUE(valid({0xef, 0xbf, 0xbf}));
    ASSERT_TRUE(valid({0xf0, 0x90, 0x80, 0x80}));
    ASSERT_TRUE(valid({0xf0, 0x90, 0x85, 0x91}));
    ASSERT_TRUE(valid({0xf4, 0x8f, 0xbf, 0xbf}));
}

TEST(Util, InvalidUtf8) {
    // Lone continuation bytes
    ASSERT_FALSE(valid({0x80}));
    ASSERT_FALSE(valid({0xbf}));
    ASSERT_FALSE(valid({'a', 0x80, 'b'}));

    // Overlong encodings
    ASSERT_FALSE(valid({0xc0, 0x80}));
    ASSERT_FALSE(valid({0xc1, 0xbf}));
    ASSERT_FALSE(valid({0xe0, 0x80, 0x80}));
    ASSERT_FALSE(valid({0xe0, 0x9f, 0xbf}));
    ASSERT_FALSE(valid({0xf0, 0x8f, 0xbf, 0xbf}));

    // UTF-16 surrogates
    ASSERT_FALSE(valid({0xed, 0xa0, 0x80}));
    ASSERT_FALSE(valid({0xed, 0xbf, 0xbf}));

    // Above U+10FFFF
    ASSERT_FALSE(valid({0xf4, 0x90, 0x80, 0x80}));
    ASSERT_FALSE(valid({0xf5, 0x80, 0x80, 0x80}));
    ASSERT_FALSE(valid({0xff}));

    // Truncated sequences
    ASSERT_FALSE(valid({0xc3}));
    ASSERT_FALSE(valid({0xe6, 0xb0}));
    ASSERT_FALSE(valid({0xf0, 0x90, 0x85}));

    // Bad continuation byte
    ASSERT_FALSE(valid({0xc3, 0x28}));
    ASSERT_FALSE(valid({0xe6, 0xb0, 0x28}));
}

TEST(Util, Int128ToString) {
    ASSERT_EQ(cbi::int128_to_string(0), "0");
    ASSERT_EQ(cbi::int128_to_string(7), "7");
    ASSERT_EQ(cbi::int128_to_string(-1), "-1");
    ASSERT_EQ(cbi::int128_to_string(1000000), "1000000");
    ASSERT_EQ(
        cbi::int128_to_string(std::numeric_limits<int64_t>::min()),
        "-9223372036854775808"
    );

    // Most negative CBOR integer
    cbi::int128_t min_cbor = -1 - static_cast<cbi::int128_t>(std::numeric_limits<uint64_t>::max());
    ASSERT_EQ(cbi::int128_to_string(min_cbor), "-18446744073709551616");

    // Full 128-bit range
    cbi::int128_t max_128 = static_cast<cbi::int128_t>(
        (static_cast<unsigned __int128>(1) << 127) - 1
    );
    ASSERT_EQ(cbi::int128_to_string(max_128), "170141183460469231731687303715884105727");
    ASSERT_EQ(cbi::int128_to_string(-max_128 - 1), "-170141183460469231731687303715884105728");
}

TEST(Util, Base64) {
    std::vector<uint8_t> empty;
    ASSERT_EQ(cbi::base64_encode(empty.data(), empty.size()), "");
    ASSERT_EQ(cbi::base64url_encode(empty), "");

    std::string foobar = "foobar";
    const auto* foobar_bytes = reinterpret_cast<const uint8_t*>(foobar.data());
    ASSERT_EQ(cbi::base64_encode(foobar_bytes, 1), "Zg==");
    ASSERT_EQ(cbi::base64_encode(foobar_bytes, 2), "Zm8=");
    ASSERT_EQ(cbi::base64_encode(foobar_bytes, 3), "Zm9v");
    ASSERT_EQ(cbi::base64_encode(foobar_bytes, 6), "Zm9vYmFy");

    ASSERT_EQ(cbi::base64url_encode(foobar_bytes, 1), "Zg");
    ASSERT_EQ(cbi::base64url_encode(foobar_bytes, 2), "Zm8");

    // Characters 62 and 63 differ between the two alphabets
    std::vector<uint8_t> bytes = {0xfb, 0xff, 0xbf};
    ASSERT_EQ(cbi::base64_encode(bytes.data(), bytes.size()), "+/+/");
    ASSERT_EQ(cbi::base64url_encode(bytes), "-_-_");
}

TEST(Util, DumpBinary) {
    std::vector<uint8_t> bytes = {'h', 'i', 0x00, 0xff};
    std::stringstream ss;
    cbi::dump_binary(ss, bytes);

    std::string dump = ss.str();
    ASSERT_NE(dump.find("0000: 68 69 00 ff "), std::string::npos);
    ASSERT_NE(dump.find(" hi.."), std::string::npos);

    std::stringstream indented;
    cbi::dump_binary(indented, bytes, 4);
    ASSERT_EQ(indented.str().substr(0, 4), "    ");
}

TEST(Util, EnvironmentVariables) {
    ASSERT_FALSE(cbi::get_environment_variable("CBOR_INSPECTOR_TEST_UNSET_VARIABLE").has_value());

    ::setenv("CBOR_INSPECTOR_TEST_VARIABLE", "value", 1);
    ASSERT_EQ(cbi::get_environment_variable(std::string("CBOR_INSPECTOR_TEST_VARIABLE")), "value");
    ::unsetenv("CBOR_INSPECTOR_TEST_VARIABLE");
}
