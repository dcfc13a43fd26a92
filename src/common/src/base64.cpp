#include "cbor_inspector/base64.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>

//
// Loosely based on https://stackoverflow.com/a/10973348
//

namespace cbi {

std::string base64_encode(const uint8_t* buffer, size_t length) {
    using base64_encoder_it =
        boost::archive::iterators::base64_from_binary<
            boost::archive::iterators::transform_width<const uint8_t*, 6, 8>
        >;

    std::string base64_encoded;

    // Reserve the total number of bytes we'll need after the encoding
    // Based on https://stackoverflow.com/a/4715480
    base64_encoded.resize((length + 2) / 3 * 4);

    std::copy(base64_encoder_it(buffer), base64_encoder_it(buffer + length), base64_encoded.begin());

    // Add padding characters to get the final string to be a length that's a
    // multiple of 4
    size_t num_padding_characters = (3 - (length % 3)) % 3;
    for (size_t i = 0; i < num_padding_characters; i++) {
        base64_encoded[base64_encoded.size() - i - 1] = '=';
    }

    return base64_encoded;
}

std::string base64url_encode(const uint8_t* buffer, size_t length) {
    std::string encoded = base64_encode(buffer, length);

    // base64url (RFC 4648 section 5) without padding, as used by CBOR's
    // diagnostic notation
    encoded.erase(std::find(encoded.begin(), encoded.end(), '='), encoded.end());
    std::replace(encoded.begin(), encoded.end(), '+', '-');
    std::replace(encoded.begin(), encoded.end(), '/', '_');

    return encoded;
}

}  // namespace cbi
