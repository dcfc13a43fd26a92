#include "cbor_inspector/cbor/float.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace cbi {

// Based on the reference decoder in RFC 8949, Appendix D
double decode_half_float(uint16_t bits) {
    int exponent = (bits >> 10) & 0x1f;
    int mantissa = bits & 0x3ff;

    double value;
    if (exponent == 0) {
        // Zero or subnormal: 2^-14 * (mantissa / 1024)
        value = std::ldexp(mantissa, -24);
    } else if (exponent != 31) {
        // Normal: 2^(exponent - 15) * (1 + mantissa / 1024)
        value = std::ldexp(mantissa + 1024, exponent - 25);
    } else {
        value = mantissa == 0
            ? std::numeric_limits<double>::infinity()
            : std::numeric_limits<double>::quiet_NaN();
    }

    return (bits & 0x8000) ? -value : value;
}

double decode_single_float(uint32_t bits) {
    static_assert(sizeof(float) == sizeof(uint32_t) && std::numeric_limits<float>::is_iec559);

    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

double decode_double_float(uint64_t bits) {
    static_assert(sizeof(double) == sizeof(uint64_t) && std::numeric_limits<double>::is_iec559);

    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

}  // namespace cbi
