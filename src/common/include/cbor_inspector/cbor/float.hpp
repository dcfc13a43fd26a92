#pragma once

#include <cstdint>

namespace cbi {

// IEEE 754 binary16 bits (already assembled from big-endian order) to double
double decode_half_float(uint16_t bits);

double decode_single_float(uint32_t bits);
double decode_double_float(uint64_t bits);

}  // namespace cbi
