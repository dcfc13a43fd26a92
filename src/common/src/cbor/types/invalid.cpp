#include "cbor_inspector/cbor/types/invalid.hpp"

#include <fmt/format.h>

namespace cbi {

std::string cbor_invalid::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_invalid::dump_debug(std::stringstream& ss) const {
    ss << fmt::format("invalid(0x{:02x})", _initial_byte);
}

}  // namespace cbi
