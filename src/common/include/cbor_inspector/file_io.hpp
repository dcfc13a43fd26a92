#pragma once

#include <cbor_inspector/types.hpp>

#include <string>

namespace cbi {

byte_vector read_all_from_fd(int fd);
byte_vector read_file(const std::string& path);

}  // namespace cbi
