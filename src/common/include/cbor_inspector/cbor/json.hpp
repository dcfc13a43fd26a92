#pragma once

#include <nlohmann/json_fwd.hpp>

#include <vector>

namespace cbi {

class cbor_value;

// Lossless-enough JSON view of a decoded value for inspection:
//  - integers become numbers, except negative integers below INT64_MIN,
//    which become decimal strings
//  - byte strings become unpadded base64url strings
//  - maps become arrays of [key, value] pairs since keys can be anything
//  - tags become {"tag": number, "value": item}
//  - undefined becomes null, non-finite floats become "NaN"/"Infinity"/"-Infinity"
//  - invalid items become {"invalid": simple_value}
nlohmann::json to_json(const cbor_value& value);
nlohmann::json to_json(const std::vector<cbor_value>& values);

}  // namespace cbi
