#include "cbor_inspector/cbor/json.hpp"

#include "cbor_inspector/cbor/types/value.hpp"

#include <cbor_inspector/base64.hpp>
#include <cbor_inspector/util.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace cbi {

namespace {

struct json_converter {
    nlohmann::json operator()(const cbor_unsigned_integer& value) const {
        return value.value();
    }

    nlohmann::json operator()(const cbor_negative_integer& value) const {
        if (value.raw_value() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return int128_to_string(value.value());
        }

        return static_cast<int64_t>(value.value());
    }

    nlohmann::json operator()(const cbor_byte_string& value) const {
        return base64url_encode(value.data(), value.size());
    }

    nlohmann::json operator()(const cbor_text_string& value) const {
        return value.string();
    }

    nlohmann::json operator()(const cbor_array& value) const {
        nlohmann::json result = nlohmann::json::array();
        for (auto&& item : value.vector()) {
            result.push_back(to_json(item));
        }

        return result;
    }

    nlohmann::json operator()(const cbor_map& value) const {
        nlohmann::json result = nlohmann::json::array();
        for (auto&& [key, item] : value.entries()) {
            result.push_back(nlohmann::json::array({to_json(key), to_json(item)}));
        }

        return result;
    }

    nlohmann::json operator()(const cbor_tag& value) const {
        return nlohmann::json{
            {"tag", value.tag()},
            {"value", to_json(value.item())},
        };
    }

    nlohmann::json operator()(const cbor_simple& value) const {
        if (value.is_bool()) {
            return value.as_bool();
        }

        return nullptr;
    }

    nlohmann::json operator()(const cbor_float& value) const {
        double number = value.value();
        if (std::isnan(number)) {
            return "NaN";
        }

        if (std::isinf(number)) {
            return number < 0 ? "-Infinity" : "Infinity";
        }

        return number;
    }

    nlohmann::json operator()(const cbor_invalid& value) const {
        return nlohmann::json{{"invalid", value.simple_value()}};
    }
};

}  // namespace

nlohmann::json to_json(const cbor_value& value) {
    return std::visit(json_converter{}, value.storage());
}

nlohmann::json to_json(const std::vector<cbor_value>& values) {
    nlohmann::json result = nlohmann::json::array();
    for (auto&& value : values) {
        result.push_back(to_json(value));
    }

    return result;
}

}  // namespace cbi
