#include "cbor_inspector/cbor/types/map.hpp"

#include "cbor_inspector/cbor/types/value.hpp"

#include <cbor_inspector/binary_io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace cbi {

cbor_map::cbor_map() {}

cbor_map::cbor_map(binary_reader& reader, const cbor_parse_state& state) {
    size_t header_offset = reader.index();
    auto [type, additional_info, num_pairs] = read_argument(reader, state.options);
    if (type != CBOR_MAP) {
        throw std::runtime_error(fmt::format("Invalid type value {:02x} for cbor_map", type));
    }

    // Every pair takes at least two bytes
    detail::ensure_items_can_fit(reader, header_offset, num_pairs, 2);

    for (uint64_t i = 0; i < num_pairs; i++) {
        size_t key_offset = reader.index();
        cbor_value key = detail::parse_cbor_item(reader, state.nested());
        cbor_value value = detail::parse_cbor_item(reader, state.nested());

        if (!insert_or_assign(std::move(key), std::move(value))) {
            spdlog::debug(
                "Map at offset {} repeats the key at offset {}; keeping the last value",
                header_offset, key_offset
            );
        }
    }
}

cbor_map::cbor_map(std::initializer_list<entry_type> list) {
    for (auto&& entry : list) {
        insert_or_assign(entry.first, entry.second);
    }
}

bool cbor_map::insert_or_assign(cbor_value key, cbor_value value) {
    auto it = _index.find(key);
    if (it != _index.end()) {
        _entries[it->second].second = std::move(value);
        return false;
    }

    _index.emplace(key, _entries.size());
    _entries.emplace_back(std::move(key), std::move(value));
    return true;
}

size_t cbor_map::size() const { return _entries.size(); }
bool cbor_map::empty() const { return _entries.empty(); }

bool cbor_map::contains(const cbor_value& key) const { return _index.count(key) != 0; }

const cbor_value* cbor_map::find(const cbor_value& key) const {
    auto it = _index.find(key);
    return it == _index.cend() ? nullptr : &_entries[it->second].second;
}

const cbor_value& cbor_map::at(const cbor_value& key) const {
    const cbor_value* value = find(key);
    if (value == nullptr) {
        throw std::out_of_range(fmt::format("Key {} not found in CBOR map", key.dump_debug()));
    }

    return *value;
}

std::vector<cbor_value> cbor_map::keys() const {
    std::vector<cbor_value> keys;
    keys.reserve(_entries.size());
    for (const auto& entry : _entries) {
        keys.push_back(entry.first);
    }

    return keys;
}

bool cbor_map::operator==(const cbor_map& rhs) const {
    if (size() != rhs.size()) {
        return false;
    }

    // Walk both maps in key order
    auto rhs_it = rhs._index.cbegin();
    for (auto lhs_it = _index.cbegin(); lhs_it != _index.cend(); ++lhs_it, ++rhs_it) {
        if (lhs_it->first != rhs_it->first ||
                _entries[lhs_it->second].second != rhs._entries[rhs_it->second].second) {
            return false;
        }
    }

    return true;
}

bool cbor_map::operator<(const cbor_map& rhs) const {
    // Lexicographic over (key, value) pairs in key order
    auto lhs_it = _index.cbegin();
    auto rhs_it = rhs._index.cbegin();
    for (; lhs_it != _index.cend() && rhs_it != rhs._index.cend(); ++lhs_it, ++rhs_it) {
        if (lhs_it->first < rhs_it->first) return true;
        if (rhs_it->first < lhs_it->first) return false;

        const cbor_value& lhs_value = _entries[lhs_it->second].second;
        const cbor_value& rhs_value = rhs._entries[rhs_it->second].second;
        if (lhs_value < rhs_value) return true;
        if (rhs_value < lhs_value) return false;
    }

    return lhs_it == _index.cend() && rhs_it != rhs._index.cend();
}

std::string cbor_map::dump_debug() const {
    std::stringstream ss;
    dump_debug(ss);
    return ss.str();
}

void cbor_map::dump_debug(std::stringstream& ss) const {
    ss << '{';

    bool first = true;
    for (auto&& pair : _entries) {
        if (!first) {
            ss << ", ";
        }

        pair.first.dump_debug(ss);
        ss << ": ";
        pair.second.dump_debug(ss);

        first = false;
    }

    ss << '}';
}

}  // namespace cbi
