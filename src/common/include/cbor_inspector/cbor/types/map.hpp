#pragma once

#include <cbor_inspector/cbor/detail.hpp>

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace cbi {

class binary_reader;
class cbor_value;

// Map with arbitrary CBOR keys. Entries keep the order in which their keys
// were first inserted; inserting an existing key replaces its value in
// place, so the last write wins.
class cbor_map {
public:
    using entry_type = std::pair<cbor_value, cbor_value>;

    cbor_map();

    cbor_map(binary_reader& reader, const cbor_parse_state& state);
    cbor_map(std::initializer_list<entry_type> list);

    // Returns true if the key was not present before
    bool insert_or_assign(cbor_value key, cbor_value value);

    const std::vector<entry_type>& entries() const { return _entries; }

    size_t size() const;
    bool empty() const;

    bool contains(const cbor_value& key) const;
    const cbor_value* find(const cbor_value& key) const;

    const cbor_value& at(const cbor_value& key) const;

    template <typename TValue>
    TValue at(const cbor_value& key) const { return static_cast<TValue>(at(key)); }

    template <typename TValue>
    std::optional<TValue> try_at(const cbor_value& key) const {
        const cbor_value* value = find(key);
        return value == nullptr
            ? std::optional<TValue>{}
            : std::optional<TValue>{static_cast<TValue>(*value)};
    }

    std::vector<cbor_value> keys() const;

    // Both comparisons ignore insertion order: two maps are equal when they
    // hold the same key/value pairs.
    bool operator==(const cbor_map& rhs) const;
    bool operator<(const cbor_map& rhs) const;

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    std::vector<entry_type> _entries;

    // Key -> position in _entries
    std::map<cbor_value, size_t> _index;
};

}  // namespace cbi
