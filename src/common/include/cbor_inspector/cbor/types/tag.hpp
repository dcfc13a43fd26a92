#pragma once

#include <cbor_inspector/cbor/detail.hpp>

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

namespace cbi {

class binary_reader;
class cbor_value;

// A semantic tag number and the single item it wraps. The tag number is kept
// as-is; no tag is given any special interpretation.
class cbor_tag {
public:
    cbor_tag(binary_reader& reader, const cbor_parse_state& state);
    cbor_tag(uint64_t tag, cbor_value item);

    cbor_tag(const cbor_tag& other);
    cbor_tag& operator=(const cbor_tag& other);
    cbor_tag(cbor_tag&& other) noexcept;
    cbor_tag& operator=(cbor_tag&& other) noexcept;
    ~cbor_tag();

    uint64_t tag() const { return _tag; }

    // A moved-from tag wraps null
    const cbor_value& item() const;

    bool operator==(const cbor_tag& rhs) const;
    bool operator<(const cbor_tag& rhs) const;

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

private:
    uint64_t _tag;
    std::unique_ptr<cbor_value> _item;
};

}  // namespace cbi
