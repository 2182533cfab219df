#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace squirrel {
namespace store {

using RecordId = int64_t;

// A stored squirrel. The id is assigned by the store on insert and never reused.
struct Record {
    RecordId id = 0;
    std::string name;
    std::string size;
};

inline bool operator==(const Record &a, const Record &b) {
    return a.id == b.id && a.name == b.name && a.size == b.size;
}

inline bool operator!=(const Record &a, const Record &b) { return !(a == b); }

/**
 * @brief Convert a path segment to a record id
 *
 * Accepts a non-empty run of ASCII digits that fits in RecordId and is > 0.
 * Everything else (signs, whitespace, hex, overflow) yields nullopt, which
 * callers treat the same as an id that is not stored.
 */
std::optional<RecordId> parse_record_id(const std::string &text);

}  // namespace store
}  // namespace squirrel
