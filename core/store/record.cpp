#include "record.hpp"

#include <limits>

namespace squirrel {
namespace store {

std::optional<RecordId> parse_record_id(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }

    constexpr RecordId kMax = std::numeric_limits<RecordId>::max();
    RecordId value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const RecordId digit = c - '0';
        if (value > (kMax - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }

    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace store
}  // namespace squirrel
