#include "form.hpp"

#include <cstddef>
#include <limits>

namespace squirrel {
namespace http {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Strict decimal parse of a Content-Length value; surrounding blanks are allowed
bool parse_length(const std::string &text, size_t &length) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return false;
    }
    const auto end = text.find_last_not_of(" \t");

    size_t value = 0;
    for (size_t i = begin; i <= end; ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        const size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }

    length = value;
    return true;
}

constexpr const char *kReplacementCharacter = "\xEF\xBF\xBD";  // U+FFFD

// Length of the well-formed UTF-8 sequence at text[pos], or 0 when it is
// ill-formed. On 0, `invalid` is the length of the maximal ill-formed subpart
// (at least 1), which is replaced as a unit.
size_t utf8_sequence(const std::string &text, size_t pos, size_t &invalid) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0x80) {
        return 1;
    }

    size_t extra = 0;
    unsigned char low = 0x80;
    unsigned char high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        extra = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        extra = 2;
        if (lead == 0xE0) {
            low = 0xA0;  // overlong
        } else if (lead == 0xED) {
            high = 0x9F;  // surrogates
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        extra = 3;
        if (lead == 0xF0) {
            low = 0x90;  // overlong
        } else if (lead == 0xF4) {
            high = 0x8F;  // above U+10FFFF
        }
    } else {
        invalid = 1;
        return 0;
    }

    for (size_t k = 1; k <= extra; ++k) {
        if (pos + k >= text.size()) {
            invalid = k;
            return 0;
        }
        const auto c = static_cast<unsigned char>(text[pos + k]);
        if (c < low || c > high) {
            invalid = k;
            return 0;
        }
        low = 0x80;
        high = 0xBF;
    }
    return extra + 1;
}

}  // namespace

bool is_valid_utf8(const std::string &text) {
    size_t i = 0;
    while (i < text.size()) {
        size_t invalid = 0;
        const size_t length = utf8_sequence(text, i, invalid);
        if (length == 0) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string replace_invalid_utf8(const std::string &text) {
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        size_t invalid = 0;
        const size_t length = utf8_sequence(text, i, invalid);
        if (length == 0) {
            result += kReplacementCharacter;
            i += invalid;
        } else {
            result.append(text, i, length);
            i += length;
        }
    }
    return result;
}

std::string form_decode(const std::string &text) {
    std::string decoded;
    decoded.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            decoded.push_back(' ');
        } else if (c == '%' && i + 2 < text.size() && hex_value(text[i + 1]) >= 0 && hex_value(text[i + 2]) >= 0) {
            decoded.push_back(static_cast<char>(hex_value(text[i + 1]) * 16 + hex_value(text[i + 2])));
            i += 2;
        } else {
            decoded.push_back(c);
        }
    }
    return decoded;
}

FormFields parse_form_body(const std::string &body, const std::string &content_length) {
    FormFields fields;

    size_t length = 0;
    if (!parse_length(content_length, length)) {
        return fields;
    }

    const std::string raw = body.substr(0, length < body.size() ? length : body.size());
    if (!is_valid_utf8(raw)) {
        return fields;
    }

    size_t pos = 0;
    while (pos <= raw.size()) {
        auto amp = raw.find('&', pos);
        if (amp == std::string::npos) {
            amp = raw.size();
        }
        const std::string pair = raw.substr(pos, amp - pos);
        pos = amp + 1;

        const auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string value = replace_invalid_utf8(form_decode(pair.substr(eq + 1)));
        if (value.empty()) {
            continue;
        }
        std::string key = replace_invalid_utf8(form_decode(pair.substr(0, eq)));

        // emplace keeps the first value for repeated keys
        fields.emplace(std::move(key), std::move(value));
    }
    return fields;
}

}  // namespace http
}  // namespace squirrel
