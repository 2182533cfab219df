#pragma once

#include <map>
#include <string>

namespace squirrel {
namespace http {

using FormFields = std::map<std::string, std::string>;

/**
 * @brief Decode an application/x-www-form-urlencoded request body
 *
 * Total: never throws and returns an empty map on any malformed input.
 *
 * @param body Raw request body bytes
 * @param content_length Value of the Content-Length header ("" when absent)
 *
 * Rules:
 * - missing, non-numeric or overflowing length -> {}
 * - only the first min(length, body.size()) bytes are decoded
 * - bytes that are not valid UTF-8 -> {}
 * - pairs split on '&'; a pair needs '=' and a non-empty value
 * - '+' is a space, %XX a byte; broken escapes stay literal
 * - decoded bytes that are not valid UTF-8 become U+FFFD
 * - the first occurrence of a key wins
 */
FormFields parse_form_body(const std::string &body, const std::string &content_length);

// Decode a single form component ('+' and %XX)
std::string form_decode(const std::string &text);

bool is_valid_utf8(const std::string &text);

// Replace each maximal ill-formed UTF-8 subpart with U+FFFD
std::string replace_invalid_utf8(const std::string &text);

}  // namespace http
}  // namespace squirrel
