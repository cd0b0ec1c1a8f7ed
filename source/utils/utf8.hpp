#ifndef DOTMCPS_UTF8_HPP
#define DOTMCPS_UTF8_HPP

#include <cstddef>
#include <string>

namespace utf8 {

// Returns true if text is well-formed UTF-8 (no overlong forms, no surrogates,
// nothing above U+10FFFF). On failure, stores the byte offset of the first bad
// sequence in invalid_offset when it is non-null.
bool validate(const std::string &text, std::size_t *invalid_offset = nullptr);

// Replaces invalid UTF-8 sequences with U+FFFD. In-place version.
void sanitize(std::string &text);

// Replaces invalid UTF-8 sequences with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

} // namespace utf8

#endif // DOTMCPS_UTF8_HPP
