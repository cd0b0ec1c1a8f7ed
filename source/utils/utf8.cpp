#include "utils/utf8.hpp"

#include <utility>

namespace utf8 {

namespace {

const unsigned char kReplacementUtf8[] = { 0xEF, 0xBF, 0xBD }; // U+FFFD in UTF-8
constexpr std::size_t kReplacementLength = sizeof(kReplacementUtf8);

bool in_range(unsigned char byte, unsigned char low, unsigned char high) {
    return byte >= low && byte <= high;
}

// Length of the well-formed sequence starting at pointer, or 0 if it is not one.
// Second-byte ranges follow the Unicode well-formed byte sequence table.
std::size_t sequence_length(const unsigned char *pointer, const unsigned char *end) {
    unsigned char lead = pointer[0];
    std::size_t available = static_cast<std::size_t>(end - pointer);

    if (lead < 0x80u) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;
    if (in_range(lead, 0xC2u, 0xDFu)) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu;
    } else if (in_range(lead, 0xE1u, 0xEFu)) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu;
    } else if (in_range(lead, 0xF1u, 0xF3u)) {
        length = 4;
    } else {
        return 0;
    }

    if (available < length || !in_range(pointer[1], second_low, second_high)) {
        return 0;
    }
    for (std::size_t index = 2; index < length; ++index) {
        if (!in_range(pointer[index], 0x80u, 0xBFu)) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool validate(const std::string &text, std::size_t *invalid_offset) {
    const unsigned char *begin = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = begin + text.size();
    const unsigned char *pointer = begin;

    while (pointer < end) {
        std::size_t length = sequence_length(pointer, end);
        if (length == 0) {
            if (invalid_offset != nullptr) {
                *invalid_offset = static_cast<std::size_t>(pointer - begin);
            }
            return false;
        }
        pointer += length;
    }
    return true;
}

void sanitize(std::string &text) {
    if (validate(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size());

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        std::size_t length = sequence_length(pointer, end);
        if (length == 0) {
            result.append(reinterpret_cast<const char *>(kReplacementUtf8), kReplacementLength);
            ++pointer;
            continue;
        }
        result.append(reinterpret_cast<const char *>(pointer), length);
        pointer += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

} // namespace utf8
