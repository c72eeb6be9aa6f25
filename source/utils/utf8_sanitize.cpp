#include "utils/utf8_sanitize.hpp"

#include <cstddef>

namespace utf8_sanitize {

namespace {

const char kReplacementUtf8[] = "\xEF\xBF\xBD"; // U+FFFD
constexpr size_t kReplacementLength = sizeof(kReplacementUtf8) - 1;

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

// Length of the well-formed sequence starting at pointer, or 0 if it is ill-formed.
// Bounds for the second byte follow the Unicode table of well-formed byte sequences.
size_t sequence_length(const unsigned char *pointer, const unsigned char *end) {
    unsigned char lead = pointer[0];
    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_low = 0x80u;
    unsigned char second_high = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead == 0xE0u) {
        length = 3;
        second_low = 0xA0u;
    } else if (lead == 0xEDu) {
        length = 3;
        second_high = 0x9Fu;
    } else if (lead >= 0xE1u && lead <= 0xEFu) {
        length = 3;
    } else if (lead == 0xF0u) {
        length = 4;
        second_low = 0x90u;
    } else if (lead == 0xF4u) {
        length = 4;
        second_high = 0x8Fu;
    } else if (lead >= 0xF1u && lead <= 0xF3u) {
        length = 4;
    } else {
        return 0;
    }

    if (static_cast<size_t>(end - pointer) < length) {
        return 0;
    }
    if (pointer[1] < second_low || pointer[1] > second_high) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if (!is_continuation(pointer[index])) {
            return 0;
        }
    }
    return length;
}

} // namespace

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + kReplacementLength);

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        size_t length = sequence_length(pointer, end);
        if (length == 0) {
            result.append(kReplacementUtf8, kReplacementLength);
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

bool is_valid(const std::string &text) {
    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();
    while (pointer < end) {
        size_t length = sequence_length(pointer, end);
        if (length == 0) {
            return false;
        }
        pointer += length;
    }
    return true;
}

} // namespace utf8_sanitize
