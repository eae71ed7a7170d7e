#include "utils/utf8_sanitize.hpp"

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at pointer, or 0 if ill-formed.
// Follows the byte ranges of Unicode table 3-7.
std::size_t sequence_length(const unsigned char *pointer, const unsigned char *end) {
    const unsigned char lead = pointer[0];
    if (lead < 0x80u) {
        return 1;
    }

    std::size_t length = 0;
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

    if (static_cast<std::size_t>(end - pointer) < length) {
        return 0;
    }
    if (pointer[1] < second_low || pointer[1] > second_high) {
        return 0;
    }
    for (std::size_t index = 2; index < length; ++index) {
        if ((pointer[index] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid(const std::string &text) {
    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();
    while (pointer < end) {
        std::size_t length = sequence_length(pointer, end);
        if (length == 0) {
            return false;
        }
        pointer += length;
    }
    return true;
}

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + 8);

    const unsigned char *pointer = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *end = pointer + text.size();

    while (pointer < end) {
        std::size_t length = sequence_length(pointer, end);
        if (length == 0) {
            result += kReplacement;
            ++pointer;
            continue;
        }
        result.append(reinterpret_cast<const char *>(pointer), length);
        pointer += length;
    }

    text = std::move(result);
}

std::string sanitized(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

std::string truncate_for_log(const std::string &text, std::size_t max_bytes) {
    std::string clean = sanitized(text);
    if (clean.size() <= max_bytes) {
        return clean;
    }

    std::size_t cut = max_bytes;
    // Back up over continuation bytes so the cut lands on a lead byte.
    while (cut > 0 && (static_cast<unsigned char>(clean[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    return clean.substr(0, cut) + "...";
}

} // namespace utf8_sanitize
