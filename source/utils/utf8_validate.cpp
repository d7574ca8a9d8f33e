#include "utils/utf8_validate.hpp"

#include <cstdio>

namespace utf8_validate {

namespace {

// Returns number of bytes that form a valid UTF-8 lead byte (1-4), or 0 if invalid.
unsigned char utf8_lead_length(unsigned char byte) {
    if (byte < 0x80u) {
        return 1;
    }
    if (byte >= 0xC2u && byte <= 0xDFu) {
        return 2;
    }
    if (byte >= 0xE0u && byte <= 0xEFu) {
        return 3;
    }
    if (byte >= 0xF0u && byte <= 0xF4u) {
        return 4;
    }
    return 0;
}

// Allowed range for the byte right after the lead byte. The narrowed ranges
// after E0, ED, F0 and F4 exclude overlongs, surrogates and values past U+10FFFF.
void second_byte_range(unsigned char lead, unsigned char &low, unsigned char &high) {
    low = 0x80u;
    high = 0xBFu;
    if (lead == 0xE0u) {
        low = 0xA0u;
    } else if (lead == 0xEDu) {
        high = 0x9Fu;
    } else if (lead == 0xF0u) {
        low = 0x90u;
    } else if (lead == 0xF4u) {
        high = 0x8Fu;
    }
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

ValidationResult failure(const unsigned char *begin, const unsigned char *pointer, const char *reason) {
    ValidationResult result;
    result.valid = false;
    result.offset = static_cast<size_t>(pointer - begin);
    result.byte = *pointer;
    result.reason = reason;
    return result;
}

} // namespace

ValidationResult validate(const std::string &text) {
    const unsigned char *begin = reinterpret_cast<const unsigned char *>(text.data());
    const unsigned char *pointer = begin;
    const unsigned char *end = begin + text.size();

    while (pointer < end) {
        unsigned char lead = *pointer;
        unsigned char length = utf8_lead_length(lead);

        if (length == 0) {
            return failure(begin, pointer, "invalid start byte");
        }
        if (length == 1) {
            ++pointer;
            continue;
        }

        unsigned char low = 0;
        unsigned char high = 0;
        second_byte_range(lead, low, high);

        for (unsigned char index = 1; index < length; ++index) {
            if (pointer + index >= end) {
                return failure(begin, pointer, "unexpected end of data");
            }
            unsigned char byte = pointer[index];
            bool in_range = (index == 1) ? (byte >= low && byte <= high) : is_continuation(byte);
            if (!in_range) {
                return failure(begin, pointer, "invalid continuation byte");
            }
        }

        pointer += length;
    }

    return ValidationResult{};
}

std::string describe(const ValidationResult &result) {
    if (result.valid) {
        return "valid UTF-8";
    }
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned int>(result.byte));
    return "byte " + std::string(hex) + " at offset " + std::to_string(result.offset) + ": " + result.reason;
}

} // namespace utf8_validate
