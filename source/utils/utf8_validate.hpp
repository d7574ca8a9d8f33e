#ifndef FSMCPS_UTF8_VALIDATE_HPP
#define FSMCPS_UTF8_VALIDATE_HPP

#include <cstddef>
#include <string>

namespace utf8_validate {

// Where and why a byte sequence stopped being valid UTF-8.
struct ValidationResult {
    bool valid = true;
    size_t offset = 0;          // index of the first offending byte
    unsigned char byte = 0;     // value of the first offending byte
    std::string reason;         // "invalid start byte", "invalid continuation byte", "unexpected end of data"
};

// Strict RFC 3629 check: rejects overlong forms, surrogates and code points above U+10FFFF.
ValidationResult validate(const std::string &text);

// Human-readable description of a failed validation, e.g.
// "byte 0xff at offset 3: invalid start byte".
std::string describe(const ValidationResult &result);

} // namespace utf8_validate

#endif // FSMCPS_UTF8_VALIDATE_HPP
