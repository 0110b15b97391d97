#ifndef UTF8_H
#define UTF8_H

#include <stdexcept>
#include <string>

namespace Utf8 {

    class DecodeError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Throws DecodeError on malformed input (bad lead byte, truncated sequence,
    // overlong form, surrogate or out-of-range code point).
    std::u32string decode(const std::string& text);

    std::string encode(const std::u32string& codepoints);
    std::string encode(char32_t codepoint);

    // "U+0041" style label, used in diagnostics.
    std::string describe(char32_t codepoint);

} // namespace Utf8

#endif // UTF8_H
