#include "utf8.h"

#include <iomanip>
#include <sstream>

namespace Utf8 {

std::u32string decode(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        int extra = 0;
        char32_t minValue = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F; extra = 1; minValue = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F; extra = 2; minValue = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07; extra = 3; minValue = 0x10000;
        } else {
            throw DecodeError("invalid UTF-8 lead byte at offset " + std::to_string(i));
        }

        if (i + static_cast<size_t>(extra) >= text.size() && extra > 0) {
            throw DecodeError("truncated UTF-8 sequence at offset " + std::to_string(i));
        }
        for (int k = 1; k <= extra; ++k) {
            unsigned char cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                throw DecodeError("invalid UTF-8 continuation byte at offset " + std::to_string(i + k));
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (extra > 0 && cp < minValue) {
            throw DecodeError("overlong UTF-8 sequence at offset " + std::to_string(i));
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            throw DecodeError("invalid code point at offset " + std::to_string(i));
        }

        result.push_back(cp);
        i += static_cast<size_t>(extra) + 1;
    }
    return result;
}

std::string encode(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

std::string encode(const std::u32string& codepoints) {
    std::string out;
    out.reserve(codepoints.size());
    for (char32_t cp : codepoints) {
        out += encode(cp);
    }
    return out;
}

std::string describe(char32_t codepoint) {
    std::ostringstream ss;
    ss << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
       << static_cast<unsigned long>(codepoint);
    return ss.str();
}

} // namespace Utf8
