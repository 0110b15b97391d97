#ifndef TRUETYPE_FONT_H
#define TRUETYPE_FONT_H

#include "IFont.h"
#include <stb/stb_truetype.h>

#include <string>
#include <vector>

// stb_truetype backed font. pixelSize is the em size in pixels; faceIndex
// selects a face inside a .ttc collection.
class TrueTypeFont : public IFont {
public:
    // Throws FontLoadError if the file can't be read or isn't a usable font.
    TrueTypeFont(const std::string& fontPath, float pixelSize, int faceIndex = 0);

    // m_info points into m_buffer.
    TrueTypeFont(const TrueTypeFont&) = delete;
    TrueTypeFont& operator=(const TrueTypeFont&) = delete;

    bool hasGlyph(char32_t codepoint) const override;
    GlyphBitmap rasterize(char32_t codepoint) const override;
    std::string getName() const override;

private:
    std::string m_path;
    float m_pixelSize;
    std::vector<unsigned char> m_buffer;
    stbtt_fontinfo m_info;
    float m_scale = 0.0f;
    int m_ascentPx = 0;
};

#endif // TRUETYPE_FONT_H
