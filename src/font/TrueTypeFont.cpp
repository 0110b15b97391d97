// TrueTypeFont.cpp
// 使用 stb_truetype 加载字体并光栅化单个字形。

#include "TrueTypeFont.h"
#include "utils/utf8.h"

// --- STB IMPLEMENTATION ---
// The header part is already included through TrueTypeFont.h.
#define STB_TRUETYPE_IMPLEMENTATION
#include <stb/stb_truetype.h>

#include <cmath>
#include <filesystem>
#include <iostream>

TrueTypeFont::TrueTypeFont(const std::string& fontPath, float pixelSize, int faceIndex)
    : m_path(fontPath), m_pixelSize(pixelSize), m_info{} {
    if (pixelSize <= 0.0f) {
        throw FontLoadError("Invalid font size " + std::to_string(pixelSize) + " for font: " + fontPath);
    }

    std::cout << "Loading font file: " << fontPath << " ..." << std::endl;
    m_buffer = readFileBytes(fontPath);
    if (m_buffer.empty()) {
        throw FontLoadError("Font file buffer is empty or could not be read: " + fontPath);
    }

    int offset = stbtt_GetFontOffsetForIndex(m_buffer.data(), faceIndex);
    if (offset < 0) {
        throw FontLoadError("Font face index " + std::to_string(faceIndex) + " not present in: " + fontPath);
    }
    if (!stbtt_InitFont(&m_info, m_buffer.data(), offset)) {
        throw FontLoadError("Failed to initialize font: " + fontPath);
    }

    m_scale = stbtt_ScaleForMappingEmToPixels(&m_info, pixelSize);
    if (m_scale <= 0.0f) {
        throw FontLoadError("Calculated font scale is invalid for font size " + std::to_string(pixelSize));
    }

    int ascent, descent, lineGap;
    stbtt_GetFontVMetrics(&m_info, &ascent, &descent, &lineGap);
    m_ascentPx = static_cast<int>(std::round(ascent * m_scale));

    std::cout << "Font loaded successfully: " << fontPath << std::endl;
}

bool TrueTypeFont::hasGlyph(char32_t codepoint) const {
    return stbtt_FindGlyphIndex(&m_info, static_cast<int>(codepoint)) != 0;
}

GlyphBitmap TrueTypeFont::rasterize(char32_t codepoint) const {
    int glyphIndex = stbtt_FindGlyphIndex(&m_info, static_cast<int>(codepoint));
    if (glyphIndex == 0) {
        throw GlyphRenderError("Glyph " + Utf8::describe(codepoint) + " is missing from font " + getName());
    }

    int x0, y0, x1, y1;
    stbtt_GetGlyphBitmapBox(&m_info, glyphIndex, m_scale, m_scale, &x0, &y0, &x1, &y1);

    GlyphBitmap glyph;
    glyph.xOffset = x0;
    glyph.yOffset = m_ascentPx + y0; // y0 is relative to the baseline
    if (x1 <= x0 || y1 <= y0) {
        return glyph; // No ink, e.g. space.
    }

    glyph.width = x1 - x0;
    glyph.height = y1 - y0;
    glyph.coverage.assign(static_cast<size_t>(glyph.width) * glyph.height, 0);
    stbtt_MakeGlyphBitmap(&m_info, glyph.coverage.data(), glyph.width, glyph.height, glyph.width,
                          m_scale, m_scale, glyphIndex);
    return glyph;
}

std::string TrueTypeFont::getName() const {
    return std::filesystem::path(m_path).filename().string() + "@" + std::to_string(static_cast<int>(m_pixelSize)) + "px";
}
