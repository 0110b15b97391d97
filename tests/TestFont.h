#ifndef TEST_FONT_H
#define TEST_FONT_H

#include "font/IFont.h"

#include <map>
#include <set>
#include <string>

// In-memory font for tests. Every glyph is a solid block of the given size and
// coverage, placed at (xOffset, yOffset) from the draw origin. 'W' defaults to
// an 8x12 block so the cell metric is 8x12; space has no ink.
class TestFont : public IFont {
public:
    TestFont() {
        define(U'W', 8, 12);
        define(U' ', 0, 0);
    }

    void define(char32_t c, int width, int height, int xOffset = 0, int yOffset = 0, unsigned char coverage = 255) {
        GlyphBitmap glyph;
        glyph.width = width;
        glyph.height = height;
        glyph.xOffset = xOffset;
        glyph.yOffset = yOffset;
        glyph.coverage.assign(static_cast<size_t>(width > 0 ? width : 0) * static_cast<size_t>(height > 0 ? height : 0), coverage);
        m_glyphs[c] = glyph;
    }

    // The glyph is reported missing and rasterize() throws for it.
    void markUnrenderable(char32_t c) { m_unrenderable.insert(c); }

    bool hasGlyph(char32_t c) const override {
        return m_glyphs.count(c) > 0 && m_unrenderable.count(c) == 0;
    }

    GlyphBitmap rasterize(char32_t c) const override {
        if (!hasGlyph(c)) {
            throw GlyphRenderError("test font has no glyph " + std::to_string(static_cast<unsigned long>(c)));
        }
        return m_glyphs.at(c);
    }

    std::string getName() const override { return "test-font"; }

private:
    std::map<char32_t, GlyphBitmap> m_glyphs;
    std::set<char32_t> m_unrenderable;
};

#endif // TEST_FONT_H
