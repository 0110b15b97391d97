// font_utils.cpp
// IFont 之上的通用辅助函数：字形合成与字符单元尺寸。
#include "IFont.h"
#include "utils/utf8.h"

#include <algorithm>
#include <stdexcept>

void blitGlyph(GrayImage& canvas, const GlyphBitmap& glyph, int x, int y, unsigned char intensity) {
    if (glyph.empty() || canvas.empty()) return;

    const int left = x + glyph.xOffset;
    const int top = y + glyph.yOffset;

    const int startX = std::max(0, -left);
    const int startY = std::max(0, -top);
    const int endX = std::min(glyph.width, canvas.width - left);
    const int endY = std::min(glyph.height, canvas.height - top);

    for (int gy = startY; gy < endY; ++gy) {
        const unsigned char* src = glyph.coverage.data() + static_cast<size_t>(gy) * glyph.width;
        for (int gx = startX; gx < endX; ++gx) {
            unsigned char alpha = src[gx];
            if (alpha == 0) continue;
            unsigned char value = static_cast<unsigned char>((alpha * intensity + 127) / 255);
            unsigned char& dst = canvas.at(left + gx, top + gy);
            dst = std::max(dst, value);
        }
    }
}

FontMetric measureFontMetric(const IFont& font, char32_t reference) {
    GlyphBitmap glyph = font.rasterize(reference);
    FontMetric metric{glyph.width, glyph.height};
    if (!metric.valid()) {
        throw std::invalid_argument("Font '" + font.getName() + "' yields an empty bounding box for reference glyph "
                                    + Utf8::describe(reference) + "; cell size is undefined.");
    }
    return metric;
}
