#ifndef IFONT_H
#define IFONT_H

#include "common_types.h"
#include <stdexcept>
#include <string>
#include <vector>

class GlyphRenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FontLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Coverage bitmap of one glyph. The offsets place the bitmap relative to the
// draw origin, which is the top-left corner of the line box (ascender line),
// so (xOffset, yOffset, xOffset + width, yOffset + height) is the glyph's
// bounding box for a glyph drawn at (0, 0).
struct GlyphBitmap {
    int width = 0;
    int height = 0;
    int xOffset = 0;
    int yOffset = 0;
    vector<unsigned char> coverage;

    bool empty() const { return width <= 0 || height <= 0; }
};

class IFont {
public:
    virtual ~IFont() = default;

    virtual bool hasGlyph(char32_t codepoint) const = 0;

    // Throws GlyphRenderError when the glyph cannot be produced. A glyph with
    // no ink (space) yields an empty bitmap. Must be safe to call concurrently.
    virtual GlyphBitmap rasterize(char32_t codepoint) const = 0;

    virtual std::string getName() const = 0;
};

// Composites a glyph into the canvas with its draw origin at (x, y). Pixels
// outside the canvas are clipped; overlapping ink keeps the brighter value.
void blitGlyph(GrayImage& canvas, const GlyphBitmap& glyph, int x, int y, unsigned char intensity = 255);

// Cell size from the reference glyph's bounding box. Throws std::invalid_argument
// if either dimension is not positive.
FontMetric measureFontMetric(const IFont& font, char32_t reference = METRIC_REFERENCE_CHAR);

#endif // IFONT_H
