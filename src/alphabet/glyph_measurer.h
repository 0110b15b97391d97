// glyph_measurer.h
#ifndef GLYPH_MEASURER_H
#define GLYPH_MEASURER_H

#include "common_types.h"
#include "font/IFont.h"

struct GlyphMeasurement {
    char32_t character = 0;
    double brightness = 0.0;  // Mean of the canvas, 0..255
    bool renderFailed = false; // Scored as 0 because the glyph could not be drawn
};

// Renders one glyph centered on a black canvasSize x canvasSize canvas and
// reports the mean luminance.
class GlyphBrightnessMeasurer {
public:
    explicit GlyphBrightnessMeasurer(const IFont& font, int canvasSize = DEFAULT_MEASURE_CANVAS_SIZE);

    GlyphMeasurement measure(char32_t character) const;

    const IFont& getFont() const { return m_font; }

private:
    const IFont& m_font;
    int m_canvasSize;
};

#endif // GLYPH_MEASURER_H
