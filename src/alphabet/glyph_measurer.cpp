// glyph_measurer.cpp
#include "glyph_measurer.h"
#include "utils/utf8.h"

#include <iostream>
#include <stdexcept>

GlyphBrightnessMeasurer::GlyphBrightnessMeasurer(const IFont& font, int canvasSize)
    : m_font(font), m_canvasSize(canvasSize) {
    if (canvasSize <= 0) {
        throw std::invalid_argument("Measurement canvas size must be positive, got " + std::to_string(canvasSize));
    }
}

GlyphMeasurement GlyphBrightnessMeasurer::measure(char32_t character) const {
    GlyphMeasurement result;
    result.character = character;

    GlyphBitmap glyph;
    try {
        glyph = m_font.rasterize(character);
    } catch (const GlyphRenderError& e) {
        // A single bad glyph must not abort an alphabet build: it is scored as black.
        std::cerr << "Warning: Could not render glyph " << Utf8::describe(character)
                  << " ('" << Utf8::encode(character) << "'): " << e.what()
                  << ". Scoring it as brightness 0." << std::endl;
        result.renderFailed = true;
        return result;
    }

    GrayImage canvas(m_canvasSize, m_canvasSize, 0);

    // Center the ink box; subtracting the box origin corrects for glyphs whose
    // box doesn't start at the draw origin.
    int x = floorDiv(m_canvasSize - glyph.width, 2) - glyph.xOffset;
    int y = floorDiv(m_canvasSize - glyph.height, 2) - glyph.yOffset;
    blitGlyph(canvas, glyph, x, y, 255);

    result.brightness = canvas.mean();
    return result;
}
