// grid_renderer.h
#ifndef GRID_RENDERER_H
#define GRID_RENDERER_H

#include "common_types.h"
#include "font/IFont.h"

struct BlockPlacement {
    int xOffset = 0; // May be negative when the block is wider than the output
    int yOffset = 0;
    int blockWidth = 0;
    int blockHeight = 0;
};

// Draws a character grid white-on-black, one glyph per cell, with the whole
// text block centered in a square outputSize x outputSize raster.
class CharacterGridRenderer {
public:
    CharacterGridRenderer(const IFont& font, const FontMetric& cell, int outputSize = OUTPUT_SIZE);

    // Throws std::invalid_argument for an empty grid and std::logic_error for a
    // grid whose rows differ in length.
    GrayImage render(const CharacterGrid& grid) const;

    BlockPlacement placeBlock(int cols, int rows) const;

    const FontMetric& getCellMetric() const { return m_cell; }

private:
    const IFont& m_font;
    FontMetric m_cell;
    int m_outputSize;
};

#endif // GRID_RENDERER_H
