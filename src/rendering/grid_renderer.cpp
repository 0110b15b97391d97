// grid_renderer.cpp
//将字符网格渲染为固定尺寸的灰度图（白字黑底）

#include "grid_renderer.h"
#include <stdexcept>
#include <unordered_map>

namespace { // Anonymous namespace for internal helpers

// Glyphs rasterized once per render call; missing glyphs are cached as empty
// bitmaps so they render as background.
class GlyphCache {
public:
    explicit GlyphCache(const IFont& font) : m_font(font) {}

    const GlyphBitmap& get(char32_t c) {
        auto it = m_glyphs.find(c);
        if (it != m_glyphs.end()) return it->second;

        GlyphBitmap bitmap;
        if (m_font.hasGlyph(c)) {
            bitmap = m_font.rasterize(c);
        }
        return m_glyphs.emplace(c, std::move(bitmap)).first->second;
    }

private:
    const IFont& m_font;
    std::unordered_map<char32_t, GlyphBitmap> m_glyphs;
};

} // end anonymous namespace

CharacterGridRenderer::CharacterGridRenderer(const IFont& font, const FontMetric& cell, int outputSize)
    : m_font(font), m_cell(cell), m_outputSize(outputSize) {
    if (!cell.valid()) {
        throw std::invalid_argument("Invalid cell metric (" + std::to_string(cell.width) + "x" + std::to_string(cell.height) + ") for rendering.");
    }
    if (outputSize <= 0) {
        throw std::invalid_argument("Output size must be positive, got " + std::to_string(outputSize));
    }
}

BlockPlacement CharacterGridRenderer::placeBlock(int cols, int rows) const {
    BlockPlacement placement;
    placement.blockWidth = cols * m_cell.width;
    placement.blockHeight = rows * m_cell.height;
    placement.xOffset = floorDiv(m_outputSize - placement.blockWidth, 2);
    placement.yOffset = floorDiv(m_outputSize - placement.blockHeight, 2);
    return placement;
}

GrayImage CharacterGridRenderer::render(const CharacterGrid& grid) const {
    if (grid.empty()) {
        throw std::invalid_argument("Cannot render an empty character grid.");
    }
    const size_t cols = grid[0].size();
    for (size_t row = 1; row < grid.size(); ++row) {
        if (grid[row].size() != cols) {
            throw std::logic_error("Character grid is not rectangular: row " + std::to_string(row) + " has "
                                   + std::to_string(grid[row].size()) + " cells, expected " + std::to_string(cols));
        }
    }
    // Only reached when every row is empty.
    if (cols == 0) {
        throw std::invalid_argument("Cannot render an empty character grid.");
    }

    BlockPlacement placement = placeBlock(static_cast<int>(cols), static_cast<int>(grid.size()));
    GrayImage output(m_outputSize, m_outputSize, 0);
    GlyphCache cache(m_font);

    int currentY = placement.yOffset;
    for (const auto& line : grid) {
        int currentX = placement.xOffset;
        for (char32_t c : line) {
            if (c != SPACE_CHAR) {
                blitGlyph(output, cache.get(c), currentX, currentY, 255);
            }
            currentX += m_cell.width;
        }
        currentY += m_cell.height;
    }
    return output;
}
