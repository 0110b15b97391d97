// pixel_mapper.cpp
//将灰度像素按亮度映射为字符，生成字符网格。
#include "pixel_mapper.h"
#include "image_converter.h"

#include <algorithm>
#include <stdexcept>

GridSize computeGridSize(const FontMetric& cell, int outputSize) {
    if (!cell.valid()) {
        throw std::invalid_argument("Invalid font metric (" + std::to_string(cell.width) + "x"
                                    + std::to_string(cell.height) + "); grid dimensions are undefined.");
    }
    if (outputSize <= 0) {
        throw std::invalid_argument("Output size must be positive, got " + std::to_string(outputSize));
    }
    GridSize grid{outputSize / cell.width, outputSize / cell.height};
    if (grid.cols <= 0 || grid.rows <= 0) {
        throw std::invalid_argument("Character cell (" + std::to_string(cell.width) + "x" + std::to_string(cell.height)
                                    + ") is larger than the " + std::to_string(outputSize) + "px output.");
    }
    return grid;
}

PixelToCharacterMapper::PixelToCharacterMapper(const Alphabet& alphabet) {
    if (alphabet.empty()) {
        throw std::invalid_argument("Cannot map pixels with an empty alphabet.");
    }
    // Precompute once so mapping is a table lookup per pixel.
    for (int p = 0; p < 256; ++p) {
        size_t index = quantize(static_cast<unsigned char>(p), alphabet.size());
        m_indices[p] = index;
        m_lookup[p] = alphabet[index];
    }
}

size_t PixelToCharacterMapper::quantize(unsigned char pixel, size_t alphabetSize) {
    // Integer form of floor(p / 256 * n).
    size_t index = static_cast<size_t>(pixel) * alphabetSize / 256;
    return std::min(index, alphabetSize - 1);
}

CharacterGrid PixelToCharacterMapper::mapImage(const GrayImage& image, const GridSize& grid) const {
    return mapPixels(resizeGray(image, grid.cols, grid.rows));
}

CharacterGrid PixelToCharacterMapper::mapPixels(const GrayImage& resized) const {
    CharacterGrid result;
    result.reserve(static_cast<size_t>(resized.height));
    for (int y = 0; y < resized.height; ++y) {
        u32string line;
        line.reserve(static_cast<size_t>(resized.width));
        for (int x = 0; x < resized.width; ++x) {
            line.push_back(m_lookup[resized.at(x, y)]);
        }
        result.push_back(std::move(line));
    }
    return result;
}
