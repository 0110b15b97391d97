// pixel_mapper.h
#ifndef PIXEL_MAPPER_H
#define PIXEL_MAPPER_H

#include "common_types.h"
#include "alphabet/alphabet.h"
#include <array>

// Grid that fills outputSize x outputSize with cells of the given metric.
// Throws std::invalid_argument for a non-positive metric or a grid with no
// rows or columns.
GridSize computeGridSize(const FontMetric& cell, int outputSize = OUTPUT_SIZE);

// Maps grayscale pixels to alphabet characters by quantized brightness.
class PixelToCharacterMapper {
public:
    // Throws std::invalid_argument for an empty alphabet.
    explicit PixelToCharacterMapper(const Alphabet& alphabet);

    // floor(p / 256 * n), clamped to n - 1. Requires n >= 1.
    static size_t quantize(unsigned char pixel, size_t alphabetSize);

    char32_t mapPixel(unsigned char pixel) const { return m_lookup[pixel]; }
    size_t indexOf(unsigned char pixel) const { return m_indices[pixel]; }

    // Box-filters the image down to grid.cols x grid.rows and maps each pixel.
    CharacterGrid mapImage(const GrayImage& image, const GridSize& grid) const;

    // Maps an image that already has the grid's dimensions.
    CharacterGrid mapPixels(const GrayImage& resized) const;

private:
    std::array<char32_t, 256> m_lookup{};
    std::array<size_t, 256> m_indices{};
};

#endif // PIXEL_MAPPER_H
