// image_converter.h
#ifndef IMAGE_CONVERTER_H
#define IMAGE_CONVERTER_H

#include "common_types.h" // Includes vector, string, GrayImage, path etc.
#include <filesystem>
#include <optional> // To return result or indicate error

// Loads any supported image file as 8-bit grayscale.
// Returns nullopt on failure (the reason is printed).
std::optional<GrayImage> loadGrayImage(const std::filesystem::path& imagePath);

// Wraps an interleaved 8-bit buffer (1, 3 or 4 channels) as grayscale using
// Rec.601 luma weights. Throws std::invalid_argument on bad dimensions.
GrayImage toGrayImage(const unsigned char* data, int width, int height, int channels);

// Area-correct (box filter) resize. Throws std::invalid_argument for empty
// input or non-positive target size, std::runtime_error if resampling fails.
GrayImage resizeGray(const GrayImage& source, int targetWidth, int targetHeight);

#endif // IMAGE_CONVERTER_H
