// image_converter.cpp
//将输入的图像文件读取为灰度图，并缩放到字符网格尺寸。
#include "image_converter.h"
#include <iostream>
#include <memory> // For unique_ptr
#include <stdexcept>

// Define STB_IMAGE_IMPLEMENTATION in exactly one .cpp file
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h> // Image loading functions

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include <stb/stb_image_resize2.h>

namespace { // Use an anonymous namespace for internal helper functions

using StbImagePtr = std::unique_ptr<unsigned char, void(*)(void*)>;

// Loads an image using stb_image, converted to a single channel by stb.
// Returns nullptr on failure.
StbImagePtr loadImage(const std::string& imagePath, int& width, int& height) {
    unsigned char *data = stbi_load(imagePath.c_str(), &width, &height, nullptr, 1);
    if (data == nullptr) {
        std::cerr << "Error: Failed to load image '" << imagePath << "'. Reason: " << stbi_failure_reason() << std::endl;
        return StbImagePtr(nullptr, stbi_image_free);
    }
    return StbImagePtr(data, stbi_image_free);
}

} // end anonymous namespace

// --- Public Function Implementation ---

std::optional<GrayImage> loadGrayImage(const std::filesystem::path& imagePath) {
    int width = 0, height = 0;
    auto imgDataPtr = loadImage(imagePath.string(), width, height);
    if (!imgDataPtr) {
        return std::nullopt;
    }
    if (width <= 0 || height <= 0) {
        std::cerr << "Error: Image '" << imagePath.filename().string() << "' has invalid dimensions ("
                  << width << "x" << height << ")." << std::endl;
        return std::nullopt;
    }
    return toGrayImage(imgDataPtr.get(), width, height, 1);
}

GrayImage toGrayImage(const unsigned char* data, int width, int height, int channels) {
    if (!data || width <= 0 || height <= 0) {
        throw std::invalid_argument("Invalid image buffer (" + std::to_string(width) + "x" + std::to_string(height) + ")");
    }
    if (channels != 1 && channels != 3 && channels != 4) {
        throw std::invalid_argument("Unsupported number of channels: " + std::to_string(channels));
    }

    GrayImage image(width, height);
    const size_t count = static_cast<size_t>(width) * height;
    for (size_t i = 0; i < count; ++i) {
        const unsigned char* px = data + i * channels;
        if (channels == 1) {
            image.pixels[i] = px[0];
        } else {
            // ITU-R 601-2 luma, same weights as a typical "L" conversion
            image.pixels[i] = static_cast<unsigned char>((px[0] * 299 + px[1] * 587 + px[2] * 114 + 500) / 1000);
        }
    }
    return image;
}

GrayImage resizeGray(const GrayImage& source, int targetWidth, int targetHeight) {
    if (source.empty()) {
        throw std::invalid_argument("Cannot resize an empty image.");
    }
    if (targetWidth <= 0 || targetHeight <= 0) {
        throw std::invalid_argument("Invalid resize target (" + std::to_string(targetWidth) + "x" + std::to_string(targetHeight) + ")");
    }

    GrayImage result(targetWidth, targetHeight);
    void* resized = stbir_resize(
        source.pixels.data(), source.width, source.height, source.width,   // Input
        result.pixels.data(), targetWidth, targetHeight, targetWidth,       // Output
        STBIR_1CHANNEL,        // Pixel Layout
        STBIR_TYPE_UINT8,      // Datatype
        STBIR_EDGE_CLAMP,      // Edge Mode
        STBIR_FILTER_BOX       // Filter (area average, no aliasing)
    );
    if (!resized) {
        throw std::runtime_error("Failed to resize image using stbir_resize.");
    }
    return result;
}
