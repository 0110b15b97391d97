// PngSequenceWriter.cpp
//输出编号连续的 png 帧序列

#include "PngSequenceWriter.h"
#include "utils/PathManager.h"

#include <stdexcept>
#include <system_error>
#include <vector>

// --- STB IMPLEMENTATION ---
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h> // For saving PNG

namespace {

vector<unsigned char> expandToRgb(const GrayImage& frame) {
    vector<unsigned char> rgb(frame.pixels.size() * OUTPUT_CHANNELS);
    for (size_t i = 0; i < frame.pixels.size(); ++i) {
        rgb[i * OUTPUT_CHANNELS]     = frame.pixels[i];
        rgb[i * OUTPUT_CHANNELS + 1] = frame.pixels[i];
        rgb[i * OUTPUT_CHANNELS + 2] = frame.pixels[i];
    }
    return rgb;
}

} // end anonymous namespace

PngSequenceWriter::PngSequenceWriter(const std::filesystem::path& outputDir, std::string prefix, int indexWidth)
    : m_outputDir(outputDir), m_prefix(std::move(prefix)), m_indexWidth(indexWidth) {}

std::filesystem::path PngSequenceWriter::framePath(std::size_t frameIndex) const {
    return m_outputDir / PathManager::frameFileName(m_prefix, frameIndex, m_indexWidth, ".png");
}

std::string PngSequenceWriter::framePattern() const {
    return m_prefix + "%0" + std::to_string(m_indexWidth) + "d.png";
}

void PngSequenceWriter::write(std::size_t frameIndex, const GrayImage& frame) {
    if (frame.empty() || frame.pixels.size() != static_cast<size_t>(frame.width) * frame.height) {
        throw std::runtime_error("Invalid frame buffer (" + std::to_string(frame.width) + "x"
                                 + std::to_string(frame.height) + ") for frame " + std::to_string(frameIndex));
    }

    const std::filesystem::path finalPath = framePath(frameIndex);
    std::filesystem::path partialPath = finalPath;
    partialPath += ".partial";

    vector<unsigned char> rgb = expandToRgb(frame);
    if (!stbi_write_png(partialPath.string().c_str(), frame.width, frame.height, OUTPUT_CHANNELS,
                        rgb.data(), frame.width * OUTPUT_CHANNELS)) {
        std::error_code ec;
        std::filesystem::remove(partialPath, ec);
        throw std::runtime_error("Failed to save PNG image to '" + finalPath.string() + "'");
    }

    // Only a completely written file gets the sequence name.
    std::error_code ec;
    std::filesystem::rename(partialPath, finalPath, ec);
    if (ec) {
        const std::string reason = ec.message();
        std::filesystem::remove(partialPath, ec);
        throw std::runtime_error("Failed to move frame into place at '" + finalPath.string() + "': " + reason);
    }
}

std::string PngSequenceWriter::describe() const {
    return "PNG sequence '" + (m_outputDir / framePattern()).string() + "'";
}
