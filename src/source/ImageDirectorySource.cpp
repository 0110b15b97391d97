#include "ImageDirectorySource.h"
#include "conversion/image_converter.h"
#include "core/pipeline_error.h"

#include <algorithm>

ImageDirectorySource::ImageDirectorySource(const std::filesystem::path& inputPath, std::size_t maxFrames)
    : m_inputPath(inputPath), m_files(findImages(inputPath)) {
    m_totalFound = m_files.size();
    if (maxFrames > 0 && m_files.size() > maxFrames) {
        m_files.resize(maxFrames);
    }
}

std::vector<std::filesystem::path> ImageDirectorySource::findImages(const std::filesystem::path& inputPath) {
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    if (std::filesystem::is_regular_file(inputPath, ec)) {
        if (isImageFile(inputPath)) {
            files.push_back(inputPath);
        }
        return files;
    }
    if (!std::filesystem::is_directory(inputPath, ec)) {
        return files;
    }

    for (const auto& entry : std::filesystem::directory_iterator(inputPath)) {
        if (entry.is_regular_file() && isImageFile(entry.path())) {
            files.push_back(entry.path());
        }
    }
    // Zero-padded names make lexicographic order the temporal order.
    std::sort(files.begin(), files.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return a.filename().string() < b.filename().string();
              });
    return files;
}

std::optional<Frame> ImageDirectorySource::next() {
    if (m_position >= m_files.size()) {
        return std::nullopt;
    }

    const std::size_t index = m_position++;
    const auto& file = m_files[index];

    auto image = loadGrayImage(file);
    if (!image) {
        throw PipelineError(PipelineStage::LOADING, index, file.filename().string(), "could not decode image");
    }

    Frame frame;
    frame.index = index;
    frame.label = file.filename().string();
    frame.image = std::move(*image);
    return frame;
}

std::string ImageDirectorySource::describe() const {
    return "images from '" + m_inputPath.string() + "'";
}
