#ifndef IMAGE_DIRECTORY_SOURCE_H
#define IMAGE_DIRECTORY_SOURCE_H

#include "IFrameSource.h"
#include <filesystem>
#include <vector>

// Frames from a single image file, or from every supported image in a
// directory sorted by file name. Images are decoded on demand.
class ImageDirectorySource : public IFrameSource {
public:
    // maxFrames == 0 means no limit.
    explicit ImageDirectorySource(const std::filesystem::path& inputPath, std::size_t maxFrames = 0);

    std::optional<Frame> next() override;
    std::optional<std::size_t> sizeHint() const override { return m_files.size(); }
    std::string describe() const override;

    const std::vector<std::filesystem::path>& getFiles() const { return m_files; }
    std::size_t getTotalFound() const { return m_totalFound; }

    static std::vector<std::filesystem::path> findImages(const std::filesystem::path& inputPath);

private:
    std::filesystem::path m_inputPath;
    std::vector<std::filesystem::path> m_files;
    std::size_t m_totalFound = 0;
    std::size_t m_position = 0;
};

#endif // IMAGE_DIRECTORY_SOURCE_H
