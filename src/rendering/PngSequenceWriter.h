#ifndef PNG_SEQUENCE_WRITER_H
#define PNG_SEQUENCE_WRITER_H

#include "IFrameSink.h"
#include <filesystem>

// Writes frames as <dir>/<prefix><zero-padded index>.png (RGB).
class PngSequenceWriter : public IFrameSink {
public:
    PngSequenceWriter(const std::filesystem::path& outputDir, std::string prefix = "frame_", int indexWidth = 6);

    void write(std::size_t frameIndex, const GrayImage& frame) override;
    std::string describe() const override;

    std::filesystem::path framePath(std::size_t frameIndex) const;
    // printf style pattern for the sequence, e.g. frame_%06d.png
    std::string framePattern() const;

private:
    std::filesystem::path m_outputDir;
    std::string m_prefix;
    int m_indexWidth;
};

#endif // PNG_SEQUENCE_WRITER_H
