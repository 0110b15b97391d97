#ifndef ALPHABET_BUILDER_H
#define ALPHABET_BUILDER_H

#include "alphabet/alphabet.h"
#include "alphabet/glyph_measurer.h"
#include <filesystem>

namespace AlphabetBuilder {

    struct BatchResult {
        int processedCount = 0;
        int failedCount = 0;
    };

    // Reads candidates from inputPath, sorts them and writes the asset.
    // Returns false (reason printed) if the input or output fails.
    bool sortFile(const std::filesystem::path& inputPath,
                  const std::filesystem::path& outputPath,
                  const GlyphBrightnessMeasurer& measurer,
                  bool asciiOnly);

    // Sorts every .txt/.json file of sourceDir (name order, hidden files
    // skipped) into outputDir/<stem>_sorted.json.
    BatchResult sortDirectory(const std::filesystem::path& sourceDir,
                              const std::filesystem::path& outputDir,
                              const GlyphBrightnessMeasurer& measurer,
                              bool asciiOnly);

    std::filesystem::path sortedOutputPath(const std::filesystem::path& inputPath,
                                           const std::filesystem::path& outputDir);

} // namespace AlphabetBuilder

#endif // ALPHABET_BUILDER_H
