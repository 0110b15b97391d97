// alphabet_builder.cpp
// 批量/单个字符集排序任务
#include "alphabet_builder.h"
#include "alphabet/alphabet_sorter.h"
#include "alphabet/candidate_loader.h"
#include "utils/utf8.h"

#include <algorithm>
#include <iostream>
#include <vector>

namespace AlphabetBuilder {

namespace {

string preview(const Alphabet& alphabet, size_t maxChars) {
    u32string head = alphabet.characters().substr(0, maxChars);
    string text = Utf8::encode(head);
    if (alphabet.size() > maxChars) text += "...";
    return text;
}

bool buildAndSave(const std::filesystem::path& inputPath,
                  const std::filesystem::path& outputPath,
                  const GlyphBrightnessMeasurer& measurer,
                  bool asciiOnly,
                  const string& source,
                  bool printBrightness) {
    try {
        u32string candidates = loadCandidates(inputPath, asciiOnly);
        std::cout << "  Found " << candidates.size() << " unique characters" << std::endl;

        AlphabetSorter sorter(measurer, printBrightness);
        Alphabet alphabet = sorter.buildAlphabet(candidates, source);
        saveAlphabet(alphabet, outputPath);

        std::cout << "  Sorted characters (dark to light): " << preview(alphabet, 50) << std::endl;
        std::cout << "  Saved: " << outputPath.string() << std::endl;
        return true;
    } catch (const std::runtime_error& e) { // AlphabetFormatError and I/O errors
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return false;
}

bool isCandidateFile(const std::filesystem::path& p) {
    const string name = p.filename().string();
    if (name.empty() || name[0] == '.') return false;
    const string ext = toLower(p.extension().string());
    return ext == ".txt" || ext == ".json";
}

} // end anonymous namespace

std::filesystem::path sortedOutputPath(const std::filesystem::path& inputPath,
                                       const std::filesystem::path& outputDir) {
    return outputDir / (inputPath.stem().string() + "_sorted.json");
}

bool sortFile(const std::filesystem::path& inputPath,
              const std::filesystem::path& outputPath,
              const GlyphBrightnessMeasurer& measurer,
              bool asciiOnly) {
    std::cout << "Loading characters from " << inputPath.string() << "..." << std::endl;
    std::cout << "Measuring brightness with " << measurer.getFont().getName() << "..." << std::endl;
    return buildAndSave(inputPath, outputPath, measurer, asciiOnly, inputPath.filename().string(), true);
}

BatchResult sortDirectory(const std::filesystem::path& sourceDir,
                          const std::filesystem::path& outputDir,
                          const GlyphBrightnessMeasurer& measurer,
                          bool asciiOnly) {
    BatchResult result;

    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(sourceDir, ec)) {
        if (entry.is_regular_file() && isCandidateFile(entry.path())) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        std::cerr << "Error: Cannot read directory '" << sourceDir.string() << "': " << ec.message() << std::endl;
        result.failedCount++;
        return result;
    }
    std::sort(files.begin(), files.end());

    std::cout << "\nFound " << files.size() << " files to process" << std::endl;
    for (const auto& file : files) {
        std::cout << "\nProcessing: " << file.filename().string() << std::endl;
        if (buildAndSave(file, sortedOutputPath(file, outputDir), measurer, asciiOnly, file.filename().string(), false)) {
            result.processedCount++;
        } else {
            result.failedCount++;
        }
    }
    return result;
}

} // namespace AlphabetBuilder
