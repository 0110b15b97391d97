// src/app/application.cpp

#include "application.h"
#include "config_handler.h"
#include "utils/PathManager.h"
#include "utils/utf8.h"
#include "alphabet/alphabet.h"
#include "alphabet/glyph_measurer.h"
#include "core/alphabet_builder.h"
#include "core/processing_orchestrator.h"
#include "font/TrueTypeFont.h"
#include "rendering/PngSequenceWriter.h"
#include "source/ImageDirectorySource.h"

#include <iostream>
#include <chrono>
#include <memory>

using namespace std::chrono;

Application::Application(int argc, char* argv[]) : m_argc(argc), m_argv(argv) {}

int Application::run() {
    CLIHandler::printWelcomeMessage();
    const std::string programName = std::filesystem::path(m_argv[0]).filename().string();

    auto cmd = CLIHandler::parseArguments(m_argc, m_argv);
    if (!cmd) {
        CLIHandler::printUsage(programName);
        return 1; // 参数错误，打印用法并退出
    }
    if (cmd->command == CLIHandler::Command::HELP) {
        CLIHandler::printUsage(programName);
        return m_argc < 2 ? 1 : 0;
    }

    initialize();

    switch (cmd->command) {
        case CLIHandler::Command::SORT:       return runSort(*cmd);
        case CLIHandler::Command::BATCH_SORT: return runBatchSort(*cmd);
        case CLIHandler::Command::CONVERT:    return runConvert(*cmd);
        default:                              return 1;
    }
}

void Application::initialize() {
    std::filesystem::path exePath = PathManager::getExecutablePath(m_argc, m_argv);
    m_exeDir = exePath.parent_path();

    const std::string configFilename = "config.json";
    std::filesystem::path configPathObj = m_exeDir / configFilename;

    if (!loadConfiguration(configPathObj, m_config)) {
        std::cout << "Error: Configuration file could not be parsed correctly. Please check config.json. Proceeding with default values." << std::endl;
    }
}

bool Application::resolveFontPath(const std::string& fontName) {
    FontSpec spec = fontSpecFor(m_config, fontName);
    std::filesystem::path found = PathManager::locateFile(m_exeDir, spec.path);
    if (found.empty()) {
        std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!" << std::endl;
        std::cerr << "Error: Font file '" << spec.path << "' (font '" << fontName << "') not found!" << std::endl;
        if (std::filesystem::path(spec.path).is_relative()) {
            std::cerr << "Searched near executable: " << (m_exeDir / spec.path).string() << std::endl;
            std::cerr << "Searched in current dir: " << (std::filesystem::current_path() / spec.path).string() << std::endl;
        }
        std::cerr << "Please pass a valid --font alias or path, or update the 'Fonts' table in config.json." << std::endl;
        std::cerr << "!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!" << std::endl;
        return false;
    }
    m_config.finalFontPath = found.string();
    m_config.finalFontFaceIndex = spec.faceIndex;
    std::cout << "Font: " << m_config.finalFontPath << std::endl;
    return true;
}

int Application::runSort(const CLIHandler::CommandLine& cmd) {
    if (cmd.font) m_config.fontName = *cmd.font;
    if (cmd.fontSize) m_config.sortFontSize = *cmd.fontSize;
    if (!resolveFontPath(m_config.fontName)) {
        return 1;
    }

    try {
        TrueTypeFont font(m_config.finalFontPath, m_config.sortFontSize, m_config.finalFontFaceIndex);
        GlyphBrightnessMeasurer measurer(font, m_config.measureCanvasSize);
        // Single-file sorting keeps every character, as the candidate file lists them.
        bool ok = AlphabetBuilder::sortFile(cmd.positional[0], cmd.positional[1], measurer, false);
        return ok ? 0 : 1;
    } catch (const FontLoadError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int Application::runBatchSort(const CLIHandler::CommandLine& cmd) {
    if (cmd.font) m_config.fontName = *cmd.font;
    if (cmd.fontSize) m_config.sortFontSize = *cmd.fontSize;
    if (!resolveFontPath(m_config.fontName)) {
        return 1;
    }

    const std::filesystem::path sourceDir = cmd.positional[0];
    if (!std::filesystem::is_directory(sourceDir)) {
        std::cerr << "Error: Source path is not a directory: " << sourceDir.string() << std::endl;
        return 1;
    }
    std::filesystem::path outputDir = PathManager::setupOutputDirectory(cmd.positional[1]);
    if (outputDir.empty()) {
        return 1;
    }

    auto start = high_resolution_clock::now();
    AlphabetBuilder::BatchResult result;
    try {
        TrueTypeFont font(m_config.finalFontPath, m_config.sortFontSize, m_config.finalFontFaceIndex);
        GlyphBrightnessMeasurer measurer(font, m_config.measureCanvasSize);
        result = AlphabetBuilder::sortDirectory(sourceDir, outputDir, measurer, m_config.asciiOnlyCandidates);
    } catch (const FontLoadError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    auto end = high_resolution_clock::now();

    CLIHandler::printProcessingSummary(result.processedCount, result.failedCount,
                                       duration_cast<duration<double>>(end - start).count(), outputDir);
    return result.failedCount > 0 ? 1 : 0;
}

int Application::runConvert(const CLIHandler::CommandLine& cmd) {
    if (cmd.font) m_config.fontName = *cmd.font;
    if (cmd.fontSize) m_config.fontSize = *cmd.fontSize;
    if (cmd.outputDir) m_config.outputDirectory = *cmd.outputDir;
    if (cmd.fps) m_config.fps = *cmd.fps;
    m_config.preview = cmd.preview;

    // The alphabet must be usable before any frame is touched.
    Alphabet alphabet;
    try {
        alphabet = loadAlphabet(*cmd.charsPath);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: No usable characters loaded. " << e.what() << std::endl;
        return 1;
    }
    std::cout << "Loaded " << alphabet.size() << " characters: "
              << Utf8::encode(alphabet.characters().substr(0, 20)) << "..." << std::endl;

    if (!resolveFontPath(m_config.fontName)) {
        return 1;
    }

    std::unique_ptr<TrueTypeFont> font;
    std::unique_ptr<ProcessingOrchestrator> orchestrator;
    try {
        font = std::make_unique<TrueTypeFont>(m_config.finalFontPath, m_config.fontSize, m_config.finalFontFaceIndex);
        orchestrator = std::make_unique<ProcessingOrchestrator>(m_config, alphabet, *font);
    } catch (const FontLoadError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const GlyphRenderError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const GridSize& grid = orchestrator->getGridSize();
    std::cout << "Grid: " << grid.cols << "x" << grid.rows << " characters" << std::endl;

    u32string missing = orchestrator->findUnrenderableCharacters();
    if (!missing.empty()) {
        std::cerr << "Warning: Font " << font->getName() << " has no glyph for " << missing.size()
                  << " alphabet character(s): " << Utf8::encode(missing) << std::endl;
        std::cerr << "         They render as background." << std::endl;
    }

    const std::filesystem::path inputPath = cmd.positional[0];
    if (!std::filesystem::exists(inputPath)) {
        std::cerr << "Error: Input path does not exist: " << inputPath.string() << std::endl;
        return 1;
    }
    ImageDirectorySource source(inputPath, m_config.preview ? static_cast<size_t>(m_config.previewFrameLimit) : 0);
    if (source.getFiles().empty()) {
        std::cerr << "Error: No images found in " << inputPath.string() << std::endl;
        return 1;
    }
    std::cout << "Found " << source.getTotalFound() << " images, processing " << source.getFiles().size() << "..." << std::endl;

    std::filesystem::path outputDir = PathManager::setupOutputDirectory(m_config.outputDirectory);
    if (outputDir.empty()) {
        return 1;
    }
    if (!writeConfigToFile(m_config, outputDir / "_run_config.txt")) {
        std::cerr << "Warning: Failed to write configuration file for this run." << std::endl;
    }
    CLIHandler::printEffectiveConfiguration(m_config, *cmd.charsPath, alphabet.size());

    PngSequenceWriter sink(outputDir, m_config.framePrefix, m_config.frameIndexWidth);

    auto overall_start_time = high_resolution_clock::now();
    bool ok = orchestrator->process(source, sink);
    auto overall_end_time = high_resolution_clock::now();
    double total_duration = duration_cast<duration<double>>(overall_end_time - overall_start_time).count();

    CLIHandler::printProcessingSummary(
        orchestrator->getProcessedCount(),
        orchestrator->getFailedCount(),
        total_duration,
        outputDir
    );

    std::filesystem::path nameSource = inputPath.filename().empty() ? inputPath.parent_path() : inputPath;
    std::string videoName = (std::filesystem::is_directory(inputPath) ? nameSource.filename().string()
                                                                      : nameSource.stem().string()) + "_ascii.mp4";
    if (ok) {
        CLIHandler::printEncoderHint(outputDir, sink.framePattern(), m_config.fps, videoName);
    }

    // 如果有任何帧处理失败，返回一个非零的退出码
    return ok ? 0 : 1;
}
