// src/ui/cli_handler.cpp

#include "cli_handler.h"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace CLIHandler {

namespace {

std::optional<float> parsePositiveFloat(const string& option, const string& value) {
    size_t used = 0;
    float parsed = 0.0f;
    try {
        parsed = std::stof(value, &used);
    } catch (const std::logic_error&) { // invalid_argument, out_of_range
        used = 0;
    }
    if (used == 0 || used != value.size() || parsed <= 0.0f) {
        std::cerr << "Error: " << option << " expects a positive number, got '" << value << "'." << std::endl;
        return std::nullopt;
    }
    return parsed;
}

std::optional<int> parsePositiveInt(const string& option, const string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size() || parsed <= 0) {
        std::cerr << "Error: " << option << " expects a positive integer, got '" << value << "'." << std::endl;
        return std::nullopt;
    }
    return parsed;
}

} // namespace

std::optional<CommandLine> parseArguments(int argc, char* argv[]) {
    CommandLine cmd;
    if (argc < 2) {
        return cmd; // HELP
    }

    const string verb = argv[1];
    size_t expectedPositional = 0;
    if (verb == "--help" || verb == "-h" || verb == "help") {
        return cmd;
    } else if (verb == "sort") {
        cmd.command = Command::SORT;
        expectedPositional = 2;
    } else if (verb == "batch-sort") {
        cmd.command = Command::BATCH_SORT;
        expectedPositional = 2;
    } else if (verb == "convert") {
        cmd.command = Command::CONVERT;
        expectedPositional = 1;
    } else {
        std::cerr << "Error: Unknown command '" << verb << "'." << std::endl;
        return std::nullopt;
    }

    const bool sorting = cmd.command != Command::CONVERT;
    for (int i = 2; i < argc; ++i) {
        const string arg = argv[i];
        auto takeValue = [&](string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Error: Option " << arg << " requires a value." << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        string value;
        if (arg == "--help" || arg == "-h") {
            cmd.command = Command::HELP;
            return cmd;
        } else if (arg == "--font") {
            if (!takeValue(value)) return std::nullopt;
            cmd.font = value;
        } else if ((sorting && arg == "--size") || (!sorting && arg == "--font-size")) {
            if (!takeValue(value)) return std::nullopt;
            cmd.fontSize = parsePositiveFloat(arg, value);
            if (!cmd.fontSize) return std::nullopt;
        } else if (!sorting && arg == "--chars") {
            if (!takeValue(value)) return std::nullopt;
            cmd.charsPath = value;
        } else if (!sorting && arg == "--output") {
            if (!takeValue(value)) return std::nullopt;
            cmd.outputDir = value;
        } else if (!sorting && arg == "--fps") {
            if (!takeValue(value)) return std::nullopt;
            cmd.fps = parsePositiveInt(arg, value);
            if (!cmd.fps) return std::nullopt;
        } else if (!sorting && arg == "--preview") {
            cmd.preview = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "' for command '" << verb << "'." << std::endl;
            return std::nullopt;
        } else {
            cmd.positional.push_back(arg);
        }
    }

    if (cmd.positional.size() != expectedPositional) {
        std::cerr << "Error: '" << verb << "' expects " << expectedPositional << " path argument(s), got "
                  << cmd.positional.size() << "." << std::endl;
        return std::nullopt;
    }
    if (cmd.command == Command::CONVERT && !cmd.charsPath) {
        std::cerr << "Error: 'convert' requires --chars <alphabet.json>." << std::endl;
        return std::nullopt;
    }
    return cmd;
}

void printWelcomeMessage() {
    std::cout << "--- ASCII Dome Frame Generator ---" << std::endl;
}

void printUsage(const std::string& programName) {
    std::cerr << "\nConverts image sequences to ASCII-art frames for dome projection." << std::endl;
    std::cerr << "\nUsage:" << std::endl;
    std::cerr << "  " << programName << " sort <input.json|input.txt> <output.json> [--font NAME|PATH] [--size N]" << std::endl;
    std::cerr << "  " << programName << " batch-sort <source_dir> <output_dir> [--font NAME|PATH] [--size N]" << std::endl;
    std::cerr << "  " << programName << " convert <image_or_dir> --chars <alphabet.json> [--font NAME|PATH]" << std::endl;
    std::cerr << "        [--font-size N] [--output DIR] [--fps N] [--preview]" << std::endl;
    std::cerr << "\nCommands:" << std::endl;
    std::cerr << "  sort         Sort the characters of one file by rendered brightness (dark to light)." << std::endl;
    std::cerr << "  batch-sort   Sort every .txt/.json file of a directory into <name>_sorted.json files." << std::endl;
    std::cerr << "  convert      Render each image as ASCII art into numbered square PNG frames." << std::endl;
    std::cerr << "\nExample:" << std::endl;
    std::cerr << "  " << programName << " convert frames/ --chars chars_sorted/cities_sorted.json --font menlo --font-size 12" << std::endl;
}

void printEffectiveConfiguration(const Config& config, const std::string& alphabetPath, size_t alphabetSize) {
    std::cout << "\n--- Effective Configuration ---" << std::endl;
    std::cout << "Alphabet:             " << alphabetPath << " (" << alphabetSize << " characters)" << std::endl;
    std::cout << "Font Path:            " << config.finalFontPath << std::endl;
    std::cout << "Font Size:            " << config.fontSize << "px" << std::endl;
    std::cout << "Output Size:          " << config.outputSize << "x" << config.outputSize << std::endl;
    std::cout << "Output Directory:     " << config.outputDirectory << std::endl;
    std::cout << "Preview:              " << (config.preview ? "First " + std::to_string(config.previewFrameLimit) + " frames" : "Disabled") << std::endl;
    std::cout << "-----------------------------" << std::endl;
}

void printProcessingSummary(int processedCount, int failedCount, double duration, const std::filesystem::path& outputDir) {
    std::cout << "\n==================================================" << std::endl;
    std::cout << "Processing Summary:" << std::endl;
    std::cout << "  Successfully processed: " << processedCount << " frame(s)" << std::endl;
    std::cout << "  Failed:                 " << failedCount << " frame(s)" << std::endl;
    std::cout << "  Total time:             " << std::fixed << std::setprecision(3) << duration << "s" << std::endl;
    if (!outputDir.empty()){
         std::cout << "Output(s) can be found in/under: " << outputDir.string() << std::endl;
    }
    std::cout << "==================================================" << std::endl;
}

std::string encoderCommand(const std::filesystem::path& outputDir, const std::string& framePattern,
                           int fps, const std::string& videoName) {
    return "ffmpeg -y -framerate " + std::to_string(fps) + " -i " + (outputDir / framePattern).string()
           + " -c:v libx264 -pix_fmt yuv420p " + (outputDir / videoName).string();
}

void printEncoderHint(const std::filesystem::path& outputDir, const std::string& framePattern,
                      int fps, const std::string& videoName) {
    std::cout << "\nTo create the video:" << std::endl;
    std::cout << "  " << encoderCommand(outputDir, framePattern, fps, videoName) << std::endl;
}

} // namespace CLIHandler
