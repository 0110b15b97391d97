// src/ui/cli_handler.h

#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "common_types.h"
#include <string>
#include <filesystem>
#include <optional>

namespace CLIHandler {

    enum class Command {
        HELP,
        SORT,
        BATCH_SORT,
        CONVERT,
    };

    struct CommandLine {
        Command command = Command::HELP;
        vector<string> positional;
        std::optional<string> font;
        std::optional<float> fontSize;   // --size for sorting, --font-size for convert
        std::optional<string> charsPath;
        std::optional<string> outputDir;
        std::optional<int> fps;
        bool preview = false;
    };

    // Prints the problem and returns nullopt for unknown commands/options,
    // missing values or a wrong number of positional arguments.
    std::optional<CommandLine> parseArguments(int argc, char* argv[]);

    void printWelcomeMessage();
    void printUsage(const std::string& programName);

    void printEffectiveConfiguration(const Config& config, const std::string& alphabetPath, size_t alphabetSize);
    void printProcessingSummary(int processedCount, int failedCount, double duration, const std::filesystem::path& outputDir);

    // ffmpeg command that encodes the numbered frame sequence.
    std::string encoderCommand(const std::filesystem::path& outputDir, const std::string& framePattern,
                               int fps, const std::string& videoName);
    void printEncoderHint(const std::filesystem::path& outputDir, const std::string& framePattern,
                          int fps, const std::string& videoName);

} // namespace CLIHandler

#endif // CLI_HANDLER_H
