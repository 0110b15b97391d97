#ifndef APPLICATION_H
#define APPLICATION_H

#include "common_types.h"
#include "ui/cli_handler.h"

class Application {
public:
    Application(int argc, char* argv[]);
    int run();

private:
    void initialize();
    bool resolveFontPath(const std::string& fontName);

    int runSort(const CLIHandler::CommandLine& cmd);
    int runBatchSort(const CLIHandler::CommandLine& cmd);
    int runConvert(const CLIHandler::CommandLine& cmd);

    int m_argc;
    char** m_argv;
    Config m_config;
    std::filesystem::path m_exeDir;
};

#endif // APPLICATION_H
