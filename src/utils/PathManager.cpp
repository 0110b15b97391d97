#include "PathManager.h"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error> // For std::error_code

#if defined(_WIN32) || defined(_WIN64)
#include <windows.h>
#endif

namespace PathManager {

namespace {

std::filesystem::path fallbackExecutablePath() {
#ifdef _WIN32
    char pathBuf[MAX_PATH];
    if (GetModuleFileNameA(NULL, pathBuf, MAX_PATH) != 0) {
        return pathBuf;
    }
    return std::filesystem::current_path() / "ascii_dome_fallback.exe";
#else
    std::error_code ec;
    std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return self;
    }
    return std::filesystem::current_path() / "ascii_dome_fallback";
#endif
}

} // namespace

std::filesystem::path getExecutablePath(int argc, char* argv[]) {
    try {
        if (argc > 0 && argv[0] != nullptr) {
            std::error_code ec;
            std::filesystem::path tempPath = std::filesystem::canonical(argv[0], ec);
            if (!ec) {
                return tempPath;
            }
        }
        return fallbackExecutablePath();
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception resolving executable path: " << e.what() << ". Using fallback." << std::endl;
        return std::filesystem::path("ascii_dome_fallback");
    }
}

std::filesystem::path setupOutputDirectory(const std::filesystem::path& outputDirPath) {
    try {
        if (std::filesystem::create_directories(outputDirPath)) {
             std::cout << "Created output directory: " << outputDirPath.string() << std::endl;
        } else if (!std::filesystem::exists(outputDirPath) || !std::filesystem::is_directory(outputDirPath)) {
             std::cerr << "Error: Failed to create or access output directory: " << outputDirPath.string() << std::endl;
             return std::filesystem::path();
        }
        return outputDirPath;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error (filesystem): Creating directory " << outputDirPath.string() << ": " << e.what() << std::endl;
        return std::filesystem::path();
    }
}

std::string frameFileName(const std::string& prefix, std::size_t index, int width, const std::string& extension) {
    std::ostringstream ss;
    ss << prefix << std::setw(width) << std::setfill('0') << index << extension;
    return ss.str();
}

std::filesystem::path locateFile(const std::filesystem::path& exeDir, const std::string& fileName) {
    std::error_code ec;
    std::filesystem::path candidate(fileName);
    if (candidate.is_absolute()) {
        return std::filesystem::is_regular_file(candidate, ec) ? candidate : std::filesystem::path();
    }

    candidate = exeDir / fileName;
    if (std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
    }
    candidate = std::filesystem::current_path(ec) / fileName;
    if (!ec && std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::filesystem::path();
}

} // namespace PathManager
