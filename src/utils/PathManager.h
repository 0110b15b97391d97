#ifndef PATH_MANAGER_H
#define PATH_MANAGER_H

#include <cstddef>
#include <filesystem>
#include <string>

namespace PathManager {
    std::filesystem::path getExecutablePath(int argc, char* argv[]);
    std::filesystem::path setupOutputDirectory(const std::filesystem::path& outputDir);

    // e.g. ("frame_", 7, 6, ".png") -> "frame_000007.png"
    std::string frameFileName(const std::string& prefix, std::size_t index, int width, const std::string& extension);

    // Looks for a relative file next to the executable, then in the current
    // directory. Absolute paths are only checked for existence. Empty if not found.
    std::filesystem::path locateFile(const std::filesystem::path& exeDir, const std::string& fileName);
}

#endif // PATH_MANAGER_H
