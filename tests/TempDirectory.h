#ifndef TEMP_DIRECTORY_H
#define TEMP_DIRECTORY_H

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

// Fresh directory under the system temp dir, removed again in TearDown.
class TempDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = std::filesystem::temp_directory_path()
            / ("ascii_dome_" + std::string(info->test_suite_name()) + "_" + info->name());
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) const
    {
        std::filesystem::path file = m_dir / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

    const std::filesystem::path& dir() const { return m_dir; }

private:
    std::filesystem::path m_dir;
};

#endif // TEMP_DIRECTORY_H
