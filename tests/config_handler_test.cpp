#include "config_handler.h"
#include "TempDirectory.h"
#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

class ConfigHandlerTest : public TempDirectoryTest {};

TEST_F(ConfigHandlerTest, MissingFileKeepsDefaults)
{
    Config config;
    EXPECT_TRUE(loadConfiguration(dir() / "config.json", config));
    EXPECT_EQ(config.outputSize, OUTPUT_SIZE);
    EXPECT_EQ(config.fontName, "menlo");
    EXPECT_FLOAT_EQ(config.fontSize, 10.0f);
}

TEST_F(ConfigHandlerTest, SettingsOverrideDefaults)
{
    std::filesystem::path file = writeFile("config.json", R"({
        "Settings": {
            "outputSize": 1024,
            "font": "courier",
            "fontSize": 14.5,
            "sortFontSize": 24,
            "outputDirectory": "out/frames",
            "fps": 60,
            "workerCount": 4,
            "asciiOnlyCandidates": false
        }
    })");

    Config config;
    ASSERT_TRUE(loadConfiguration(file, config));

    EXPECT_EQ(config.outputSize, 1024);
    EXPECT_EQ(config.fontName, "courier");
    EXPECT_FLOAT_EQ(config.fontSize, 14.5f);
    EXPECT_FLOAT_EQ(config.sortFontSize, 24.0f);
    EXPECT_EQ(config.outputDirectory, "out/frames");
    EXPECT_EQ(config.fps, 60);
    EXPECT_EQ(config.workerCount, 4);
    EXPECT_FALSE(config.asciiOnlyCandidates);
    // Untouched keys keep their defaults.
    EXPECT_EQ(config.framePrefix, "frame_");
    EXPECT_EQ(config.previewFrameLimit, 30);
}

TEST_F(ConfigHandlerTest, MalformedFileKeepsDefaults)
{
    std::filesystem::path file = writeFile("config.json", R"({"Settings": {"outputSize": 512,)");

    Config config;
    EXPECT_FALSE(loadConfiguration(file, config));
    EXPECT_EQ(config.outputSize, OUTPUT_SIZE);
}

TEST_F(ConfigHandlerTest, WrongTypeKeepsDefaults)
{
    std::filesystem::path file = writeFile("config.json", R"({"Settings": {"outputSize": "big", "fps": 12}})");

    Config config;
    EXPECT_FALSE(loadConfiguration(file, config));
    EXPECT_EQ(config.outputSize, OUTPUT_SIZE);
    EXPECT_EQ(config.fps, 30);
}

TEST_F(ConfigHandlerTest, OutOfRangeValuesKeepDefaults)
{
    std::filesystem::path file = writeFile("config.json", R"({"Settings": {"outputSize": 512, "fontSize": -3}})");

    Config config;
    EXPECT_FALSE(loadConfiguration(file, config));
    EXPECT_EQ(config.outputSize, OUTPUT_SIZE);
    EXPECT_FLOAT_EQ(config.fontSize, 10.0f);
}

TEST_F(ConfigHandlerTest, FontAliasesAreMergedCaseInsensitively)
{
    std::filesystem::path file = writeFile("config.json", R"({
        "Fonts": {
            "Mono": "/opt/fonts/Mono.ttf",
            "menlo": { "path": "/opt/fonts/Menlo.ttc", "faceIndex": 2 },
            "broken": 5
        }
    })");

    Config config;
    ASSERT_TRUE(loadConfiguration(file, config));

    auto mono = lookupFontAlias(config, "MONO");
    ASSERT_TRUE(mono.has_value());
    EXPECT_EQ(mono->path, "/opt/fonts/Mono.ttf");
    EXPECT_EQ(mono->faceIndex, 0);

    auto menlo = lookupFontAlias(config, "Menlo");
    ASSERT_TRUE(menlo.has_value());
    EXPECT_EQ(menlo->path, "/opt/fonts/Menlo.ttc");
    EXPECT_EQ(menlo->faceIndex, 2);

    EXPECT_FALSE(lookupFontAlias(config, "broken").has_value());
    // Built-in aliases survive.
    EXPECT_TRUE(lookupFontAlias(config, "dejavu").has_value());
}

TEST(FontSpecTest, UnknownNameIsTakenAsPath)
{
    Config config;
    FontSpec spec = fontSpecFor(config, "/usr/share/fonts/Custom.ttf");
    EXPECT_EQ(spec.path, "/usr/share/fonts/Custom.ttf");
    EXPECT_EQ(spec.faceIndex, 0);

    EXPECT_EQ(fontSpecFor(config, "Monaco").path, "fonts/Monaco.ttf");
}

TEST_F(ConfigHandlerTest, RunLogListsEffectiveSettings)
{
    Config config;
    config.finalFontPath = "/opt/fonts/Menlo.ttc";
    config.fps = 24;
    std::filesystem::path file = dir() / "_run_config.txt";

    ASSERT_TRUE(writeConfigToFile(config, file));

    std::ifstream in(file);
    std::stringstream content;
    content << in.rdbuf();
    const std::string text = content.str();
    EXPECT_NE(text.find("[Settings]"), std::string::npos);
    EXPECT_NE(text.find("finalFontPath = /opt/fonts/Menlo.ttc"), std::string::npos);
    EXPECT_NE(text.find("fps = 24"), std::string::npos);
    EXPECT_NE(text.find("[Fonts]"), std::string::npos);
}

TEST_F(ConfigHandlerTest, RunLogReportsUnwritablePath)
{
    EXPECT_FALSE(writeConfigToFile(Config(), dir() / "missing" / "_run_config.txt"));
}
