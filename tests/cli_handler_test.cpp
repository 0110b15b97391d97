#include "ui/cli_handler.h"
#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

namespace {

// Owns the argument strings so argv stays valid for the call.
std::optional<CLIHandler::CommandLine> parse(std::initializer_list<std::string> args)
{
    std::vector<std::string> storage{ "ascii_dome" };
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& arg : storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return CLIHandler::parseArguments(static_cast<int>(storage.size()), argv.data());
}

} // namespace

TEST(CliHandlerTest, NoArgumentsMeansHelp)
{
    auto cmd = parse({});
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->command, CLIHandler::Command::HELP);
}

TEST(CliHandlerTest, HelpFlagMeansHelp)
{
    auto cmd = parse({ "--help" });
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->command, CLIHandler::Command::HELP);

    auto nested = parse({ "convert", "--help" });
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested->command, CLIHandler::Command::HELP);
}

TEST(CliHandlerTest, SortTakesInputOutputAndFontOptions)
{
    auto cmd = parse({ "sort", "chars.txt", "sorted.json", "--font", "courier", "--size", "24" });
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->command, CLIHandler::Command::SORT);
    ASSERT_EQ(cmd->positional.size(), 2u);
    EXPECT_EQ(cmd->positional[0], "chars.txt");
    EXPECT_EQ(cmd->positional[1], "sorted.json");
    ASSERT_TRUE(cmd->font.has_value());
    EXPECT_EQ(*cmd->font, "courier");
    ASSERT_TRUE(cmd->fontSize.has_value());
    EXPECT_FLOAT_EQ(*cmd->fontSize, 24.0f);
}

TEST(CliHandlerTest, BatchSortNeedsTwoDirectories)
{
    auto ok = parse({ "batch-sort", "chars", "chars_sorted" });
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->command, CLIHandler::Command::BATCH_SORT);

    EXPECT_FALSE(parse({ "batch-sort", "chars" }).has_value());
}

TEST(CliHandlerTest, ConvertParsesAllOptions)
{
    auto cmd = parse({ "convert", "frames", "--chars", "a.json", "--font", "menlo", "--font-size", "12.5",
                       "--output", "out", "--fps", "25", "--preview" });
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->command, CLIHandler::Command::CONVERT);
    ASSERT_EQ(cmd->positional.size(), 1u);
    EXPECT_EQ(cmd->positional[0], "frames");
    EXPECT_EQ(cmd->charsPath.value_or(""), "a.json");
    EXPECT_EQ(cmd->font.value_or(""), "menlo");
    EXPECT_FLOAT_EQ(cmd->fontSize.value_or(0.0f), 12.5f);
    EXPECT_EQ(cmd->outputDir.value_or(""), "out");
    EXPECT_EQ(cmd->fps.value_or(0), 25);
    EXPECT_TRUE(cmd->preview);
}

TEST(CliHandlerTest, ConvertRequiresAlphabet)
{
    EXPECT_FALSE(parse({ "convert", "frames" }).has_value());
}

TEST(CliHandlerTest, InvalidInputIsRejected)
{
    EXPECT_FALSE(parse({ "explode" }).has_value());
    EXPECT_FALSE(parse({ "sort", "a.txt", "b.json", "--size", "0" }).has_value());
    EXPECT_FALSE(parse({ "sort", "a.txt", "b.json", "--size", "big" }).has_value());
    EXPECT_FALSE(parse({ "sort", "a.txt", "b.json", "--font" }).has_value());
    EXPECT_FALSE(parse({ "convert", "frames", "--chars", "a.json", "--fps", "2.5" }).has_value());
    EXPECT_FALSE(parse({ "convert", "frames", "--chars", "a.json", "--bogus" }).has_value());
}

TEST(CliHandlerTest, OptionsAreScopedToTheirCommand)
{
    // --size belongs to sorting, --font-size to conversion.
    EXPECT_FALSE(parse({ "convert", "frames", "--chars", "a.json", "--size", "12" }).has_value());
    EXPECT_FALSE(parse({ "sort", "a.txt", "b.json", "--font-size", "12" }).has_value());
    EXPECT_FALSE(parse({ "sort", "a.txt", "b.json", "--preview" }).has_value());
}

TEST(CliHandlerTest, EncoderCommandPointsAtFrameSequence)
{
    std::string command = CLIHandler::encoderCommand("out", "frame_%06d.png", 30, "clip_ascii.mp4");

    std::string framePattern = (std::filesystem::path("out") / "frame_%06d.png").string();
    std::string video = (std::filesystem::path("out") / "clip_ascii.mp4").string();
    EXPECT_EQ(command, "ffmpeg -y -framerate 30 -i " + framePattern + " -c:v libx264 -pix_fmt yuv420p " + video);
}
