#include "core/alphabet_builder.h"
#include "TempDirectory.h"
#include "TestFont.h"
#include <gtest/gtest.h>

namespace {

TestFont makeFont()
{
    TestFont font;
    font.define(U'.', 2, 2);
    font.define(U'o', 4, 4);
    font.define(U'#', 8, 8);
    return font;
}

} // namespace

class AlphabetBuilderTest : public TempDirectoryTest {};

TEST_F(AlphabetBuilderTest, SortFileWritesSortedAsset)
{
    TestFont font = makeFont();
    GlyphBrightnessMeasurer measurer(font, 50);
    std::filesystem::path input = writeFile("glyphs.txt", "#o.#");
    std::filesystem::path output = dir() / "glyphs_sorted.json";

    ASSERT_TRUE(AlphabetBuilder::sortFile(input, output, measurer, true));

    Alphabet alphabet = loadAlphabet(output);
    EXPECT_EQ(alphabet.characters(), U" .o#");
    EXPECT_EQ(alphabet.source(), "glyphs.txt");
}

TEST_F(AlphabetBuilderTest, SortFileReportsBadInput)
{
    TestFont font = makeFont();
    GlyphBrightnessMeasurer measurer(font, 50);
    std::filesystem::path input = writeFile("odd.json", "{\"numbers\": 3}");

    EXPECT_FALSE(AlphabetBuilder::sortFile(input, dir() / "out.json", measurer, true));
    EXPECT_FALSE(std::filesystem::exists(dir() / "out.json"));
}

TEST_F(AlphabetBuilderTest, SortDirectoryProcessesTextAndJsonFiles)
{
    TestFont font = makeFont();
    GlyphBrightnessMeasurer measurer(font, 50);
    std::filesystem::create_directories(dir() / "in");
    std::filesystem::create_directories(dir() / "out");
    writeFile("in/a.txt", "o.");
    writeFile("in/b.json", "{\"characters\": \"#o\"}");
    writeFile("in/c.json", "not json");
    writeFile("in/.hidden.txt", "#");
    writeFile("in/d.md", "#");

    AlphabetBuilder::BatchResult result =
        AlphabetBuilder::sortDirectory(dir() / "in", dir() / "out", measurer, true);

    EXPECT_EQ(result.processedCount, 2);
    EXPECT_EQ(result.failedCount, 1);
    EXPECT_EQ(loadAlphabet(dir() / "out" / "a_sorted.json").characters(), U" .o");
    EXPECT_EQ(loadAlphabet(dir() / "out" / "b_sorted.json").characters(), U" o#");
    EXPECT_FALSE(std::filesystem::exists(dir() / "out" / "c_sorted.json"));
    EXPECT_FALSE(std::filesystem::exists(dir() / "out" / ".hidden_sorted.json"));
    EXPECT_FALSE(std::filesystem::exists(dir() / "out" / "d_sorted.json"));
}

TEST(AlphabetBuilderPathTest, OutputNameUsesStem)
{
    EXPECT_EQ(AlphabetBuilder::sortedOutputPath("src/cities.json", "out"),
              std::filesystem::path("out") / "cities_sorted.json");
}
