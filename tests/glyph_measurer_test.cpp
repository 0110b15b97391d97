#include "alphabet/glyph_measurer.h"
#include "TestFont.h"
#include <gtest/gtest.h>

#include <stdexcept>

TEST(GlyphMeasurerTest, SolidBlockBrightnessIsInkAreaOverCanvas)
{
    TestFont font;
    font.define(U'#', 10, 10);
    GlyphBrightnessMeasurer measurer(font, 50);

    GlyphMeasurement m = measurer.measure(U'#');

    // 100 white pixels on a 50x50 canvas.
    EXPECT_EQ(m.character, U'#');
    EXPECT_FALSE(m.renderFailed);
    EXPECT_DOUBLE_EQ(m.brightness, 100.0 * 255.0 / 2500.0);
}

TEST(GlyphMeasurerTest, PartialCoverageScalesBrightness)
{
    TestFont font;
    font.define(U'a', 10, 10, 0, 0, 255);
    font.define(U'b', 10, 10, 0, 0, 51);
    GlyphBrightnessMeasurer measurer(font, 50);

    EXPECT_DOUBLE_EQ(measurer.measure(U'b').brightness, measurer.measure(U'a').brightness / 5.0);
}

TEST(GlyphMeasurerTest, BoxOriginIsCorrectedWhenCentering)
{
    // Drawn at its raw offset the block would hang off the canvas and be clipped.
    TestFont font;
    font.define(U'q', 10, 10, 45, 45);
    GlyphBrightnessMeasurer measurer(font, 50);

    EXPECT_DOUBLE_EQ(measurer.measure(U'q').brightness, 100.0 * 255.0 / 2500.0);
}

TEST(GlyphMeasurerTest, NegativeBoxOriginIsCorrectedWhenCentering)
{
    TestFont font;
    font.define(U'j', 10, 20, -30, -40);
    GlyphBrightnessMeasurer measurer(font, 50);

    EXPECT_DOUBLE_EQ(measurer.measure(U'j').brightness, 200.0 * 255.0 / 2500.0);
}

TEST(GlyphMeasurerTest, GlyphLargerThanCanvasIsClipped)
{
    TestFont font;
    font.define(U'M', 60, 60);
    GlyphBrightnessMeasurer measurer(font, 50);

    EXPECT_DOUBLE_EQ(measurer.measure(U'M').brightness, 255.0);
}

TEST(GlyphMeasurerTest, SpaceHasZeroBrightness)
{
    TestFont font;
    GlyphBrightnessMeasurer measurer(font, 50);

    GlyphMeasurement m = measurer.measure(U' ');
    EXPECT_DOUBLE_EQ(m.brightness, 0.0);
    EXPECT_FALSE(m.renderFailed);
}

TEST(GlyphMeasurerTest, UnrenderableGlyphScoresZero)
{
    TestFont font;
    font.define(U'?', 10, 10);
    font.markUnrenderable(U'?');
    GlyphBrightnessMeasurer measurer(font, 50);

    GlyphMeasurement m = measurer.measure(U'?');
    EXPECT_DOUBLE_EQ(m.brightness, 0.0);
    EXPECT_TRUE(m.renderFailed);
}

TEST(GlyphMeasurerTest, MeasurementIsDeterministic)
{
    TestFont font;
    font.define(U'%', 7, 13, 1, 2, 200);
    GlyphBrightnessMeasurer measurer(font, 50);

    EXPECT_DOUBLE_EQ(measurer.measure(U'%').brightness, measurer.measure(U'%').brightness);
}

TEST(GlyphMeasurerTest, NonPositiveCanvasIsRejected)
{
    TestFont font;
    EXPECT_THROW(GlyphBrightnessMeasurer(font, 0), std::invalid_argument);
    EXPECT_THROW(GlyphBrightnessMeasurer(font, -5), std::invalid_argument);
}

TEST(GlyphMeasurerTest, FontMetricComesFromReferenceGlyph)
{
    TestFont font;
    FontMetric metric = measureFontMetric(font);
    EXPECT_EQ(metric.width, 8);
    EXPECT_EQ(metric.height, 12);
}

TEST(GlyphMeasurerTest, EmptyReferenceGlyphHasNoMetric)
{
    TestFont font;
    font.define(U'W', 0, 0);
    EXPECT_THROW(measureFontMetric(font), std::invalid_argument);
}

TEST(GlyphMeasurerTest, BlitClipsAtCanvasEdges)
{
    GrayImage canvas(4, 4, 0);
    GlyphBitmap glyph;
    glyph.width = 3;
    glyph.height = 3;
    glyph.coverage.assign(9, 255);

    blitGlyph(canvas, glyph, -1, 2);

    EXPECT_EQ(canvas.at(0, 2), 255);
    EXPECT_EQ(canvas.at(1, 3), 255);
    EXPECT_EQ(canvas.at(2, 2), 0);
    EXPECT_EQ(canvas.at(0, 1), 0);
    EXPECT_DOUBLE_EQ(canvas.mean(), 4.0 * 255.0 / 16.0);
}
