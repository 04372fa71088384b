#include <gtest/gtest.h>
#include "chronoline/engine.h"
#include "chronoline/text/text_measurer.h"

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace chronoline;
using namespace chronoline::text;

// =============================================================================
// Without a font: estimated metrics
// =============================================================================

TEST(TextMeasurerFallbackTest, EstimatesFromCodepoints) {
    TextMeasurer measurer;
    ASSERT_FALSE(measurer.hasFont());

    const TextSize size = measurer.measure(10.0, "1990s");
    EXPECT_NEAR(size.width, 25.0, 1e-6);
    EXPECT_NEAR(size.height, 11.0, 1e-4);

    // Multi-byte characters count once
    EXPECT_NEAR(measurer.measure(10.0, "\xC3\xA9t\xC3\xA9").width, 15.0, 1e-6);
    EXPECT_NEAR(measurer.measure(10.0, "").width, 0.0, 1e-9);
}

TEST(TextMeasurerFallbackTest, NonPositiveSizeMeasuresNothing) {
    TextMeasurer measurer;
    const TextSize size = measurer.measure(0.0, "text");
    EXPECT_EQ(size.width, 0.0);
    EXPECT_EQ(size.height, 0.0);
    EXPECT_EQ(measurer.measure(-4.0, "text").width, 0.0);
}

TEST(TextMeasurerFallbackTest, CountCodepoints) {
    EXPECT_EQ(TextMeasurer::countCodepoints(""), 0u);
    EXPECT_EQ(TextMeasurer::countCodepoints("abc"), 3u);
    EXPECT_EQ(TextMeasurer::countCodepoints("\xE2\x80\x94"), 1u);
    EXPECT_EQ(TextMeasurer::countCodepoints("a\xF0\x9F\x98\x80" "b"), 3u);
}

TEST(TextMeasurerFallbackTest, MissingFileIsRejected) {
    TextMeasurer measurer;
    EXPECT_FALSE(measurer.loadFontFromFile("/nonexistent/font.ttf"));
    EXPECT_FALSE(measurer.hasFont());
}

TEST(TextMeasurerFallbackTest, GarbageDataIsRejected) {
    TextMeasurer measurer;
    const std::vector<std::uint8_t> garbage(64, 0xAB);
    EXPECT_FALSE(measurer.loadFontFromMemory(garbage.data(), garbage.size()));
    EXPECT_FALSE(measurer.loadFontFromMemory(nullptr, 0));
    EXPECT_FALSE(measurer.hasFont());
}

// =============================================================================
// With a system font
// =============================================================================

class TextMeasurerFontTest : public ::testing::Test {
protected:
    TextMeasurer measurer;
    std::string fontPath;

    void SetUp() override {
        const std::vector<std::string> fontPaths = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
            "/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
        };
        for (const auto& path : fontPaths) {
            if (measurer.loadFontFromFile(path)) {
                fontPath = path;
                return;
            }
        }
        GTEST_SKIP() << "No system font available";
    }
};

TEST_F(TextMeasurerFontTest, WidthGrowsWithText) {
    ASSERT_TRUE(measurer.hasFont());
    const double one = measurer.measure(12.0, "1").width;
    const double four = measurer.measure(12.0, "1234").width;
    EXPECT_GT(one, 0.0);
    EXPECT_GT(four, one);
    EXPECT_NEAR(measurer.measure(12.0, "").width, 0.0, 1e-9);
}

TEST_F(TextMeasurerFontTest, ScalesWithFontSize) {
    const TextSize small = measurer.measure(12.0, "lpfHT");
    const TextSize large = measurer.measure(24.0, "lpfHT");
    EXPECT_GT(small.height, 0.0);
    EXPECT_NEAR(large.height, 2.0 * small.height, 0.05 * large.height);
    EXPECT_NEAR(large.width, 2.0 * small.width, 0.1 * large.width);
}

TEST_F(TextMeasurerFontTest, RepeatedMeasurementIsIdentical) {
    const TextSize a = measurer.measure(13.0, "Battle of Hastings");
    const TextSize b = measurer.measure(13.0, "Battle of Hastings");
    EXPECT_EQ(a.width, b.width);
    EXPECT_EQ(a.height, b.height);
}

TEST_F(TextMeasurerFontTest, FailedLoadKeepsCurrentFont) {
    const TextSize before = measurer.measure(12.0, "1990s");

    const std::vector<std::uint8_t> garbage(64, 0xAB);
    EXPECT_FALSE(measurer.loadFontFromMemory(garbage.data(), garbage.size()));
    EXPECT_FALSE(measurer.loadFontFromFile("/nonexistent/font.ttf"));

    ASSERT_TRUE(measurer.hasFont());
    const TextSize after = measurer.measure(12.0, "1990s");
    EXPECT_EQ(after.width, before.width);
    EXPECT_EQ(after.height, before.height);
}

TEST_F(TextMeasurerFontTest, LoadingAgainReplacesFont) {
    const TextSize before = measurer.measure(12.0, "Battle of Hastings");

    {
        std::ifstream file(fontPath, std::ios::binary);
        ASSERT_TRUE(file.is_open());
        const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        ASSERT_TRUE(measurer.loadFontFromMemory(bytes.data(), bytes.size()));
    }

    // The measurer keeps its own copy of the font bytes
    const TextSize after = measurer.measure(12.0, "Battle of Hastings");
    EXPECT_EQ(after.width, before.width);
    EXPECT_EQ(after.height, before.height);
}

TEST_F(TextMeasurerFontTest, DrivesEngineLayout) {
    TimelineEngine engine(measurer.measureFn());
    engine.setTodayOverride(*Date::fromParts(2025, 1, 1));
    engine.setCanvasMax(1000.0, 1000.0);

    Entity entity;
    entity.id = 1;
    entity.name = "Ada Lovelace";
    entity.start = *Date::fromParts(1815, 12, 10);
    entity.end = *Date::fromParts(1852, 11, 27);
    engine.setEntities({entity});

    ASSERT_EQ(engine.entitiesForDrawing().size(), 1u);
    EXPECT_GT(engine.entitiesForDrawing()[0].textBox.positionAndSize.width, 2.0 * engine.layoutParams().paddingX);
    EXPECT_EQ(engine.startAndEndDecades(), (std::pair<std::int32_t, std::int32_t>{1810, 1860}));
}
