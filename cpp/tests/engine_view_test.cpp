#include "tests/engine_test_common.h"

#include "chronoline/layout/layout_constants.h"

#include <limits>

using namespace engine_test;

namespace {

// Ten open-ended entities starting 1900..1909, all stacked in their own row.
std::vector<Entity> stackedEntities() {
    std::vector<Entity> entities;
    for (EntityId i = 0; i < 10; ++i) {
        entities.push_back(makeEntity(i + 1, "e", ymd(1900 + static_cast<std::int64_t>(i))));
    }
    return entities;
}

} // namespace

class TimelineViewTest : public EngineFixture {
protected:
    void useSmallCanvas() {
        engine.setEntities(stackedEntities());
        engine.setCanvasMax(200.0, 100.0);
    }
};

// =============================================================================
// Zoom
// =============================================================================

TEST_F(TimelineViewTest, ZoomScalesLayoutParams) {
    engine.setEntities(scenarioEntities());
    engine.setZoom(2.0);

    EXPECT_DOUBLE_EQ(engine.zoom(), 2.0);
    EXPECT_DOUBLE_EQ(engine.effectiveFontSizePx(), 24.0);
    EXPECT_DOUBLE_EQ(engine.layoutParams().fontSizePx, 12.0);
    EXPECT_DOUBLE_EQ(TimelineEngineTestAccessor::zoomedLayoutParams(engine).paddingX, 20.0);
    // (60 + 40) / 10
    EXPECT_DOUBLE_EQ(TimelineEngineTestAccessor::measuredLayoutParams(engine).yearWidth, 10.0);
    EXPECT_DOUBLE_EQ(working(2).minX(), 50.0);
}

TEST_F(TimelineViewTest, SetZoomClamps) {
    engine.setZoom(100.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMaxZoom);
    engine.setZoom(0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMinZoom);
}

TEST_F(TimelineViewTest, ZoomInKeepsAnchorFixed) {
    useSmallCanvas();
    ASSERT_EQ(engine.rowCount(), 10u);
    EXPECT_DOUBLE_EQ(working(1).maxX(), 625.0);
    EXPECT_NEAR(working(10).maxY(), 362.4, kEps);

    engine.addToGlobalOffset(-100.0, -20.0);
    EXPECT_EQ(engine.globalOffset(), (TimelineOffset{-100.0, -20.0}));

    engine.zoomIn(1.25, 80.0, 40.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), 1.25);
    EXPECT_DOUBLE_EQ(engine.globalOffset().x, -145.0);
    EXPECT_DOUBLE_EQ(engine.globalOffset().y, -35.0);

    engine.zoomOut(1.25, 80.0, 40.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), 1.0);
    EXPECT_DOUBLE_EQ(engine.globalOffset().x, -100.0);
    EXPECT_DOUBLE_EQ(engine.globalOffset().y, -20.0);
}

TEST_F(TimelineViewTest, ZoomKeepsPointUnderCursorOnScreen) {
    useSmallCanvas();
    engine.setStickyText(false);

    const auto before = engine.entitiesForDrawing();
    const EntityOut* anchored = findOut(before, 2);
    const EntityOut* other = findOut(before, 1);
    ASSERT_NE(anchored, nullptr);
    ASSERT_NE(other, nullptr);
    const Point cursor = anchored->textBox.positionAndSize.position;
    const Point otherBefore = other->textBox.positionAndSize.position;
    const double heightBefore = anchored->textBox.positionAndSize.height;
    EXPECT_DOUBLE_EQ(cursor.x, 5.0);
    EXPECT_NEAR(cursor.y, 2.0 * kRowPitch, kEps);

    engine.zoomIn(1.25, cursor.x, cursor.y);

    const auto after = engine.entitiesForDrawing();
    anchored = findOut(after, 2);
    other = findOut(after, 1);
    ASSERT_NE(anchored, nullptr);
    ASSERT_NE(other, nullptr);
    EXPECT_NEAR(anchored->textBox.positionAndSize.position.x, cursor.x, kEps);
    EXPECT_NEAR(anchored->textBox.positionAndSize.position.y, cursor.y, kEps);
    EXPECT_NEAR(anchored->textBox.positionAndSize.height, heightBefore * 1.25, kEps);

    // Everything else spreads away from the cursor by the zoom factor
    EXPECT_NEAR(other->textBox.positionAndSize.position.x - cursor.x, (otherBefore.x - cursor.x) * 1.25, kEps);
    EXPECT_NEAR(other->textBox.positionAndSize.position.y - cursor.y, (otherBefore.y - cursor.y) * 1.25, kEps);

    engine.zoomOut(1.25, cursor.x, cursor.y);
    const auto restored = engine.entitiesForDrawing();
    anchored = findOut(restored, 2);
    ASSERT_NE(anchored, nullptr);
    EXPECT_NEAR(anchored->textBox.positionAndSize.position.x, cursor.x, kEps);
    EXPECT_NEAR(anchored->textBox.positionAndSize.position.y, cursor.y, kEps);
}

TEST_F(TimelineViewTest, ZoomStopsAtLimits) {
    engine.setEntities(scenarioEntities());

    engine.zoomIn(100.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMaxZoom);
    const auto generation = engine.getStats().generation;
    engine.zoomIn(2.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMaxZoom);
    EXPECT_EQ(engine.getStats().generation, generation);

    engine.zoomOut(1000.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMinZoom);
    engine.zoomOut(2.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMinZoom);
}

TEST_F(TimelineViewTest, NonPositiveZoomFactorIsIgnored) {
    engine.zoomIn(0.0, 0.0, 0.0);
    engine.zoomIn(-2.0, 0.0, 0.0);
    engine.zoomOut(0.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), 1.0);
}

TEST_F(TimelineViewTest, ZoomFactorBelowOneStaysInRange) {
    engine.setEntities(scenarioEntities());

    engine.setZoom(kMinZoom);
    engine.zoomIn(0.5, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMinZoom);

    engine.setZoom(kMaxZoom);
    engine.zoomOut(0.5, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), kMaxZoom);

    engine.setZoom(1.0);
    for (int i = 0; i < 20; ++i) {
        engine.zoomIn(0.8, 0.0, 0.0);
        EXPECT_GE(engine.zoom(), kMinZoom);
        EXPECT_LE(engine.zoom(), kMaxZoom);
    }
    EXPECT_DOUBLE_EQ(engine.zoom(), kMinZoom);

    // A factor below one zooms the other way, within the limits
    engine.setZoom(1.0);
    engine.zoomOut(0.5, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), 2.0);
}

TEST_F(TimelineViewTest, NonFiniteZoomIsIgnored) {
    engine.setZoom(2.0);
    engine.setZoom(std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(engine.zoom(), 2.0);
    engine.setZoom(std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(engine.zoom(), 2.0);
    engine.zoomIn(std::numeric_limits<double>::infinity(), 0.0, 0.0);
    engine.zoomOut(std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0);
    EXPECT_DOUBLE_EQ(engine.zoom(), 2.0);

    engine.setDatetimeScale(std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(engine.datetimeScale(), 1.0);
}

// =============================================================================
// Pan
// =============================================================================

TEST_F(TimelineViewTest, PanIsClampedToContent) {
    useSmallCanvas();

    engine.addToGlobalOffset(50.0, 50.0);
    EXPECT_EQ(engine.globalOffset(), (TimelineOffset{0.0, 0.0}));

    engine.addToGlobalOffset(-10000.0, -10000.0);
    EXPECT_DOUBLE_EQ(engine.globalOffset().x, 200.0 - 625.0);
    // Bottom of the last row plus the row margin
    EXPECT_NEAR(engine.globalOffset().y, 100.0 - 367.4, kEps);
}

TEST_F(TimelineViewTest, SmallContentCannotBePanned) {
    engine.setEntities(scenarioEntities());
    engine.addToGlobalOffset(-30.0, -30.0);
    EXPECT_EQ(engine.globalOffset(), (TimelineOffset{0.0, 0.0}));
}

TEST_F(TimelineViewTest, GrowingCanvasReclamps) {
    useSmallCanvas();
    engine.addToGlobalOffset(-10000.0, -10000.0);
    engine.setCanvasMax(1000.0, 1000.0);
    EXPECT_EQ(engine.canvasSize(), (Size{1000.0, 1000.0}));
    EXPECT_EQ(engine.globalOffset(), (TimelineOffset{0.0, 0.0}));
}

TEST_F(TimelineViewTest, PanMovesOutputs) {
    useSmallCanvas();
    engine.setStickyText(false);
    engine.addToGlobalOffset(-30.0, -10.0);

    const auto out = engine.entitiesForDrawing();
    const EntityOut* first = findOut(out, 1);
    ASSERT_NE(first, nullptr);
    EXPECT_DOUBLE_EQ(first->textBox.positionAndSize.position.x, -30.0);
    EXPECT_NEAR(first->textBox.positionAndSize.position.y, kRowPitch - 10.0, kEps);
    EXPECT_DOUBLE_EQ(first->text.topLeft.x, -20.0);

    // Headings only move sideways
    const auto headings = engine.headingsForDrawing();
    ASSERT_FALSE(headings.empty());
    EXPECT_DOUBLE_EQ(headings[0].textBox.positionAndSize.position.x, -30.0);
    EXPECT_DOUBLE_EQ(headings[0].textBox.positionAndSize.position.y, 0.0);

    // Stored layout is untouched
    EXPECT_DOUBLE_EQ(working(1).minX(), 0.0);
}

TEST_F(TimelineViewTest, StickyTextFollowsScroll) {
    useSmallCanvas();
    EXPECT_TRUE(engine.stickyText());
    engine.addToGlobalOffset(-100.0, 0.0);

    const auto out = engine.entitiesForDrawing();
    const EntityOut* first = findOut(out, 1);
    ASSERT_NE(first, nullptr);
    EXPECT_DOUBLE_EQ(first->text.topLeft.x, 10.0);
    EXPECT_DOUBLE_EQ(first->textBox.positionAndSize.position.x, -100.0);
}

TEST_F(TimelineViewTest, OffscreenEntitiesAreCulled) {
    useSmallCanvas();
    // Rows below y = 100 + row height are dropped
    const auto out = engine.entitiesForDrawing();
    EXPECT_LT(out.size(), 10u);
    EXPECT_NE(findOut(out, 1), nullptr);
    EXPECT_EQ(findOut(out, 10), nullptr);

    engine.addToGlobalOffset(0.0, -10000.0);
    EXPECT_NE(findOut(engine.entitiesForDrawing(), 10), nullptr);
}

TEST_F(TimelineViewTest, ZeroCanvasShowsNothing) {
    TimelineEngine fresh(&fakeMeasure);
    fresh.setTodayOverride(ymd(2025, 1, 1));
    fresh.setEntities(scenarioEntities());
    EXPECT_EQ(fresh.canvasSize(), (Size{0.0, 0.0}));
    EXPECT_TRUE(fresh.entitiesForDrawing().empty());
}

// =============================================================================
// Datetime scale, headings and lines
// =============================================================================

TEST_F(TimelineViewTest, DecadeHeadingsAndLinesAtDefaultScale) {
    engine.setEntities(scenarioEntities());

    const auto headings = engine.headingsForDrawing();
    ASSERT_EQ(headings.size(), 2u);
    EXPECT_EQ(headings[0].text.text, "1950s");
    EXPECT_DOUBLE_EQ(headings[0].text.topLeft.x, 10.0);
    EXPECT_DOUBLE_EQ(headings[0].text.topLeft.y, 7.0);
    EXPECT_EQ(headings[0].textBox.positionAndSize.position, (Position{0.0, 0.0}));
    EXPECT_DOUBLE_EQ(headings[0].textBox.positionAndSize.width, kDecadeWidth);
    EXPECT_NEAR(headings[0].textBox.positionAndSize.height, kBoxHeight, kEps);
    EXPECT_EQ(headings[1].text.text, "1960s");

    const auto lines = engine.linesForDrawing();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_DOUBLE_EQ(lines[0].x, 0.0);
    EXPECT_DOUBLE_EQ(lines[1].x, 50.0);
    EXPECT_DOUBLE_EQ(lines[2].x, 100.0);
    EXPECT_EQ(lines[0].style, TimelineColours::defaults().dividingLine);
    EXPECT_DOUBLE_EQ(TimelineEngineTestAccessor::headerAutoOffset(engine), 0.0);
}

TEST_F(TimelineViewTest, DatetimeScaleClamps) {
    engine.setDatetimeScale(0.5);
    EXPECT_DOUBLE_EQ(engine.datetimeScale(), kMinDatetimeScale);
    engine.setDatetimeScale(50.0);
    EXPECT_DOUBLE_EQ(engine.datetimeScale(), kMaxDatetimeScale);
}

TEST_F(TimelineViewTest, PartialYearLinesAreFaded) {
    engine.setEntities(scenarioEntities());
    engine.setDatetimeScale(2.0);

    const auto lines = engine.linesForDrawing();
    ASSERT_EQ(lines.size(), 21u);
    // Decade line then nine years
    EXPECT_EQ(lines[0].style.colour, Colour::fromRgb(0, 0, 0));
    EXPECT_EQ(lines[1].style.colour, Colour::fromRgb(240, 240, 240));
    EXPECT_DOUBLE_EQ(lines[1].x, 8.0);
    EXPECT_EQ(lines[10].style.colour, Colour::fromRgb(0, 0, 0));
    EXPECT_DOUBLE_EQ(lines[10].x, 80.0);

    // Year headings still hidden
    EXPECT_EQ(engine.headingsForDrawing().size(), 2u);
}

TEST_F(TimelineViewTest, FullYearLinesAreTwoShadesLighter) {
    engine.setEntities(scenarioEntities());
    engine.setDatetimeScale(3.0);
    const auto lines = engine.linesForDrawing();
    ASSERT_EQ(lines.size(), 21u);
    EXPECT_EQ(lines[1].style.colour, Colour::fromRgb(192, 192, 192));
}

TEST_F(TimelineViewTest, YearHeadingsAboveThreshold) {
    engine.setEntities(scenarioEntities());
    engine.setDatetimeScale(4.0);

    EXPECT_DOUBLE_EQ(TimelineEngineTestAccessor::measuredLayoutParams(engine).yearWidth, 14.0);
    EXPECT_NEAR(TimelineEngineTestAccessor::headerAutoOffset(engine), kBoxHeight, kEps);

    const auto headings = engine.headingsForDrawing();
    ASSERT_EQ(headings.size(), 22u);
    EXPECT_EQ(headings[0].text.text, "1950s");
    EXPECT_EQ(headings[1].text.text, "'50");
    EXPECT_DOUBLE_EQ(headings[1].text.topLeft.x, -2.0);
    EXPECT_NEAR(headings[1].textBox.positionAndSize.position.y, kBoxHeight, kEps);

    // Entities shift down below the year band
    const auto out = engine.entitiesForDrawing();
    const EntityOut* a = findOut(out, 1);
    ASSERT_NE(a, nullptr);
    EXPECT_NEAR(a->textBox.positionAndSize.position.y, kRowPitch + kBoxHeight, kEps);

    engine.setDatetimeScale(kDatetimeScaleShowFullYears);
    EXPECT_EQ(engine.headingsForDrawing()[1].text.text, "1950");
}

TEST_F(TimelineViewTest, BackgroundsAlternateByCentury) {
    engine.setEntities({makeEntity(1, "x", ymd(1990), ymd(2010))});
    const TimelineColours theme = TimelineColours::defaults();

    const auto backgrounds = engine.backgroundsForDrawing();
    ASSERT_EQ(backgrounds.size(), 2u);
    EXPECT_DOUBLE_EQ(backgrounds[0].x, 0.0);
    EXPECT_DOUBLE_EQ(backgrounds[0].width, kDecadeWidth);
    EXPECT_EQ(backgrounds[0].colour, theme.background.b);
    EXPECT_DOUBLE_EQ(backgrounds[1].x, kDecadeWidth);
    EXPECT_EQ(backgrounds[1].colour, theme.background.a);
}

TEST_F(TimelineViewTest, OffscreenDecadesAreCulled) {
    engine.setEntities({makeEntity(1, "x", ymd(1000), ymd(1001))});
    engine.setCanvasMax(120.0, 100.0);
    EXPECT_EQ(engine.startAndEndDecades(), (std::pair<std::int32_t, std::int32_t>{1000, 1010}));
    // Open-ended: 1000s through 2020s on a 120px canvas
    engine.setEntities({makeEntity(1, "x", ymd(1000))});
    EXPECT_EQ(engine.startAndEndDecades().second, 2030);

    EXPECT_EQ(engine.backgroundsForDrawing().size(), 3u);
    EXPECT_EQ(engine.headingsForDrawing().size(), 3u);
    EXPECT_EQ(engine.linesForDrawing().size(), 3u);
}
