#include "tests/engine_test_common.h"

using namespace engine_test;

class InteractionEventsTest : public EngineFixture {
protected:
    void SetUp() override { engine.setEntities(scenarioEntities()); }
};

TEST_F(InteractionEventsTest, ClicksQueueInOrder) {
    engine.clickOnEntity(1);
    engine.doubleClickOnEntity(2);
    engine.tripleClickOnEntity(3);
    EXPECT_EQ(engine.pendingInteractionEventCount(), 3u);

    const auto events = engine.drainInteractionEvents();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], (InteractionEvent{InteractionEventType::SingleClick, 1}));
    EXPECT_EQ(events[1], (InteractionEvent{InteractionEventType::DoubleClick, 2}));
    EXPECT_EQ(events[2], (InteractionEvent{InteractionEventType::TripleClick, 3}));
}

TEST_F(InteractionEventsTest, DrainEmptiesQueue) {
    engine.clickOnEntity(1);
    EXPECT_EQ(engine.drainInteractionEvents().size(), 1u);
    EXPECT_EQ(engine.pendingInteractionEventCount(), 0u);
    EXPECT_TRUE(engine.drainInteractionEvents().empty());
}

TEST_F(InteractionEventsTest, HoverQueuesOnlyWithAnEntity) {
    engine.hoverOverEntity(EntityId{2});
    engine.hoverOverEntity(std::nullopt);

    const auto events = engine.drainInteractionEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, InteractionEventType::Hover);
    EXPECT_EQ(events[0].entityId, 2u);
}

TEST_F(InteractionEventsTest, UnknownIdsAreStillReported) {
    // The host may know about entities the engine has not been given yet
    engine.clickOnEntity(99);
    const auto events = engine.drainInteractionEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].entityId, 99u);
}

TEST_F(InteractionEventsTest, EventsDoNotChangeLayout) {
    const auto digest = engine.getLayoutDigest();
    engine.clickOnEntity(1);
    engine.doubleClickOnEntity(1);
    engine.tripleClickOnEntity(1);
    EXPECT_EQ(engine.getLayoutDigest(), digest);
    EXPECT_TRUE(engine.idsOfSelectedEntities().empty());
}

TEST(InteractionEventTypeTest, WireValues) {
    EXPECT_EQ(static_cast<int>(InteractionEventType::SingleClick), 1);
    EXPECT_EQ(static_cast<int>(InteractionEventType::DoubleClick), 2);
    EXPECT_EQ(static_cast<int>(InteractionEventType::TripleClick), 3);
    EXPECT_EQ(static_cast<int>(InteractionEventType::Hover), 4);
}
