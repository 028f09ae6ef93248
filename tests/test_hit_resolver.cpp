#include <gtest/gtest.h>
#include "core/HitResolver.hpp"
#include "core/Logger.hpp"
#include <vector>

using namespace core;

class HitResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::WARN);
    }

    static InteractionEvent event(InteractionKind kind, TimestampMs t, float x, float y) {
        InteractionEvent e;
        e.kind = kind;
        e.trackId = 1;
        e.position = {x, y};
        e.timestampMs = t;
        return e;
    }

    static Note slideNote() {
        return Note::slide(7, {{{200.0f, 300.0f}, 1000.0},
                               {{300.0f, 300.0f}, 1200.0},
                               {{400.0f, 300.0f}, 1400.0}});
    }

    Timeline timeline;
    HitResolver resolver{timeline};
};

TEST(GradeTest, WindowBoundariesAreClosed) {
    EXPECT_EQ(gradeForDelta(0.0).value_or(Grade::Miss), Grade::Perfect);
    EXPECT_EQ(gradeForDelta(50.0).value_or(Grade::Miss), Grade::Perfect);
    EXPECT_EQ(gradeForDelta(-50.0).value_or(Grade::Miss), Grade::Perfect);
    EXPECT_EQ(gradeForDelta(50.001).value_or(Grade::Miss), Grade::Great);
    EXPECT_EQ(gradeForDelta(150.0).value_or(Grade::Miss), Grade::Great);
    EXPECT_EQ(gradeForDelta(150.001).value_or(Grade::Miss), Grade::Good);
    EXPECT_EQ(gradeForDelta(200.0).value_or(Grade::Miss), Grade::Good);
    EXPECT_EQ(gradeForDelta(-200.0).value_or(Grade::Miss), Grade::Good);
    EXPECT_FALSE(gradeForDelta(200.001).has_value());
}

TEST_F(HitResolverTest, EarlyTapWithinPerfectWindow) {
    timeline.load({Note::tap(1, 1000, {100, 100}, 200.0)});

    auto r = resolver.resolve(event(InteractionKind::Tap, 1040.0, 100.0f, 100.0f));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->noteId, 1u);
    EXPECT_EQ(r->grade, Grade::Perfect);
    ASSERT_TRUE(r->deltaMs.has_value());
    EXPECT_DOUBLE_EQ(*r->deltaMs, 40.0);
    EXPECT_EQ(timeline.find(1)->status, NoteStatus::Hit);
    EXPECT_TRUE(timeline.finished());
}

TEST_F(HitResolverTest, LateTapIsGood) {
    timeline.load({Note::tap(1, 1000, {100, 100}, 200.0)});

    auto r = resolver.resolve(event(InteractionKind::Tap, 1180.0, 100.0f, 100.0f));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->grade, Grade::Good);
}

TEST_F(HitResolverTest, UnhitTapIsSweptAsMiss) {
    timeline.load({Note::tap(1, 1000, {100, 100}, 200.0)});

    // Still inside window + grace
    EXPECT_TRUE(resolver.sweep(1500.0).empty());
    EXPECT_TRUE(timeline.find(1)->isPending());

    auto missed = resolver.sweep(2000.0);
    ASSERT_EQ(missed.size(), 1u);
    EXPECT_EQ(missed[0].noteId, 1u);
    EXPECT_EQ(missed[0].grade, Grade::Miss);
    EXPECT_FALSE(missed[0].deltaMs.has_value());
    EXPECT_EQ(timeline.find(1)->status, NoteStatus::Missed);

    // Already resolved notes are not reported twice
    EXPECT_TRUE(resolver.sweep(2100.0).empty());
}

TEST_F(HitResolverTest, EventOutsideRadiusOrWindowMatchesNothing) {
    timeline.load({Note::tap(1, 1000, {100, 100}, 200.0)});

    EXPECT_FALSE(resolver.resolve(event(InteractionKind::Tap, 1000.0, 160.0f, 100.0f)).has_value());
    EXPECT_FALSE(resolver.resolve(event(InteractionKind::Tap, 1250.0, 100.0f, 100.0f)).has_value());
    EXPECT_TRUE(timeline.find(1)->isPending());
}

TEST_F(HitResolverTest, OverlappingNotesPickSmallestDelta) {
    timeline.load({Note::tap(1, 1000, {100, 100}), Note::tap(2, 1100, {110, 100})});

    auto r = resolver.resolve(event(InteractionKind::Tap, 1080.0, 105.0f, 100.0f));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->noteId, 2u);
    EXPECT_EQ(r->grade, Grade::Perfect);
    EXPECT_TRUE(timeline.find(1)->isPending());
}

TEST_F(HitResolverTest, EqualDeltaPicksLowestId) {
    timeline.load({Note::tap(5, 1000, {100, 100}), Note::tap(3, 1000, {100, 100})});

    auto r = resolver.resolve(event(InteractionKind::Tap, 1000.0, 100.0f, 100.0f));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->noteId, 3u);
    EXPECT_TRUE(timeline.find(5)->isPending());
}

TEST_F(HitResolverTest, EventKindMustMatchNoteKind) {
    timeline.load({slideNote()});

    EXPECT_FALSE(resolver.resolve(event(InteractionKind::Tap, 1000.0, 200.0f, 300.0f)).has_value());
    EXPECT_FALSE(resolver.resolve(event(InteractionKind::SlideEnd, 1000.0, 200.0f, 300.0f)).has_value());
    EXPECT_EQ(timeline.find(7)->nextCheckpoint, 0u);
}

TEST_F(HitResolverTest, SlideTakesWorstCheckpointGrade) {
    timeline.load({slideNote()});

    EXPECT_FALSE(resolver.resolve(event(InteractionKind::SlideStart, 1010.0, 200.0f, 300.0f)).has_value());
    EXPECT_EQ(timeline.find(7)->nextCheckpoint, 1u);

    // Still at the first checkpoint: too far from the second one
    EXPECT_FALSE(resolver.resolve(event(InteractionKind::SlideMove, 1050.0, 200.0f, 300.0f)).has_value());

    EXPECT_FALSE(resolver.resolve(event(InteractionKind::SlideMove, 1300.0, 300.0f, 300.0f)).has_value());
    auto r = resolver.resolve(event(InteractionKind::SlideMove, 1400.0, 400.0f, 300.0f));

    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->noteId, 7u);
    EXPECT_EQ(r->kind, NoteKind::Slide);
    EXPECT_EQ(r->grade, Grade::Great);
    ASSERT_TRUE(r->deltaMs.has_value());
    EXPECT_DOUBLE_EQ(*r->deltaMs, 100.0);
    EXPECT_EQ(timeline.find(7)->status, NoteStatus::Hit);
    EXPECT_EQ(resolver.checkpointsConsumed(), 3u);
}

TEST_F(HitResolverTest, AbandonedSlideIsMissed) {
    timeline.load({slideNote()});

    EXPECT_FALSE(resolver.resolve(event(InteractionKind::SlideStart, 1000.0, 200.0f, 300.0f)).has_value());

    auto missed = resolver.sweep(2000.0);
    ASSERT_EQ(missed.size(), 1u);
    EXPECT_EQ(missed[0].noteId, 7u);
    EXPECT_EQ(missed[0].grade, Grade::Miss);
    EXPECT_EQ(timeline.find(7)->status, NoteStatus::Missed);
    EXPECT_EQ(resolver.checkpointsConsumed(), 3u);
}

TEST_F(HitResolverTest, ResolvedNotesAreArchivedBehindCursor) {
    timeline.load({Note::tap(1, 1000, {100, 100}), Note::tap(2, 1500, {200, 100})});

    ASSERT_TRUE(resolver.resolve(event(InteractionKind::Tap, 1000.0, 100.0f, 100.0f)).has_value());
    EXPECT_TRUE(timeline.advance(1100.0));
    EXPECT_EQ(timeline.cursor(), 1u);
    EXPECT_EQ(timeline.pendingCount(), 1u);
}
