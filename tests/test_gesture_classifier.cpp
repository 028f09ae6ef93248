#include <gtest/gtest.h>
#include "core/GestureClassifier.hpp"
#include "core/Logger.hpp"
#include <vector>

using namespace core;

using Observation = GestureClassifier::Observation;
using State = GestureClassifier::State;

class GestureClassifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::WARN);
    }

    static Observation valid(int id, float x, float y) {
        Observation obs;
        obs.trackId = id;
        obs.lowConfidence = false;
        obs.position = {x, y};
        return obs;
    }

    static Observation lowConfidence(int id) {
        Observation obs;
        obs.trackId = id;
        obs.lowConfidence = true;
        return obs;
    }

    GestureClassifier classifier;
};

TEST_F(GestureClassifierTest, QuickTouchEmitsTapAtContactTime) {
    EXPECT_TRUE(classifier.update(1000.0, {valid(1, 300.0f, 200.0f)}).empty());
    EXPECT_EQ(classifier.getState(1), State::Candidate);
    EXPECT_TRUE(classifier.hasActiveGesture());

    EXPECT_TRUE(classifier.update(1033.0, {valid(1, 302.0f, 201.0f)}).empty());
    EXPECT_TRUE(classifier.update(1066.0, {}).empty());

    auto events = classifier.update(1100.0, {});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, InteractionKind::Tap);
    EXPECT_EQ(events[0].trackId, 1);
    EXPECT_DOUBLE_EQ(events[0].timestampMs, 1000.0);
    EXPECT_FLOAT_EQ(events[0].position.x, 300.0f);
    EXPECT_FLOAT_EQ(events[0].position.y, 200.0f);

    EXPECT_EQ(classifier.getState(1), State::Idle);
    EXPECT_EQ(classifier.trackCount(), 0u);
    EXPECT_FALSE(classifier.hasActiveGesture());
}

TEST_F(GestureClassifierTest, MovementPastThresholdStartsSlide) {
    EXPECT_TRUE(classifier.update(1000.0, {valid(1, 200.0f, 300.0f)}).empty());
    EXPECT_TRUE(classifier.update(1033.0, {valid(1, 220.0f, 300.0f)}).empty());

    auto events = classifier.update(1066.0, {valid(1, 250.0f, 300.0f)});
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, InteractionKind::SlideStart);
    EXPECT_DOUBLE_EQ(events[0].timestampMs, 1000.0);
    EXPECT_FLOAT_EQ(events[0].position.x, 200.0f);
    EXPECT_EQ(events[1].kind, InteractionKind::SlideMove);
    EXPECT_DOUBLE_EQ(events[1].timestampMs, 1066.0);
    EXPECT_FLOAT_EQ(events[1].position.x, 250.0f);
    EXPECT_EQ(classifier.getState(1), State::Sliding);

    events = classifier.update(1100.0, {valid(1, 280.0f, 300.0f)});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, InteractionKind::SlideMove);

    EXPECT_TRUE(classifier.update(1133.0, {}).empty());
    events = classifier.update(1166.0, {});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, InteractionKind::SlideEnd);
    EXPECT_DOUBLE_EQ(events[0].timestampMs, 1100.0);
    EXPECT_FLOAT_EQ(events[0].position.x, 280.0f);
    EXPECT_EQ(classifier.getState(1), State::Idle);
}

TEST_F(GestureClassifierTest, LeavingAreaEndsSlideImmediately) {
    classifier.update(1000.0, {valid(1, 500.0f, 300.0f)});
    auto events = classifier.update(1033.0, {valid(1, 560.0f, 300.0f)});
    ASSERT_EQ(events.size(), 2u);

    events = classifier.update(1066.0, {valid(1, 650.0f, 300.0f)});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, InteractionKind::SlideEnd);
    EXPECT_DOUBLE_EQ(events[0].timestampMs, 1066.0);
    EXPECT_FLOAT_EQ(events[0].position.x, 560.0f);
    EXPECT_EQ(classifier.getState(1), State::Idle);
}

TEST_F(GestureClassifierTest, LowConfidenceStreamEmitsNothing) {
    for (int i = 0; i < 30; ++i) {
        auto events = classifier.update(1000.0 + i * 33.0, {lowConfidence(1), lowConfidence(2)});
        EXPECT_TRUE(events.empty());
    }
    EXPECT_EQ(classifier.trackCount(), 0u);
    EXPECT_FALSE(classifier.hasActiveGesture());
}

TEST_F(GestureClassifierTest, TouchOutsideAreaIsIgnored) {
    EXPECT_TRUE(classifier.update(1000.0, {valid(1, 0.0f, 0.0f)}).empty());
    EXPECT_EQ(classifier.trackCount(), 0u);
}

TEST_F(GestureClassifierTest, SingleDroppedFrameDoesNotRelease) {
    classifier.update(1000.0, {valid(1, 300.0f, 200.0f)});
    EXPECT_TRUE(classifier.update(1033.0, {}).empty());
    EXPECT_EQ(classifier.getState(1), State::Candidate);
    EXPECT_TRUE(classifier.update(1066.0, {valid(1, 300.0f, 200.0f)}).empty());
    EXPECT_TRUE(classifier.update(1100.0, {valid(1, 300.0f, 200.0f)}).empty());

    // One real release: exactly one tap
    EXPECT_TRUE(classifier.update(1133.0, {}).empty());
    auto events = classifier.update(1166.0, {});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, InteractionKind::Tap);
    EXPECT_DOUBLE_EQ(events[0].timestampMs, 1000.0);
}

TEST_F(GestureClassifierTest, LowConfidenceRunResetsTrack) {
    classifier.update(1000.0, {valid(1, 300.0f, 200.0f)});
    EXPECT_TRUE(classifier.update(1033.0, {lowConfidence(1)}).empty());
    EXPECT_TRUE(classifier.update(1066.0, {lowConfidence(1)}).empty());
    EXPECT_TRUE(classifier.update(1100.0, {lowConfidence(1)}).empty());
    EXPECT_EQ(classifier.getState(1), State::Candidate);

    // Fourth in a row exceeds the limit; an abandoned candidate is not a tap
    EXPECT_TRUE(classifier.update(1133.0, {lowConfidence(1)}).empty());
    EXPECT_EQ(classifier.getState(1), State::Idle);
}

TEST_F(GestureClassifierTest, LongContactBecomesHoldAndNoTap) {
    float x = 300.0f, y = 200.0f;
    for (int i = 0; i <= 8; ++i) {
        EXPECT_TRUE(classifier.update(1000.0 + i * 33.0, {valid(1, x, y)}).empty());
    }
    EXPECT_EQ(classifier.getState(1), State::Holding);

    EXPECT_TRUE(classifier.update(1300.0, {}).empty());
    EXPECT_TRUE(classifier.update(1333.0, {}).empty());
    EXPECT_EQ(classifier.getState(1), State::Idle);
}

TEST_F(GestureClassifierTest, HoldThenMoveStartsSlide) {
    for (int i = 0; i <= 8; ++i) {
        classifier.update(1000.0 + i * 33.0, {valid(1, 300.0f, 200.0f)});
    }
    ASSERT_EQ(classifier.getState(1), State::Holding);

    auto events = classifier.update(1300.0, {valid(1, 340.0f, 200.0f)});
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, InteractionKind::SlideStart);
    EXPECT_DOUBLE_EQ(events[0].timestampMs, 1000.0);
    EXPECT_EQ(classifier.getState(1), State::Sliding);
}

TEST_F(GestureClassifierTest, TrackingLossTimeoutEndsSlide) {
    GestureClassifier::Config config;
    config.lowConfidenceFrames = 10;
    GestureClassifier c(config, getDefaultPlayArea());

    c.update(1000.0, {valid(1, 200.0f, 300.0f)});
    ASSERT_EQ(c.update(1033.0, {valid(1, 250.0f, 300.0f)}).size(), 2u);

    EXPECT_TRUE(c.update(1100.0, {lowConfidence(1)}).empty());
    EXPECT_TRUE(c.update(1200.0, {lowConfidence(1)}).empty());
    EXPECT_EQ(c.getState(1), State::Sliding);

    auto events = c.update(1334.0, {lowConfidence(1)});
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, InteractionKind::SlideEnd);
    EXPECT_DOUBLE_EQ(events[0].timestampMs, 1033.0);
    EXPECT_FLOAT_EQ(events[0].position.x, 250.0f);
    EXPECT_EQ(c.getState(1), State::Idle);
}

TEST_F(GestureClassifierTest, HistoryIsBounded) {
    for (int i = 0; i < 20; ++i) {
        classifier.update(1000.0 + i * 33.0, {valid(1, 300.0f, 200.0f)});
    }
    EXPECT_EQ(classifier.historySize(1), GESTURE_HISTORY_FRAMES);
}

TEST_F(GestureClassifierTest, TracksAreIndependent) {
    classifier.update(1000.0, {valid(1, 300.0f, 200.0f), valid(2, 200.0f, 300.0f)});
    classifier.update(1033.0, {valid(2, 200.0f, 300.0f)});
    auto events = classifier.update(1066.0, {valid(2, 200.0f, 300.0f)});

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, InteractionKind::Tap);
    EXPECT_EQ(events[0].trackId, 1);
    EXPECT_EQ(classifier.getState(2), State::Candidate);
}

TEST_F(GestureClassifierTest, TransitionCallbackSeesEveryChange) {
    std::vector<std::pair<State, State>> transitions;
    classifier.setTransitionCallback([&](int, State from, State to) {
        transitions.emplace_back(from, to);
    });

    classifier.update(1000.0, {valid(1, 300.0f, 200.0f)});
    classifier.update(1033.0, {});
    classifier.update(1066.0, {});

    ASSERT_EQ(transitions.size(), 2u);
    EXPECT_EQ(transitions[0].first, State::Idle);
    EXPECT_EQ(transitions[0].second, State::Candidate);
    EXPECT_EQ(transitions[1].first, State::Candidate);
    EXPECT_EQ(transitions[1].second, State::Idle);
}

TEST_F(GestureClassifierTest, ResetDropsAllTracks) {
    classifier.update(1000.0, {valid(1, 300.0f, 200.0f), valid(2, 200.0f, 300.0f)});
    EXPECT_EQ(classifier.trackCount(), 2u);
    classifier.reset();
    EXPECT_EQ(classifier.trackCount(), 0u);
    EXPECT_FALSE(classifier.hasActiveGesture());
}
