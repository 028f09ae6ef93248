#include <gtest/gtest.h>
#include "core/Session.hpp"
#include "core/Logger.hpp"
#include <tuple>
#include <vector>

using namespace core;

namespace {

constexpr TimestampMs CAMERA_ORIGIN = 5000.0;

// 640x480 camera covering the 600x600 play-area square
std::vector<CalibrationPair> cornerPairs() {
    return {
        {{0.0f, 0.0f},     {0.0f, 0.0f}},
        {{640.0f, 0.0f},   {600.0f, 0.0f}},
        {{640.0f, 480.0f}, {600.0f, 600.0f}},
        {{0.0f, 480.0f},   {0.0f, 600.0f}},
    };
}

// Camera pixel that lands on the given play-area point
TrackedPoint touch(int trackId, float areaX, float areaY, float confidence = 0.9f) {
    TrackedPoint p;
    p.trackId = trackId;
    p.x = areaX * 640.0f / 600.0f;
    p.y = areaY * 480.0f / 600.0f;
    p.confidence = confidence;
    return p;
}

TrackedFrame frameAt(TimestampMs gameMs, std::vector<TrackedPoint> points = {}) {
    TrackedFrame frame;
    frame.timestampMs = CAMERA_ORIGIN + gameMs;
    for (auto& p : points) p.timestampMs = frame.timestampMs;
    frame.points = std::move(points);
    return frame;
}

// Tap on note 1 at 1000ms, nothing for note 2 at 1500ms; 25ms frames
std::vector<TrackedFrame> demoFrames() {
    std::vector<TrackedFrame> frames;
    for (int t = 0; t <= 2400; t += 25) {
        if (t >= 1000 && t <= 1050) {
            frames.push_back(frameAt(t, {touch(1, 300.0f, 150.0f)}));
        } else {
            frames.push_back(frameAt(t));
        }
    }
    return frames;
}

std::vector<Note> demoPattern() {
    return {Note::tap(1, 1000.0, {300.0f, 150.0f}), Note::tap(2, 1500.0, {150.0f, 300.0f})};
}

using GradeRecord = std::tuple<uint32_t, Grade, double>;

std::vector<GradeRecord> runDemo(Session& session) {
    std::vector<GradeRecord> out;
    for (const auto& frame : demoFrames()) {
        TickResult result = session.tick(frame);
        for (const auto& r : result.resolutions) {
            out.emplace_back(r.noteId, r.grade, r.deltaMs.value_or(-1.0));
        }
    }
    return out;
}

} // namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::WARN);
    }

    void makeReady(Session& session, std::vector<Note> pattern) {
        ASSERT_TRUE(session.calibrate(cornerPairs()));
        ASSERT_TRUE(session.loadPattern(std::move(pattern)));
        ASSERT_EQ(session.state(), Session::State::Ready);
    }
};

TEST_F(SessionTest, StartWithoutProfileOrPatternThrowsNotReady) {
    Session session;
    EXPECT_EQ(session.state(), Session::State::AwaitingCalibration);
    try {
        session.start(0.0);
        FAIL() << "expected NotReady";
    } catch (const SessionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotReady);
    }

    ASSERT_TRUE(session.calibrate(cornerPairs()));
    EXPECT_EQ(session.state(), Session::State::AwaitingPattern);
    EXPECT_THROW(session.start(0.0), SessionError);
}

TEST_F(SessionTest, FailedCalibrationKeepsWaiting) {
    Session session;
    EXPECT_FALSE(session.calibrate({{{0.0f, 0.0f}, {0.0f, 0.0f}}}));
    EXPECT_EQ(session.state(), Session::State::AwaitingCalibration);
    EXPECT_FALSE(session.mapper().isCalibrated());
}

TEST_F(SessionTest, InvalidPatternLeavesSessionUsable) {
    Session session;
    ASSERT_TRUE(session.calibrate(cornerPairs()));
    EXPECT_FALSE(session.loadPattern({}));
    EXPECT_EQ(session.state(), Session::State::AwaitingPattern);

    EXPECT_TRUE(session.loadPattern(demoPattern()));
    EXPECT_EQ(session.state(), Session::State::Ready);
}

TEST_F(SessionTest, UncalibratedFallbackWhenAllowed) {
    SessionConfig config;
    config.allowUncalibrated = true;
    Session session(config);
    EXPECT_TRUE(session.mapper().isCalibrated());
    EXPECT_EQ(session.state(), Session::State::AwaitingPattern);
}

TEST_F(SessionTest, ReplayResolvesHitAndMiss) {
    Session session;
    makeReady(session, demoPattern());
    session.start(CAMERA_ORIGIN);
    EXPECT_EQ(session.state(), Session::State::Running);

    auto grades = runDemo(session);
    ASSERT_EQ(grades.size(), 2u);
    EXPECT_EQ(std::get<0>(grades[0]), 1u);
    EXPECT_EQ(std::get<1>(grades[0]), Grade::Perfect);
    EXPECT_DOUBLE_EQ(std::get<2>(grades[0]), 0.0);
    EXPECT_EQ(std::get<0>(grades[1]), 2u);
    EXPECT_EQ(std::get<1>(grades[1]), Grade::Miss);

    EXPECT_EQ(session.state(), Session::State::Finished);
    ScoreSummary summary = session.end();
    EXPECT_EQ(summary.score, 100);
    EXPECT_EQ(summary.maxCombo, 1);
    EXPECT_EQ(summary.combo, 0);
    EXPECT_DOUBLE_EQ(summary.accuracy, 50.0);
}

TEST_F(SessionTest, IdenticalReplaysGiveIdenticalGrades) {
    Session first;
    makeReady(first, demoPattern());
    first.start(CAMERA_ORIGIN);

    Session second;
    makeReady(second, demoPattern());
    second.start(CAMERA_ORIGIN);

    EXPECT_EQ(runDemo(first), runDemo(second));
}

TEST_F(SessionTest, InputLatencyShiftsJudgment) {
    SessionConfig config;
    config.inputLatencyMs = 100.0;
    Session session(config);
    makeReady(session, demoPattern());
    session.start(CAMERA_ORIGIN);

    // Camera sees the touch at 1100, game time 1000
    TickResult result;
    for (int t = 0; t <= 1300; t += 25) {
        std::vector<TrackedPoint> points;
        if (t >= 1100 && t <= 1150) points.push_back(touch(1, 300.0f, 150.0f));
        result = session.tick(frameAt(t, points));
        if (!result.resolutions.empty()) break;
    }
    ASSERT_EQ(result.resolutions.size(), 1u);
    EXPECT_EQ(result.resolutions[0].grade, Grade::Perfect);
    EXPECT_DOUBLE_EQ(*result.resolutions[0].deltaMs, 0.0);
}

TEST_F(SessionTest, SlowTapIsNotSweptBeforeConfirmation) {
    SessionConfig config;
    config.gesture.tapMaxDurationMs = 400.0;
    Session session(config);
    makeReady(session, {Note::tap(1, 1000.0, {300.0f, 150.0f})});
    session.start(CAMERA_ORIGIN);

    // Contact 167ms late, held 363ms, confirmed two frames after release at 1596
    std::vector<Resolution> resolutions;
    for (int t = 1134; t <= 1800; t += 33) {
        std::vector<TrackedPoint> points;
        if (t >= 1167 && t <= 1530) points.push_back(touch(1, 300.0f, 150.0f));
        for (auto& r : session.tick(frameAt(t, points)).resolutions) {
            resolutions.push_back(r);
        }
    }

    ASSERT_EQ(resolutions.size(), 1u);
    EXPECT_EQ(resolutions[0].grade, Grade::Good);
    EXPECT_DOUBLE_EQ(resolutions[0].deltaMs.value_or(0.0), 167.0);
    EXPECT_DOUBLE_EQ(resolutions[0].timestampMs, 1167.0);
}

TEST_F(SessionTest, StaleFramesAreDropped) {
    Session session;
    makeReady(session, demoPattern());
    session.start(CAMERA_ORIGIN);

    EXPECT_TRUE(session.tick(frameAt(100.0)).processed);
    EXPECT_FALSE(session.tick(frameAt(100.0)).processed);
    EXPECT_FALSE(session.tick(frameAt(50.0)).processed);
    EXPECT_TRUE(session.tick(frameAt(125.0)).processed);

    EXPECT_EQ(session.stats().staleFrames, 2u);
    EXPECT_EQ(session.stats().framesProcessed, 2u);
}

TEST_F(SessionTest, LowConfidencePointsAreCountedNotClassified) {
    Session session;
    makeReady(session, demoPattern());
    session.start(CAMERA_ORIGIN);

    for (int t = 0; t < 500; t += 25) {
        TickResult result = session.tick(frameAt(t, {touch(1, 300.0f, 150.0f, 0.2f)}));
        EXPECT_TRUE(result.events.empty());
    }
    EXPECT_EQ(session.stats().lowConfidencePoints, 20u);
    EXPECT_EQ(session.stats().events, 0u);
}

TEST_F(SessionTest, RecalibrationWaitsForSlideToEnd) {
    Session session;
    makeReady(session, {Note::tap(1, 10000.0, {300.0f, 150.0f})});
    session.start(CAMERA_ORIGIN);

    session.tick(frameAt(100.0, {touch(1, 300.0f, 150.0f)}));
    TickResult result = session.tick(frameAt(125.0, {touch(1, 345.0f, 150.0f)}));
    ASSERT_EQ(result.events.size(), 2u);
    ASSERT_TRUE(session.classifier().hasActiveGesture());

    auto before = session.mapper().activeProfile();
    ASSERT_TRUE(session.calibrate(cornerPairs()));
    EXPECT_TRUE(session.mapper().hasPending());

    session.tick(frameAt(150.0, {touch(1, 375.0f, 150.0f)}));
    EXPECT_EQ(session.mapper().activeProfile(), before);

    // Release: SlideEnd on the second missing frame
    session.tick(frameAt(175.0));
    result = session.tick(frameAt(200.0));
    ASSERT_EQ(result.events.size(), 1u);
    EXPECT_EQ(result.events[0].kind, InteractionKind::SlideEnd);
    EXPECT_EQ(session.stats().profileSwaps, 0u);

    session.tick(frameAt(225.0));
    EXPECT_FALSE(session.mapper().hasPending());
    EXPECT_NE(session.mapper().activeProfile(), before);
    EXPECT_EQ(session.stats().profileSwaps, 1u);
}

TEST_F(SessionTest, SnapshotShowsLiveNotesAndScore) {
    Session session;
    makeReady(session, demoPattern());
    session.start(CAMERA_ORIGIN);

    TickResult result = session.tick(frameAt(900.0));
    ASSERT_TRUE(result.processed);
    EXPECT_DOUBLE_EQ(result.snapshot.nowMs, 900.0);
    ASSERT_EQ(result.snapshot.liveNotes.size(), 1u);
    EXPECT_EQ(result.snapshot.liveNotes[0].id, 1u);
    EXPECT_EQ(result.snapshot.score, 0);
}

TEST_F(SessionTest, PatternCannotChangeWhileRunning) {
    Session session;
    makeReady(session, demoPattern());
    session.start(CAMERA_ORIGIN);
    EXPECT_FALSE(session.loadPattern(demoPattern()));
    EXPECT_EQ(session.state(), Session::State::Running);
}

TEST_F(SessionTest, EndStopsTicking) {
    Session session;
    makeReady(session, demoPattern());
    session.start(CAMERA_ORIGIN);
    session.tick(frameAt(100.0));

    ScoreSummary summary = session.end();
    EXPECT_EQ(summary.total(), 0);
    EXPECT_EQ(session.state(), Session::State::Finished);
    EXPECT_FALSE(session.tick(frameAt(200.0)).processed);
}
