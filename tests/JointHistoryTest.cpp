#include "core/JointHistory.hpp"
#include "core/Logger.hpp"
#include "FakePoseProvider.hpp"
#include <gtest/gtest.h>
#include <string>

using core::Handedness;
using core::HandJoint;
using core::JointHistory;
using core::LogLevel;
using core::Logger;

namespace {

constexpr Handedness HAND = Handedness::Right;

class JointHistoryTest : public ::testing::Test {
protected:
    test::FakePoseProvider provider;
    JointHistory thumbTip{provider, HAND, HandJoint::ThumbTip};
    JointHistory middleTip{provider, HAND, HandJoint::MiddleTip};

    void SetUp() override {
        provider.setHandPresent(HAND, true);
    }

    // Record one sample of a joint at time t
    void record(JointHistory& history, math::Vec3 position, double t) {
        provider.setJoint(HAND, history.joint(), position);
        provider.setTime(t);
        history.update();
    }
};

} // namespace

TEST_F(JointHistoryTest, NeverExceedsWindowSize) {
    for (int i = 0; i < 12; ++i) {
        record(thumbTip, {0.01f * i, 0.0f, 0.0f}, 0.1 * i);
        EXPECT_LE(thumbTip.size(), core::HISTORY_WINDOW_SIZE);
    }
    EXPECT_EQ(thumbTip.size(), core::HISTORY_WINDOW_SIZE);
}

TEST_F(JointHistoryTest, EvictsOldestSampleFirst) {
    for (int i = 1; i <= 6; ++i) {
        record(thumbTip, {static_cast<float>(i), 0.0f, 0.0f}, 0.1 * i);
    }

    ASSERT_EQ(thumbTip.size(), 5u);
    for (size_t i = 0; i < thumbTip.size(); ++i) {
        EXPECT_FLOAT_EQ(thumbTip.sample(i).position.x, static_cast<float>(i + 2));
    }
    EXPECT_FLOAT_EQ(thumbTip.latest().position.x, 6.0f);
}

TEST_F(JointHistoryTest, UpdateStampsWithProviderClock) {
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 4.25);
    EXPECT_DOUBLE_EQ(thumbTip.latest().timestamp, 4.25);

    provider.setJoint(HAND, HandJoint::ThumbTip, {1.0f, 0.0f, 0.0f});
    thumbTip.update(7.5);
    EXPECT_DOUBLE_EQ(thumbTip.latest().timestamp, 7.5);
}

TEST_F(JointHistoryTest, UnavailableJointKeepsHistory) {
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 0.0);
    record(thumbTip, {0.01f, 0.0f, 0.0f}, 0.1);

    provider.removeJoint(HAND, HandJoint::ThumbTip);
    provider.setTime(0.2);
    thumbTip.update();
    EXPECT_EQ(thumbTip.size(), 2u);

    provider.setHandPresent(HAND, false);
    thumbTip.update();
    EXPECT_EQ(thumbTip.size(), 2u);
    EXPECT_FLOAT_EQ(thumbTip.latest().position.x, 0.01f);
}

TEST_F(JointHistoryTest, AverageVelocityWithOneSampleIsZeroAndWarns) {
    record(thumbTip, {0.5f, 0.5f, 0.5f}, 1.0);

    testing::internal::CaptureStdout();
    math::Vec3 v = thumbTip.averageVelocity();
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_FLOAT_EQ(v.x, 0.0f);
    EXPECT_FLOAT_EQ(v.y, 0.0f);
    EXPECT_FLOAT_EQ(v.z, 0.0f);
    EXPECT_NE(output.find("requested with 1 recorded pose(s)"), std::string::npos);
}

TEST_F(JointHistoryTest, AverageVelocityUsesRealElapsedTime) {
    // 0.1 m/s over the first step, 0.2 m/s over the second (half the time)
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 0.0);
    record(thumbTip, {0.01f, 0.0f, 0.0f}, 0.1);
    record(thumbTip, {0.02f, 0.0f, 0.0f}, 0.15);

    math::Vec3 v = thumbTip.averageVelocity();
    EXPECT_NEAR(v.x, 0.15f, 1e-4f);
    EXPECT_NEAR(v.y, 0.0f, 1e-6f);
}

TEST_F(JointHistoryTest, AverageVelocitySkipsZeroTimeSteps) {
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 1.0);
    record(thumbTip, {0.05f, 0.0f, 0.0f}, 1.0);

    testing::internal::CaptureStdout();
    math::Vec3 v = thumbTip.averageVelocity();
    testing::internal::GetCapturedStdout();

    EXPECT_FLOAT_EQ(v.length(), 0.0f);
}

TEST_F(JointHistoryTest, CurrentDistanceUsesLatestSamples) {
    record(thumbTip, {1.0f, 0.0f, 0.0f}, 0.0);
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 0.1);
    record(middleTip, {0.0f, 0.03f, 0.04f}, 0.1);

    EXPECT_NEAR(JointHistory::currentDistance(thumbTip, middleTip), 0.05f, 1e-6f);
}

TEST_F(JointHistoryTest, CurrentDistanceIsSymmetric) {
    record(thumbTip, {0.1f, -0.2f, 0.3f}, 0.0);
    record(middleTip, {-0.05f, 0.07f, 0.02f}, 0.0);

    EXPECT_FLOAT_EQ(JointHistory::currentDistance(thumbTip, middleTip),
                    JointHistory::currentDistance(middleTip, thumbTip));
}

TEST_F(JointHistoryTest, CurrentDistanceWithoutDataThrows) {
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 0.0);

    EXPECT_THROW((void)JointHistory::currentDistance(thumbTip, middleTip), core::NoPoseDataError);
    EXPECT_THROW((void)JointHistory::currentDistance(middleTip, thumbTip), core::NoPoseDataError);
    EXPECT_THROW((void)middleTip.latest(), core::NoPoseDataError);
}

TEST_F(JointHistoryTest, InterJointVelocityIsRelative) {
    for (int i = 0; i < 3; ++i) {
        const double t = 0.1 * i;
        record(thumbTip, {0.01f * i, 0.0f, 0.0f}, t);
        record(middleTip, {0.0f, 0.0f, -0.02f * i}, t);
    }

    math::Vec3 rel = JointHistory::averageInterJointVelocity(thumbTip, middleTip);
    EXPECT_NEAR(rel.x, 0.1f, 1e-4f);
    EXPECT_NEAR(rel.y, 0.0f, 1e-6f);
    EXPECT_NEAR(rel.z, 0.2f, 1e-4f);
}

TEST_F(JointHistoryTest, InterJointVelocityWithoutSamplesIsZeroAndLogsAtDebug) {
    const LogLevel previous = Logger::getMinLevel();
    Logger::setMinLevel(LogLevel::DEBUG);

    testing::internal::CaptureStdout();
    math::Vec3 rel = JointHistory::averageInterJointVelocity(thumbTip, middleTip);
    std::string output = testing::internal::GetCapturedStdout();
    Logger::setMinLevel(previous);

    EXPECT_FLOAT_EQ(rel.length(), 0.0f);
    EXPECT_NE(output.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(output.find("requested with 0 aligned pose(s)"), std::string::npos);
}

TEST_F(JointHistoryTest, InterJointVelocityShortHistoryIsSilentAtInfo) {
    const LogLevel previous = Logger::getMinLevel();
    Logger::setMinLevel(LogLevel::INFO);
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 0.0);
    record(middleTip, {0.0f, 0.0f, 0.0f}, 0.0);

    testing::internal::CaptureStdout();
    for (int tick = 0; tick < 90; ++tick) {
        math::Vec3 rel = JointHistory::averageInterJointVelocity(thumbTip, middleTip);
        EXPECT_FLOAT_EQ(rel.length(), 0.0f);
    }
    std::string output = testing::internal::GetCapturedStdout();
    Logger::setMinLevel(previous);

    EXPECT_TRUE(output.empty());
}

TEST_F(JointHistoryTest, InterJointVelocityAlignsByTimestamp) {
    record(thumbTip, {0.0f, 0.0f, 0.0f}, 0.0);
    record(middleTip, {0.0f, 0.0f, 0.0f}, 0.0);

    // Middle tip untracked for this tick; thumb tip jumps
    record(thumbTip, {0.5f, 0.0f, 0.0f}, 0.1);

    record(thumbTip, {0.02f, 0.0f, 0.0f}, 0.2);
    record(middleTip, {0.0f, 0.0f, 0.0f}, 0.2);

    ASSERT_EQ(thumbTip.size(), 3u);
    ASSERT_EQ(middleTip.size(), 2u);

    // Only the samples at t=0 and t=0.2 are compared
    math::Vec3 rel = JointHistory::averageInterJointVelocity(thumbTip, middleTip);
    EXPECT_NEAR(rel.x, 0.1f, 1e-4f);
}
