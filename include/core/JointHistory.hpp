#pragma once

#include "Types.hpp"
#include "RingBuffer.hpp"
#include "JointPoseProvider.hpp"
#include <optional>
#include <stdexcept>

namespace core {

/**
 * Thrown when a distance is requested from a history without samples.
 */
class NoPoseDataError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * JointHistory: sliding window of recent poses for one joint of one hand
 *
 * Holds the last HISTORY_WINDOW_SIZE samples (oldest evicted first) and
 * derives velocities from them using the real elapsed time between samples,
 * so variable tick rates are tolerated.
 *
 * Short history is not an error: velocity queries return a zero vector
 * and log a warning.
 */
class JointHistory {
public:
    using Buffer = RingBuffer<TimestampedPose, HISTORY_WINDOW_SIZE>;

    JointHistory(const JointPoseProvider& provider, Handedness hand, HandJoint joint);

    /**
     * Pull the current pose from the provider, stamped with provider.now().
     * No-op if the hand or joint is unavailable (history is kept).
     */
    void update();

    /**
     * Same as update(), with an explicit timestamp shared by all joints of a tick
     */
    void update(double timestamp);

    /**
     * Mean of per-step velocities over the window (m/s)
     */
    [[nodiscard]] math::Vec3 averageVelocity() const;

    /**
     * Distance between the most recent positions of two joints.
     * @throws NoPoseDataError if either history is empty
     */
    [[nodiscard]] static float currentDistance(const JointHistory& a, const JointHistory& b);

    /**
     * Mean relative velocity (velocity of a minus velocity of b).
     * Samples are paired by timestamp, so a tick where only one of the
     * joints was tracked does not shift the comparison.
     */
    [[nodiscard]] static math::Vec3 averageInterJointVelocity(const JointHistory& a, const JointHistory& b);

    [[nodiscard]] size_t size() const { return history_.size(); }
    [[nodiscard]] bool empty() const { return history_.empty(); }

    /**
     * Most recent sample.
     * @throws NoPoseDataError if empty
     */
    [[nodiscard]] const TimestampedPose& latest() const;

    // 0 = oldest
    [[nodiscard]] const TimestampedPose& sample(size_t index) const { return history_[index]; }

    [[nodiscard]] Handedness hand() const { return hand_; }
    [[nodiscard]] HandJoint joint() const { return joint_; }

private:
    const JointPoseProvider& provider_;
    Handedness hand_;
    HandJoint joint_;
    Buffer history_;

    // Velocity between two samples, nullopt if time did not advance
    static std::optional<math::Vec3> stepVelocity(const TimestampedPose& prev, const TimestampedPose& curr);
};

} // namespace core
