#pragma once

#include "Types.hpp"
#include <optional>

namespace core {

/**
 * Source of tracked joint poses (hand tracking backend).
 *
 * Queried fresh on every tick. Implementations decide what "available"
 * means (e.g. freshness of the last received sample).
 */
class JointPoseProvider {
public:
    virtual ~JointPoseProvider() = default;

    /**
     * Current pose of a joint, or std::nullopt if the hand or joint
     * is not tracked right now.
     */
    [[nodiscard]] virtual std::optional<Pose> tryGetJointPose(Handedness hand, HandJoint joint) const = 0;

    [[nodiscard]] virtual bool isHandPresent(Handedness hand) const = 0;

    /**
     * Monotonic time in seconds
     */
    [[nodiscard]] virtual double now() const = 0;
};

} // namespace core
