#include "core/JointHistory.hpp"
#include "core/Logger.hpp"
#include <array>
#include <cmath>
#include <utility>

namespace core {

JointHistory::JointHistory(const JointPoseProvider& provider, Handedness hand, HandJoint joint)
    : provider_(provider), hand_(hand), joint_(joint) {
}

void JointHistory::update() {
    update(provider_.now());
}

void JointHistory::update(double timestamp) {
    std::optional<Pose> pose = provider_.tryGetJointPose(hand_, joint_);
    if (!pose) {
        return;
    }

    TimestampedPose sample;
    sample.position = pose->position;
    sample.orientation = pose->orientation;
    sample.timestamp = timestamp;
    history_.push(sample);
}

const TimestampedPose& JointHistory::latest() const {
    if (history_.empty()) {
        throw NoPoseDataError(std::string("JointHistory: no pose recorded yet for ") +
                              getHandednessName(hand_) + " " + getJointName(joint_));
    }
    return history_.back();
}

std::optional<math::Vec3> JointHistory::stepVelocity(const TimestampedPose& prev, const TimestampedPose& curr) {
    const double dt = curr.timestamp - prev.timestamp;
    if (dt <= 0.0) {
        return std::nullopt;
    }
    return (curr.position - prev.position) / static_cast<float>(dt);
}

math::Vec3 JointHistory::averageVelocity() const {
    if (history_.size() < 2) {
        Logger::warn("JointHistory: average velocity of ", getHandednessName(hand_), " ",
                     getJointName(joint_), " requested with ", history_.size(), " recorded pose(s)");
        return math::Vec3::zero();
    }

    math::Vec3 sum = math::Vec3::zero();
    int steps = 0;
    for (size_t i = 1; i < history_.size(); ++i) {
        auto v = stepVelocity(history_[i - 1], history_[i]);
        if (v) {
            sum += *v;
            ++steps;
        }
    }

    if (steps == 0) {
        Logger::warn("JointHistory: no time elapsed across ", history_.size(), " poses of ",
                     getHandednessName(hand_), " ", getJointName(joint_));
        return math::Vec3::zero();
    }
    return sum / static_cast<float>(steps);
}

float JointHistory::currentDistance(const JointHistory& a, const JointHistory& b) {
    return math::distance(a.latest().position, b.latest().position);
}

math::Vec3 JointHistory::averageInterJointVelocity(const JointHistory& a, const JointHistory& b) {
    // Pair samples recorded at the same instant (both histories are ordered by time)
    std::array<std::pair<size_t, size_t>, HISTORY_WINDOW_SIZE> aligned{};
    size_t alignedCount = 0;

    size_t i = 0;
    size_t j = 0;
    while (i < a.history_.size() && j < b.history_.size()) {
        const double ta = a.history_[i].timestamp;
        const double tb = b.history_[j].timestamp;
        if (std::abs(ta - tb) <= TIMESTAMP_MATCH_TOLERANCE_S) {
            aligned[alignedCount++] = {i, j};
            ++i;
            ++j;
        } else if (ta < tb) {
            ++i;
        } else {
            ++j;
        }
    }

    if (alignedCount < 2) {
        // Routine while one joint is untracked, so kept out of the per-tick WARN stream
        Logger::debug("JointHistory: relative velocity of ", getJointName(a.joint_), " / ",
                      getJointName(b.joint_), " requested with ", alignedCount, " aligned pose(s)");
        return math::Vec3::zero();
    }

    math::Vec3 sum = math::Vec3::zero();
    int steps = 0;
    for (size_t k = 1; k < alignedCount; ++k) {
        auto va = stepVelocity(a.history_[aligned[k - 1].first], a.history_[aligned[k].first]);
        auto vb = stepVelocity(b.history_[aligned[k - 1].second], b.history_[aligned[k].second]);
        if (va && vb) {
            sum += *va - *vb;
            ++steps;
        }
    }

    if (steps == 0) {
        Logger::debug("JointHistory: no time elapsed across aligned poses of ",
                      getJointName(a.joint_), " / ", getJointName(b.joint_));
        return math::Vec3::zero();
    }
    return sum / static_cast<float>(steps);
}

} // namespace core
