#pragma once

#include "Types.hpp"
#include "JointHistory.hpp"
#include "JointPoseProvider.hpp"
#include <functional>
#include <memory>

namespace core {

/**
 * GestureFSM: Finite State Machine for finger snap recognition
 *
 * States: Uninitialized → Idle → Ready → Snapping → Idle (+ snap event)
 *
 * Features:
 * - Hysteresis thresholds (Ready is left at 1.5x the entry distance)
 * - Velocity from a 5-sample joint history, real elapsed time per step
 * - At most one transition per tick
 *
 * Single-threaded: tick() is called once per frame by the host.
 * No exception escapes tick().
 */
class GestureFSM {
public:
    struct Config {
        Handedness trackedHand = Handedness::Right;
        float readyDistanceThreshold = SNAP_READY_DISTANCE_M;
        float velocityThreshold = SNAP_VELOCITY_THRESHOLD_MPS;
        float completedDistanceThreshold = SNAP_COMPLETED_DISTANCE_M;
    };

    using TransitionCallback = std::function<void(GestureState from, GestureState to)>;
    using SnapCallback = std::function<void(const SnapEvent& event)>;

    /**
     * Detection starts enabled.
     * @throws std::invalid_argument on non-positive thresholds
     */
    GestureFSM(const JointPoseProvider& provider, const Config& config);
    explicit GestureFSM(const JointPoseProvider& provider);

    // Non-copyable
    GestureFSM(const GestureFSM&) = delete;
    GestureFSM& operator=(const GestureFSM&) = delete;

    /**
     * Advance one frame: check the hand, sample the three joints,
     * evaluate the current state's exit conditions.
     */
    void tick();

    [[nodiscard]] GestureState getState() const { return state_; }

    [[nodiscard]] static const char* getStateName(GestureState state);

    [[nodiscard]] const Config& getConfig() const { return config_; }

    /**
     * Number of completed snaps since construction
     */
    [[nodiscard]] unsigned int getSnapCount() const { return snapCount_; }

    void setTransitionCallback(TransitionCallback callback) { transitionCallback_ = std::move(callback); }
    void setSnapCallback(SnapCallback callback) { snapCallback_ = std::move(callback); }

    /**
     * Start detection with fresh (empty) joint histories
     */
    void enable();

    /**
     * Stop detection: histories are dropped, ticks are ignored
     */
    void disable();

    [[nodiscard]] bool isEnabled() const { return enabled_; }

    /**
     * Back to Uninitialized with empty histories
     */
    void reset();

private:
    const JointPoseProvider& provider_;
    Config config_;

    GestureState state_ = GestureState::Uninitialized;
    bool enabled_ = false;
    unsigned int snapCount_ = 0;

    std::unique_ptr<JointHistory> thumbBase_;
    std::unique_ptr<JointHistory> thumbTip_;
    std::unique_ptr<JointHistory> middleTip_;

    TransitionCallback transitionCallback_;
    SnapCallback snapCallback_;

    void handleHandLost();
    void evaluate(double timestamp);
    void fireSnapCompleted(double timestamp);
    void transitionTo(GestureState newState);
};

} // namespace core
