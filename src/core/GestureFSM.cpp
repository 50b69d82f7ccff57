#include "core/GestureFSM.hpp"
#include "core/Logger.hpp"
#include <stdexcept>

namespace core {

namespace {

void validateThreshold(const char* name, float value) {
    if (!(value > 0.0f)) {
        throw std::invalid_argument(std::string("GestureFSM: ") + name + " must be positive");
    }
}

} // namespace

GestureFSM::GestureFSM(const JointPoseProvider& provider, const Config& config)
    : provider_(provider), config_(config) {
    validateThreshold("readyDistanceThreshold", config_.readyDistanceThreshold);
    validateThreshold("velocityThreshold", config_.velocityThreshold);
    validateThreshold("completedDistanceThreshold", config_.completedDistanceThreshold);
    enable();
}

GestureFSM::GestureFSM(const JointPoseProvider& provider)
    : GestureFSM(provider, Config{}) {
}

const char* GestureFSM::getStateName(GestureState state) {
    switch (state) {
        case GestureState::Uninitialized: return "UNINITIALIZED";
        case GestureState::Idle:          return "IDLE";
        case GestureState::Ready:         return "READY";
        case GestureState::Snapping:      return "SNAPPING";
        default: return "unknown";
    }
}

void GestureFSM::enable() {
    const Handedness hand = config_.trackedHand;
    thumbBase_ = std::make_unique<JointHistory>(provider_, hand, HandJoint::ThumbMetacarpal);
    thumbTip_ = std::make_unique<JointHistory>(provider_, hand, HandJoint::ThumbTip);
    middleTip_ = std::make_unique<JointHistory>(provider_, hand, HandJoint::MiddleTip);
    state_ = GestureState::Uninitialized;
    enabled_ = true;

    Logger::info("GestureFSM: Snap detection enabled for ", getHandednessName(hand), " hand",
                 " (ready < ", config_.readyDistanceThreshold,
                 " m, velocity > ", config_.velocityThreshold,
                 " m/s, completed < ", config_.completedDistanceThreshold, " m)");
}

void GestureFSM::disable() {
    if (!enabled_) return;

    enabled_ = false;
    if (state_ != GestureState::Uninitialized) {
        transitionTo(GestureState::Uninitialized);
    }
    thumbBase_.reset();
    thumbTip_.reset();
    middleTip_.reset();

    Logger::info("GestureFSM: Snap detection disabled");
}

void GestureFSM::reset() {
    disable();
    enable();
}

void GestureFSM::tick() {
    if (!enabled_) return;

    try {
        if (!provider_.isHandPresent(config_.trackedHand)) {
            handleHandLost();
            return;
        }

        if (state_ == GestureState::Uninitialized) {
            transitionTo(GestureState::Idle);
        }

        // One timestamp per tick keeps the three histories aligned
        const double now = provider_.now();
        thumbBase_->update(now);
        thumbTip_->update(now);
        middleTip_->update(now);

        evaluate(now);
    } catch (const std::exception& e) {
        Logger::error("GestureFSM: Tick failed in state ", getStateName(state_), ": ", e.what());
    }
}

void GestureFSM::handleHandLost() {
    // Recurring condition, not an error: stay Uninitialized until the hand returns
    if (state_ != GestureState::Uninitialized) {
        Logger::info("GestureFSM: ", getHandednessName(config_.trackedHand), " hand lost");
        transitionTo(GestureState::Uninitialized);
    }
}

void GestureFSM::evaluate(double timestamp) {
    switch (state_) {
        case GestureState::Idle: {
            if (thumbTip_->empty() || middleTip_->empty()) {
                Logger::debug("GestureFSM: Waiting for thumb tip / middle tip poses");
                return;
            }
            const float tipDistance = JointHistory::currentDistance(*thumbTip_, *middleTip_);
            if (tipDistance < config_.readyDistanceThreshold) {
                transitionTo(GestureState::Ready);
            }
            break;
        }

        case GestureState::Ready: {
            if (thumbTip_->empty() || middleTip_->empty()) {
                Logger::debug("GestureFSM: Waiting for thumb tip / middle tip poses");
                return;
            }
            const float relativeSpeed =
                JointHistory::averageInterJointVelocity(*thumbTip_, *middleTip_).length();
            if (relativeSpeed > config_.velocityThreshold) {
                Logger::debug("GestureFSM: Relative tip speed ", relativeSpeed, " m/s");
                transitionTo(GestureState::Snapping);
                break;
            }
            // Exit threshold above the entry threshold (hysteresis)
            const float tipDistance = JointHistory::currentDistance(*thumbTip_, *middleTip_);
            if (tipDistance > config_.readyDistanceThreshold * SNAP_READY_EXIT_FACTOR) {
                transitionTo(GestureState::Idle);
            }
            break;
        }

        case GestureState::Snapping: {
            // TODO: fall back out of Snapping after ~0.3 s without completion once the
            // target state (Idle or Ready) is decided.
            if (thumbBase_->empty() || middleTip_->empty()) {
                Logger::debug("GestureFSM: Waiting for thumb base / middle tip poses");
                return;
            }
            const float baseDistance = JointHistory::currentDistance(*thumbBase_, *middleTip_);
            if (baseDistance < config_.completedDistanceThreshold) {
                transitionTo(GestureState::Idle);
                fireSnapCompleted(timestamp);
            }
            break;
        }

        case GestureState::Uninitialized:
            break;
    }
}

void GestureFSM::fireSnapCompleted(double timestamp) {
    ++snapCount_;
    Logger::info("GestureFSM: Snap completed (", getHandednessName(config_.trackedHand),
                 " hand, #", snapCount_, ")");

    if (!snapCallback_) return;

    SnapEvent event;
    event.hand = config_.trackedHand;
    event.timestamp = timestamp;
    try {
        snapCallback_(event);
    } catch (const std::exception& e) {
        Logger::error("GestureFSM: Snap callback failed: ", e.what());
    }
}

void GestureFSM::transitionTo(GestureState newState) {
    GestureState oldState = state_;
    state_ = newState;

    Logger::info("GestureFSM: ", getStateName(oldState), " → ", getStateName(newState));

    if (!transitionCallback_) return;

    try {
        transitionCallback_(oldState, newState);
    } catch (const std::exception& e) {
        Logger::error("GestureFSM: Transition callback failed: ", e.what());
    }
}

} // namespace core
