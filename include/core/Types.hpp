#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "math/Vec3.hpp"

namespace core {

// ============================================================
// Snap Detection Configuration
// ============================================================

// Joint history window (samples per tracked joint)
constexpr size_t HISTORY_WINDOW_SIZE = 5;

// Default thresholds (meters, meters/second)
constexpr float SNAP_READY_DISTANCE_M = 0.03f;        // thumb tip <-> middle tip: Idle -> Ready
constexpr float SNAP_VELOCITY_THRESHOLD_MPS = 0.05f;  // relative tip velocity: Ready -> Snapping
constexpr float SNAP_COMPLETED_DISTANCE_M = 0.03f;    // thumb base <-> middle tip: Snapping -> Idle
constexpr float SNAP_READY_EXIT_FACTOR = 1.5f;        // hysteresis gap for Ready -> Idle

// Samples of two joints closer than this in time belong to the same tick
constexpr double TIMESTAMP_MATCH_TOLERANCE_S = 1e-4;

// Service Configuration
constexpr int TICK_RATE_HZ = 90;
constexpr double POSE_STALE_TIMEOUT_S = 0.1;  // Joint pose older than this counts as lost
constexpr const char* OSC_LISTEN_PORT = "9001";
constexpr const char* OSC_TARGET_HOST = "127.0.0.1";
constexpr const char* OSC_TARGET_PORT = "9000";

// ============================================================
// Data Structures
// ============================================================

// Snap gesture states (no Completed state: completion is an event)
enum class GestureState {
    Uninitialized = 0,  // Tracked hand not available
    Idle = 1,           // Hand available, gesture not started
    Ready = 2,          // Thumb and middle tip close together
    Snapping = 3        // Fast closing motion detected
};

enum class Handedness {
    Left = 0,
    Right = 1
};

// Articulated hand joints (common XR hand model)
enum class HandJoint {
    Palm = 0,
    Wrist,

    ThumbMetacarpal,
    ThumbProximal,
    ThumbDistal,
    ThumbTip,

    IndexMetacarpal,
    IndexProximal,
    IndexIntermediate,
    IndexDistal,
    IndexTip,

    MiddleMetacarpal,
    MiddleProximal,
    MiddleIntermediate,
    MiddleDistal,
    MiddleTip,

    RingMetacarpal,
    RingProximal,
    RingIntermediate,
    RingDistal,
    RingTip,

    LittleMetacarpal,
    LittleProximal,
    LittleIntermediate,
    LittleDistal,
    LittleTip,

    Count
};

constexpr size_t HAND_JOINT_COUNT = static_cast<size_t>(HandJoint::Count);

struct Pose {
    math::Vec3 position;
    math::Quat orientation;
};

// One recorded joint sample. Never modified after it enters a history.
struct TimestampedPose {
    math::Vec3 position;
    math::Quat orientation;
    double timestamp = 0.0;  // monotonic seconds
};

struct SnapEvent {
    Handedness hand = Handedness::Right;
    double timestamp = 0.0;
};

// Name helpers (OSC addresses, logging)
const char* getHandednessName(Handedness hand);
const char* getJointName(HandJoint joint);
std::optional<Handedness> parseHandedness(const std::string& name);
std::optional<HandJoint> parseHandJoint(const std::string& name);

} // namespace core
