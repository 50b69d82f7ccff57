#include "core/Types.hpp"
#include <array>

namespace core {

namespace {

constexpr std::array<const char*, HAND_JOINT_COUNT> JOINT_NAMES = {
    "palm",
    "wrist",
    "thumb_metacarpal",
    "thumb_proximal",
    "thumb_distal",
    "thumb_tip",
    "index_metacarpal",
    "index_proximal",
    "index_intermediate",
    "index_distal",
    "index_tip",
    "middle_metacarpal",
    "middle_proximal",
    "middle_intermediate",
    "middle_distal",
    "middle_tip",
    "ring_metacarpal",
    "ring_proximal",
    "ring_intermediate",
    "ring_distal",
    "ring_tip",
    "little_metacarpal",
    "little_proximal",
    "little_intermediate",
    "little_distal",
    "little_tip",
};

} // namespace

const char* getHandednessName(Handedness hand) {
    switch (hand) {
        case Handedness::Left:  return "left";
        case Handedness::Right: return "right";
        default: return "unknown";
    }
}

const char* getJointName(HandJoint joint) {
    const auto index = static_cast<size_t>(joint);
    if (index >= JOINT_NAMES.size()) {
        return "unknown";
    }
    return JOINT_NAMES[index];
}

std::optional<Handedness> parseHandedness(const std::string& name) {
    if (name == "left") return Handedness::Left;
    if (name == "right") return Handedness::Right;
    return std::nullopt;
}

std::optional<HandJoint> parseHandJoint(const std::string& name) {
    for (size_t i = 0; i < JOINT_NAMES.size(); ++i) {
        if (name == JOINT_NAMES[i]) {
            return static_cast<HandJoint>(i);
        }
    }
    return std::nullopt;
}

} // namespace core
