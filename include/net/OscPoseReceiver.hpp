#pragma once

#include <array>
#include <chrono>
#include <mutex>
#include <string>
#include <lo/lo.h>
#include "core/Types.hpp"
#include "core/JointPoseProvider.hpp"

namespace net {

/**
 * Joint pose provider fed by an external hand tracker over OSC.
 *
 *   /hand/joint  s s f f f f f f f   hand, joint, px py pz, qx qy qz qw
 *   /hand/lost   s                   hand
 *
 * Keeps the latest pose per (hand, joint). A pose is only served while it
 * is younger than staleTimeout; /hand/lost invalidates everything received
 * for that hand before it.
 *
 * Thread-safety: the liblo server thread writes, the tick thread reads.
 */
class OscPoseReceiver : public core::JointPoseProvider {
public:
    struct Config {
        std::string port = core::OSC_LISTEN_PORT;  // empty: any free port
        double staleTimeout = core::POSE_STALE_TIMEOUT_S;
    };

    explicit OscPoseReceiver(const Config& config);
    ~OscPoseReceiver() override;

    // Non-copyable
    OscPoseReceiver(const OscPoseReceiver&) = delete;
    OscPoseReceiver& operator=(const OscPoseReceiver&) = delete;

    /**
     * Open the UDP port and start the liblo server thread.
     * Throws std::runtime_error if the port cannot be opened.
     */
    void start();
    void stop();

    [[nodiscard]] bool isRunning() const { return _serverThread != nullptr; }

    /**
     * Bound UDP port, or -1 when not running
     */
    [[nodiscard]] int getPort() const;

    // JointPoseProvider
    [[nodiscard]] std::optional<core::Pose> tryGetJointPose(core::Handedness hand,
                                                           core::HandJoint joint) const override;
    [[nodiscard]] bool isHandPresent(core::Handedness hand) const override;
    [[nodiscard]] double now() const override;

    /**
     * Record a joint pose (called from the OSC handler)
     */
    void onJointPose(core::Handedness hand, core::HandJoint joint, const core::Pose& pose);

    /**
     * Mark a hand as lost (called from the OSC handler)
     */
    void onHandLost(core::Handedness hand);

private:
    struct JointEntry {
        core::Pose pose;
        double receivedAt = -1.0;
    };

    struct HandEntry {
        std::array<JointEntry, core::HAND_JOINT_COUNT> joints{};
        double lostAt = -1.0;
    };

    static int jointHandler(const char* path, const char* types, lo_arg** argv, int argc,
                            lo_message msg, void* userData);
    static int lostHandler(const char* path, const char* types, lo_arg** argv, int argc,
                           lo_message msg, void* userData);
    static void errorHandler(int num, const char* msg, const char* where);

    bool isFresh(const HandEntry& hand, const JointEntry& joint, double now) const;

    Config _config;
    std::chrono::steady_clock::time_point _epoch;

    lo_server_thread _serverThread = nullptr;

    mutable std::mutex _mutex;
    std::array<HandEntry, 2> _hands{};
};

} // namespace net
