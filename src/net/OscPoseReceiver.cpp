#include "net/OscPoseReceiver.hpp"
#include "core/Logger.hpp"
#include <stdexcept>

namespace net {

namespace {

size_t handIndex(core::Handedness hand) {
    return hand == core::Handedness::Left ? 0 : 1;
}

} // namespace

OscPoseReceiver::OscPoseReceiver(const Config& config)
    : _config(config), _epoch(std::chrono::steady_clock::now()) {
}

OscPoseReceiver::~OscPoseReceiver() {
    stop();
}

void OscPoseReceiver::start() {
    if (_serverThread) return;

    const char* port = _config.port.empty() ? nullptr : _config.port.c_str();
    _serverThread = lo_server_thread_new(port, &OscPoseReceiver::errorHandler);
    if (!_serverThread) {
        throw std::runtime_error("OscPoseReceiver: Failed to open OSC port " + _config.port);
    }

    lo_server_thread_add_method(_serverThread, "/hand/joint", "ssfffffff",
                                &OscPoseReceiver::jointHandler, this);
    lo_server_thread_add_method(_serverThread, "/hand/lost", "s",
                                &OscPoseReceiver::lostHandler, this);

    if (lo_server_thread_start(_serverThread) < 0) {
        lo_server_thread_free(_serverThread);
        _serverThread = nullptr;
        throw std::runtime_error("OscPoseReceiver: Failed to start OSC server thread");
    }

    core::Logger::info("OscPoseReceiver listening on port ", getPort(),
                       " (stale after ", _config.staleTimeout * 1000.0, " ms)");
}

void OscPoseReceiver::stop() {
    if (!_serverThread) return;

    lo_server_thread_stop(_serverThread);
    lo_server_thread_free(_serverThread);
    _serverThread = nullptr;
    core::Logger::info("OscPoseReceiver stopped.");
}

int OscPoseReceiver::getPort() const {
    if (!_serverThread) return -1;
    return lo_server_thread_get_port(_serverThread);
}

double OscPoseReceiver::now() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - _epoch).count();
}

bool OscPoseReceiver::isFresh(const HandEntry& hand, const JointEntry& joint, double now) const {
    if (joint.receivedAt < 0.0) return false;
    if (joint.receivedAt <= hand.lostAt) return false;
    return now - joint.receivedAt <= _config.staleTimeout;
}

std::optional<core::Pose> OscPoseReceiver::tryGetJointPose(core::Handedness hand, core::HandJoint joint) const {
    const double t = now();
    std::lock_guard<std::mutex> lock(_mutex);

    const HandEntry& handEntry = _hands[handIndex(hand)];
    const JointEntry& jointEntry = handEntry.joints[static_cast<size_t>(joint)];
    if (!isFresh(handEntry, jointEntry, t)) {
        return std::nullopt;
    }
    return jointEntry.pose;
}

bool OscPoseReceiver::isHandPresent(core::Handedness hand) const {
    const double t = now();
    std::lock_guard<std::mutex> lock(_mutex);

    const HandEntry& handEntry = _hands[handIndex(hand)];
    for (const auto& joint : handEntry.joints) {
        if (isFresh(handEntry, joint, t)) {
            return true;
        }
    }
    return false;
}

void OscPoseReceiver::onJointPose(core::Handedness hand, core::HandJoint joint, const core::Pose& pose) {
    const double t = now();
    std::lock_guard<std::mutex> lock(_mutex);

    JointEntry& entry = _hands[handIndex(hand)].joints[static_cast<size_t>(joint)];
    entry.pose = pose;
    entry.receivedAt = t;
}

void OscPoseReceiver::onHandLost(core::Handedness hand) {
    const double t = now();
    std::lock_guard<std::mutex> lock(_mutex);
    _hands[handIndex(hand)].lostAt = t;
}

int OscPoseReceiver::jointHandler(const char* /*path*/, const char* /*types*/, lo_arg** argv, int argc,
                                  lo_message /*msg*/, void* userData) {
    auto* self = static_cast<OscPoseReceiver*>(userData);
    if (argc < 9) return 1;

    const std::string handName = &argv[0]->s;
    const std::string jointName = &argv[1]->s;

    auto hand = core::parseHandedness(handName);
    auto joint = core::parseHandJoint(jointName);
    if (!hand || !joint) {
        core::Logger::warn("OscPoseReceiver: Ignoring pose for unknown hand/joint '",
                           handName, "' / '", jointName, "'");
        return 0;
    }

    core::Pose pose;
    pose.position = {argv[2]->f, argv[3]->f, argv[4]->f};
    pose.orientation = {argv[5]->f, argv[6]->f, argv[7]->f, argv[8]->f};
    self->onJointPose(*hand, *joint, pose);
    return 0;
}

int OscPoseReceiver::lostHandler(const char* /*path*/, const char* /*types*/, lo_arg** argv, int argc,
                                 lo_message /*msg*/, void* userData) {
    auto* self = static_cast<OscPoseReceiver*>(userData);
    if (argc < 1) return 1;

    const std::string handName = &argv[0]->s;
    auto hand = core::parseHandedness(handName);
    if (!hand) {
        core::Logger::warn("OscPoseReceiver: Ignoring /hand/lost for unknown hand '", handName, "'");
        return 0;
    }

    self->onHandLost(*hand);
    return 0;
}

void OscPoseReceiver::errorHandler(int num, const char* msg, const char* where) {
    core::Logger::error("OscPoseReceiver: liblo error ", num, " in ",
                        (where ? where : "?"), ": ", (msg ? msg : "?"));
}

} // namespace net
