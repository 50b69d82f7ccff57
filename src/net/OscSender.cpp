#include "net/OscSender.hpp"
#include "core/GestureFSM.hpp"
#include "core/StateIndicator.hpp"

namespace net {

OscSender::OscSender(const std::string& host, const std::string& port)
    : _host(host), _port(port) {
}

OscSender::~OscSender() {
    stop();
}

bool OscSender::start() {
    if (_loAddress) return true;

    _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
    return true;
}

void OscSender::stop() {
    if (!_loAddress) return;
    lo_address_free(_loAddress);
    _loAddress = nullptr;
    core::Logger::info("OscSender stopped.");
}

void OscSender::sendState(core::GestureState state) {
    if (!_loAddress) return;

    const core::IndicatorColor color = core::getIndicatorColor(state);

    lo_message msg = lo_message_new();
    lo_message_add_int32(msg, static_cast<int32_t>(state));
    lo_message_add_string(msg, core::GestureFSM::getStateName(state));
    lo_message_add_float(msg, color.r);
    lo_message_add_float(msg, color.g);
    lo_message_add_float(msg, color.b);
    send("/snap/state", msg);
}

void OscSender::sendSnapCompleted(const core::SnapEvent& event, unsigned int snapCount) {
    if (!_loAddress) return;

    lo_message msg = lo_message_new();
    lo_message_add_string(msg, core::getHandednessName(event.hand));
    lo_message_add_double(msg, event.timestamp);
    lo_message_add_int32(msg, static_cast<int32_t>(snapCount));
    lo_message_add_float(msg, core::SNAP_COMPLETED_COLOR.r);
    lo_message_add_float(msg, core::SNAP_COMPLETED_COLOR.g);
    lo_message_add_float(msg, core::SNAP_COMPLETED_COLOR.b);
    send("/snap/completed", msg);
}

void OscSender::send(const char* path, lo_message msg) {
    int ret = lo_send_message(_loAddress, path, msg);
    if (ret == -1) {
        core::Logger::error("OscSender: Failed to send ", path, ": ", lo_address_errstr(_loAddress));
    }
    lo_message_free(msg);
}

} // namespace net
