#pragma once

#include <string>
#include <lo/lo.h>
#include "core/Types.hpp"
#include "core/Logger.hpp"

namespace net {

/**
 * Publishes snap detector output over OSC.
 *
 *   /snap/state      i s f f f   state id, state name, indicator RGB
 *   /snap/completed  s d i f f f hand, timestamp (s), snap count, completed RGB
 *
 * Sends are fire-and-forget UDP, cheap enough to run inside the tick.
 */
class OscSender {
public:
    OscSender(const std::string& host, const std::string& port);
    ~OscSender();

    // Non-copyable
    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    /**
     * Resolve the target address.
     * @return false if liblo could not create it
     */
    bool start();
    void stop();

    bool isRunning() const { return _loAddress != nullptr; }

    void sendState(core::GestureState state);
    void sendSnapCompleted(const core::SnapEvent& event, unsigned int snapCount);

private:
    void send(const char* path, lo_message msg);

    std::string _host;
    std::string _port;

    lo_address _loAddress = nullptr;
};

} // namespace net
