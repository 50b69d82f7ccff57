#include "core/GestureFSM.hpp"
#include "core/Logger.hpp"
#include "core/Types.hpp"
#include "net/OscPoseReceiver.hpp"
#include "net/OscSender.hpp"
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

// Global flags for shutdown, set from the signal handler
std::atomic<bool> g_running{true};
std::atomic<int> g_signal{0};

void signalHandler(int signum) {
    g_signal = signum;
    g_running = false;
}

int main() {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    core::Logger::setMinLevel(core::LogLevel::INFO);
    core::Logger::info("Starting SnapGestureService...");

    // Configuration
    net::OscPoseReceiver::Config receiverConfig;
    receiverConfig.port = core::OSC_LISTEN_PORT;
    receiverConfig.staleTimeout = core::POSE_STALE_TIMEOUT_S;

    core::GestureFSM::Config fsmConfig;
    fsmConfig.trackedHand = core::Handedness::Right;
    fsmConfig.readyDistanceThreshold = core::SNAP_READY_DISTANCE_M;
    fsmConfig.velocityThreshold = core::SNAP_VELOCITY_THRESHOLD_MPS;
    fsmConfig.completedDistanceThreshold = core::SNAP_COMPLETED_DISTANCE_M;

    const auto tickPeriod = std::chrono::microseconds(1000000 / core::TICK_RATE_HZ);

    // Outer loop for auto-restart
    while (g_running) {
        try {
            // 1. Pose input
            net::OscPoseReceiver receiver(receiverConfig);
            receiver.start();

            // 2. Output
            net::OscSender oscSender(core::OSC_TARGET_HOST, core::OSC_TARGET_PORT);
            if (!oscSender.start()) {
                core::Logger::warn("OSC output unavailable, snaps are only logged.");
            }

            // 3. Snap detector
            core::GestureFSM fsm(receiver, fsmConfig);
            fsm.setTransitionCallback([&oscSender](core::GestureState, core::GestureState to) {
                oscSender.sendState(to);
            });
            fsm.setSnapCallback([&oscSender, &fsm](const core::SnapEvent& event) {
                oscSender.sendSnapCompleted(event, fsm.getSnapCount());
            });
            oscSender.sendState(fsm.getState());

            core::Logger::info("Service running at ", core::TICK_RATE_HZ, " Hz, OSC output ",
                               (oscSender.isRunning() ? "on" : "off"), ". Press Ctrl+C to exit.");

            // Tick loop (fixed rate)
            auto nextTick = std::chrono::steady_clock::now();
            while (g_running) {
                fsm.tick();

                nextTick += tickPeriod;
                auto now = std::chrono::steady_clock::now();
                if (nextTick < now) {
                    // Overrun: resync instead of bursting to catch up
                    nextTick = now;
                }
                std::this_thread::sleep_until(nextTick);
            }

            core::Logger::info("Interrupt signal (", g_signal.load(), ") received. Shutting down...");

            // Shutdown: stop explicitly to ensure clean cleanup order
            core::Logger::info("Stopping modules...");
            fsm.disable();
            receiver.stop();
            oscSender.stop();
        } catch (const std::exception& e) {
            core::Logger::error("Fatal error in service loop: ", e.what());
            if (g_running) {
                core::Logger::info("Retrying in 5 seconds...");
                std::this_thread::sleep_for(std::chrono::seconds(5));
            }
        }
    }

    core::Logger::info("Service stopped cleanly.");
    return 0;
}
