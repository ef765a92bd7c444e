#include "config.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "rtc_engine.hpp"

#include <rtc/rtc.hpp>

#include <csignal>
#include <iostream>
#include <pthread.h>

int main(int argc, char* argv[]) {
    // Blocked before any thread starts so that only sigwait below sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    try {
        huddle::ServerConfig config;
        if (argc > 1) {
            std::cout << "[Server] Loading config from " << argv[1] << std::endl;
            config = huddle::ServerConfig::FromFile(argv[1]);
        }

        rtc::InitLogger(huddle::ParseLogLevel(config.logLevel));

        huddle::RoomRegistry registry(
            huddle::RtcEngine::Factory({config.iceServers}),
            huddle::Room::Options{config.shutdownTimeout});

        huddle::Router router(config, registry);
        router.Start();

        int signal = 0;
        sigwait(&signals, &signal);
        std::cout << "[Server] Caught signal " << signal << ", shutting down" << std::endl;

        router.Stop();
        registry.Shutdown();
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
