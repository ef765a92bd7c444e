#pragma once

#include <nlohmann/json.hpp>
#include <rtc/rtc.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace huddle {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ServerConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8000;
    std::chrono::milliseconds shutdownTimeout{5000};
    std::vector<std::string> iceServers = {"stun:stun.l.google.com:19302"};
    std::string logLevel = "info";

    // Missing keys keep their defaults, unknown keys are ignored.
    static ServerConfig FromJson(const nlohmann::json& j);
    static ServerConfig FromFile(const std::string& path);
};

// Throws ConfigError for unknown level names.
rtc::LogLevel ParseLogLevel(const std::string& level);

} // namespace huddle
