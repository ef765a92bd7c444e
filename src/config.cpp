#include "config.hpp"

#include <fstream>

namespace huddle {

namespace {

using json = nlohmann::json;

ConfigError InvalidType(const char* key, const char* expected) {
    return ConfigError(std::string("'") + key + "' must be " + expected);
}

} // namespace

ServerConfig ServerConfig::FromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    ServerConfig cfg;

    if (auto it = j.find("bindAddress"); it != j.end()) {
        if (!it->is_string()) {
            throw InvalidType("bindAddress", "a string");
        }
        cfg.bindAddress = it->get<std::string>();
        if (cfg.bindAddress.empty()) {
            throw ConfigError("bindAddress cannot be empty");
        }
    }

    if (auto it = j.find("port"); it != j.end()) {
        if (!it->is_number_integer()) {
            throw InvalidType("port", "an integer");
        }
        auto port = it->get<int64_t>();
        if (port <= 0 || port > 65535) {
            throw ConfigError("port out of range (1..65535): " + std::to_string(port));
        }
        cfg.port = static_cast<uint16_t>(port);
    }

    if (auto it = j.find("shutdownTimeoutMs"); it != j.end()) {
        if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
            throw InvalidType("shutdownTimeoutMs", "a positive integer");
        }
        cfg.shutdownTimeout = std::chrono::milliseconds(it->get<int64_t>());
    }

    if (auto it = j.find("iceServers"); it != j.end()) {
        if (!it->is_array()) {
            throw InvalidType("iceServers", "an array of strings");
        }
        cfg.iceServers.clear();
        for (const auto& server : *it) {
            if (!server.is_string()) {
                throw InvalidType("iceServers", "an array of strings");
            }
            cfg.iceServers.push_back(server.get<std::string>());
        }
    }

    if (auto it = j.find("logLevel"); it != j.end()) {
        if (!it->is_string()) {
            throw InvalidType("logLevel", "a string");
        }
        cfg.logLevel = it->get<std::string>();
        ParseLogLevel(cfg.logLevel);
    }

    return cfg;
}

ServerConfig ServerConfig::FromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("failed to open config file: " + path);
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }

    return FromJson(j);
}

rtc::LogLevel ParseLogLevel(const std::string& level) {
    if (level == "none") return rtc::LogLevel::None;
    if (level == "fatal") return rtc::LogLevel::Fatal;
    if (level == "error") return rtc::LogLevel::Error;
    if (level == "warning") return rtc::LogLevel::Warning;
    if (level == "info") return rtc::LogLevel::Info;
    if (level == "debug") return rtc::LogLevel::Debug;
    if (level == "verbose") return rtc::LogLevel::Verbose;
    throw ConfigError("unknown log level: " + level);
}

} // namespace huddle
