#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

// Connection to a running overlay's control socket.
class ControlClient {
public:
    virtual ~ControlClient() = default;

    virtual std::expected<void, std::string> connect(const std::string& endpoint) = 0;

    // Sends one request and waits up to `timeout_ms` for its response.
    virtual std::expected<nlohmann::json, std::string>
        request(const nlohmann::json& req, int timeout_ms = 5000) = 0;

    virtual void close() = 0;
};
