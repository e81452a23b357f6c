#pragma once

#include "platform/control_client.hpp"

#include <string>

class UnixSocketClient : public ControlClient {
public:
    UnixSocketClient() = default;
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    std::expected<void, std::string> connect(const std::string& endpoint) override;
    std::expected<nlohmann::json, std::string>
        request(const nlohmann::json& req, int timeout_ms = 5000) override;
    void close() override;

    // Lower-level halves of request(), also used to pipeline several requests.
    std::expected<void, std::string> write_line(const nlohmann::json& msg);
    std::expected<nlohmann::json, std::string> read_line(int timeout_ms);

private:
    int fd_ = -1;
    std::string pending_; // bytes after the last complete line
};
