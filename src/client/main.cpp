#include "command_line.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--device ID]       Start captioning");
    std::println(stderr, "  stop                      Stop captioning");
    std::println(stderr, "  status                    Show pipeline status");
    std::println(stderr, "  devices                   List audio input devices");
    std::println(stderr, "  device [ID]               Use ID (or the default input) from the next start");
    std::println(stderr, "  history [--limit N] [--search TEXT]");
    std::println(stderr, "                            Show recent captions");
    std::println(stderr, "  set [--font F] [--size N] [--color C] [--position floating|top|bottom]");
    std::println(stderr, "      [--fullscreen on|off] [--history N]");
}

static void print_response(const std::string& command, const json& response) {
    if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("reason")) {
            std::println("Reason: {}", response["reason"].get<std::string>());
        }
        auto device = response.value("device", "");
        std::println("Device: {}", device.empty() ? "default" : device);
        std::println("Model: {}", response.value("model", "unknown"));
        if (response.contains("model_error")) {
            std::println("Model error: {}", response["model_error"].get<std::string>());
        }
        std::println("Caption: {}", response.value("caption", ""));
        std::println("Frames: {}, faults: {}, utterances: {}",
                     response.value("frames", 0), response.value("recognizer_faults", 0),
                     response.value("utterances", 0));
    } else if (command == "devices") {
        auto selected = response.value("selected", "");
        for (auto& d : response.value("devices", json::array())) {
            auto id = d.value("id", "");
            std::println("{} {}\t{}", id == selected ? '*' : ' ', id, d.value("name", ""));
        }
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
        }
    } else if (command == "set") {
        std::println("{}", response.value("display", json::object()).dump(2));
    } else if (response.contains("message")) {
        std::println("{}", response["message"].get<std::string>());
    } else {
        std::println("OK");
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args[0] == "-h" || args[0] == "--help") {
        usage(argv[0]);
        return 0;
    }

    auto request = build_request(args);
    if (!request) {
        std::println(stderr, "{}", request.error());
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    if (auto connected = client.connect(platform::control_socket_path()); !connected) {
        std::println(stderr, "{}", connected.error());
        return 1;
    }

    auto reply = client.request(*request);
    if (!reply) {
        std::println(stderr, "{}", reply.error());
        return 1;
    }
    const json& response = *reply;

    if (response.value("status", "") == "error") {
        auto code = response.value("code", "");
        if (code.empty()) {
            std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        } else {
            std::println(stderr, "Error ({}): {}", code, response.value("message", "unknown error"));
        }
        return 1;
    }

    print_response(args[0], response);
    return 0;
}
