#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/linux/pipewire_source.hpp"

#include <print>
#include <string>

static void usage() {
    std::println("Usage: livecap [options]");
    std::println("Options:");
    std::println("  -v, --verbose        Enable verbose logging");
    std::println("  -c, --config PATH    Config file path");
    std::println("  -d, --device ID      Input device for this run (see --list-devices)");
    std::println("      --no-autostart   Wait for 'livecapctl start' before captioning");
    std::println("      --list-devices   Print audio input devices and exit");
    std::println("  -h, --help           Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool list_devices = false;
    bool no_autostart = false;
    std::string config_path;
    std::string device;
    bool device_set = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "{} needs a path", arg);
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--device" || arg == "-d") {
            if (i + 1 >= argc) {
                std::println(stderr, "{} needs a device id", arg);
                return 1;
            }
            device = argv[++i];
            device_set = true;
        } else if (arg == "--no-autostart") {
            no_autostart = true;
        } else if (arg == "--list-devices") {
            list_devices = true;
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    if (config_path.empty()) config_path = Config::default_path();

    Config config = Config::load_or_default(config_path);

    if (list_devices) {
        PipeWireSource source(config.audio.sample_rate, config.audio.block_size);
        auto devices = source.list_devices();
        if (devices.empty()) {
            std::println(stderr, "No audio input devices found");
            return 1;
        }
        for (auto& d : devices) {
            std::println("{}\t{}", d.id, d.name);
        }
        return 0;
    }

    if (device_set) config.audio.device = device;
    if (no_autostart) config.pipeline.autostart = false;

    if (verbose) {
        std::println(stderr, "[livecap] Starting (model: {}, device: {})",
                     config.model.resolved_path(),
                     config.audio.device.empty() ? "default" : config.audio.device);
    }

    LinuxEventLoop loop(std::move(config), std::move(config_path), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize livecap");
        return 1;
    }

    loop.run();
    return 0;
}
