#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <string_view>
#include <unistd.h>

namespace platform {

namespace {

std::string env(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

std::string xdg_dir(const char* var, std::string_view home_fallback) {
    if (auto dir = env(var); !dir.empty()) return dir + "/livecap";
    auto home = env("HOME");
    if (home.empty()) return {};
    return home + "/" + std::string(home_fallback) + "/livecap";
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string control_socket_path() {
    if (auto path = env("LIVECAP_SOCKET"); !path.empty()) return path;
    if (auto runtime = env("XDG_RUNTIME_DIR"); !runtime.empty()) return runtime + "/livecap.sock";
    return "/tmp/livecap-" + std::to_string(::getuid()) + ".sock";
}

} // namespace platform
