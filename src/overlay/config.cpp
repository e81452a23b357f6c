#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Model::resolved_path() const {
    if (!path.empty()) return path;
    auto data = platform::data_dir();
    if (data.empty()) return "model";
    return (fs::path(data) / "models" / name).string();
}

std::string Config::History::resolved_path() const {
    if (!path.empty()) return path;
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/livecap/captions.db";
    return (fs::path(data) / "captions.db").string();
}

void apply_display_json(const json& d, DisplaySettings& display) {
    if (d.contains("font_family")) display.font_family = d["font_family"].get<std::string>();
    if (d.contains("font_size")) {
        display.font_size = std::clamp(d["font_size"].get<int>(),
                                       DisplaySettings::kMinFontSize,
                                       DisplaySettings::kMaxFontSize);
    }
    if (d.contains("text_color")) display.text_color = d["text_color"].get<std::string>();
    if (d.contains("position")) display.mode = parse_dock_mode(d["position"].get<std::string>());
    if (d.contains("fullscreen")) display.fullscreen = d["fullscreen"].get<bool>();
    if (d.contains("history_lines")) {
        display.history_lines = static_cast<size_t>(
            std::clamp(d["history_lines"].get<int>(), 0, DisplaySettings::kMaxHistoryLines));
    }
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("name")) cfg.model.name = m["name"].get<std::string>();
            if (m.contains("url")) {
                cfg.model.url = m["url"].get<std::string>();
            } else if (m.contains("name")) {
                cfg.model.url = "https://alphacephei.com/vosk/models/" + cfg.model.name + ".zip";
            }
            if (m.contains("path")) cfg.model.path = m["path"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) {
                cfg.audio.sample_rate = static_cast<uint32_t>(
                    std::clamp<int64_t>(a["sample_rate"].get<int64_t>(), Audio::kMinSampleRate,
                                        Audio::kMaxSampleRate));
            }
            if (a.contains("block_size")) {
                cfg.audio.block_size = static_cast<uint32_t>(std::clamp<int64_t>(
                    a["block_size"].get<int64_t>(), 1,
                    int64_t{cfg.audio.sample_rate} * Audio::kMaxBlockSeconds));
            }
            if (a.contains("device")) cfg.audio.device = a["device"].get<std::string>();
        }

        if (j.contains("display")) {
            apply_display_json(j["display"], cfg.display);
        }

        if (j.contains("pipeline")) {
            auto& p = j["pipeline"];
            if (p.contains("autostart")) cfg.pipeline.autostart = p["autostart"].get<bool>();
            if (p.contains("silence_reset_seconds")) {
                cfg.pipeline.silence_reset_seconds = p["silence_reset_seconds"].get<double>();
            }
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_or_default(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) return Config{};
    return load(path);
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

json Config::to_json() const {
    return {
        {"model", {
            {"name", model.name},
            {"url", model.url},
            {"path", model.path},
        }},
        {"audio", {
            {"sample_rate", audio.sample_rate},
            {"block_size", audio.block_size},
            {"device", audio.device},
        }},
        {"display", {
            {"font_family", display.font_family},
            {"font_size", display.font_size},
            {"text_color", display.text_color},
            {"position", std::string(to_string(display.mode))},
            {"fullscreen", display.fullscreen},
            {"history_lines", display.history_lines},
        }},
        {"pipeline", {
            {"autostart", pipeline.autostart},
            {"silence_reset_seconds", pipeline.silence_reset_seconds},
        }},
        {"history", {
            {"enabled", history.enabled},
            {"path", history.path},
        }},
    };
}

bool Config::save(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        std::println(stderr, "config: could not write {}", path);
        return false;
    }
    f << to_json().dump(2) << '\n';
    return static_cast<bool>(f);
}
