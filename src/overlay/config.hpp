#pragma once

#include "display/display.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

struct Config {
    struct Model {
        std::string name = "vosk-model-small-en-us-0.15";
        std::string url = "https://alphacephei.com/vosk/models/vosk-model-small-en-us-0.15.zip";
        std::string path; // empty: <data_dir>/models/<name>

        std::string resolved_path() const;
    } model;

    struct Audio {
        static constexpr uint32_t kMinSampleRate = 8000;
        static constexpr uint32_t kMaxSampleRate = 192000;
        static constexpr uint32_t kMaxBlockSeconds = 10;

        uint32_t sample_rate = 16000;
        uint32_t block_size = 8000; // samples per frame
        std::string device;         // empty: default input
    } audio;

    DisplaySettings display;

    struct Pipeline {
        bool autostart = true;
        double silence_reset_seconds = 0.0;
    } pipeline;

    struct History {
        bool enabled = true;
        std::string path; // empty: <data_dir>/captions.db

        std::string resolved_path() const;
    } history;

    static Config load(const std::string& path);
    // Defaults without a message when `path` does not exist yet.
    static Config load_or_default(const std::string& path);
    static std::string default_path();

    nlohmann::json to_json() const;
    bool save(const std::string& path) const;
};

// Applies the display keys present in `j`, leaving the rest untouched.
void apply_display_json(const nlohmann::json& j, DisplaySettings& display);
