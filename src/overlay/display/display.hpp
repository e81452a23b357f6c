#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

enum class DockMode { Floating, DockTop, DockBottom };

DockMode parse_dock_mode(std::string_view name);
std::string_view to_string(DockMode mode);

struct DisplaySettings {
    std::string font_family = "Helvetica";
    int font_size = 24;
    std::string text_color = "#FFFFFF";
    DockMode mode = DockMode::Floating;
    bool fullscreen = false;
    size_t history_lines = 10;

    static constexpr int kMinFontSize = 8;
    static constexpr int kMaxFontSize = 150;
    static constexpr int kMaxHistoryLines = 100;
};

// Window surface showing the live caption. Called from the UI thread only.
// Rendering failures are handled inside the implementation.
class CaptionDisplay {
public:
    virtual ~CaptionDisplay() = default;
    virtual void set_text(const std::string& text) = 0;
    virtual void set_history(const std::vector<std::string>& lines) = 0;
    virtual void configure(const DisplaySettings& settings) = 0;
};
