#include "display/layout.hpp"

#include <algorithm>
#include <cctype>
#include <format>

DockMode parse_dock_mode(std::string_view name) {
    if (name == "top") return DockMode::DockTop;
    if (name == "bottom") return DockMode::DockBottom;
    return DockMode::Floating;
}

std::string_view to_string(DockMode mode) {
    switch (mode) {
        case DockMode::DockTop: return "top";
        case DockMode::DockBottom: return "bottom";
        case DockMode::Floating: break;
    }
    return "floating";
}

namespace layout {

WindowGeometry place(DockMode mode, bool fullscreen, int screen_width, int screen_height,
                     const WindowGeometry& current) {
    if (fullscreen) {
        return {0, 0, screen_width, screen_height};
    }
    switch (mode) {
        case DockMode::DockTop:
            return {0, 0, screen_width, kDockHeight};
        case DockMode::DockBottom:
            return {0, std::max(0, screen_height - kDockHeight - kTaskbarAllowance),
                    screen_width, kDockHeight};
        case DockMode::Floating:
            break;
    }
    return current;
}

int wrap_width(int window_width) {
    return std::max(1, window_width - kWrapMargin);
}

static bool parse_hex_color(const std::string& color, int& r, int& g, int& b) {
    if (color.size() != 7 || color[0] != '#') return false;
    for (size_t i = 1; i < color.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(color[i]))) return false;
    }
    r = std::stoi(color.substr(1, 2), nullptr, 16);
    g = std::stoi(color.substr(3, 2), nullptr, 16);
    b = std::stoi(color.substr(5, 2), nullptr, 16);
    return true;
}

std::vector<std::string> fade_palette(const std::string& base_color, size_t count,
                                      size_t capacity) {
    int r, g, b;
    if (!parse_hex_color(base_color, r, g, b)) {
        return std::vector<std::string>(count, base_color);
    }

    std::vector<std::string> palette;
    palette.reserve(count);
    double span = static_cast<double>(std::max(capacity, count)) * 1.5;
    for (size_t i = 0; i < count; ++i) {
        double factor = 1.0 - static_cast<double>(i) / span;
        factor = std::max(0.2, factor);
        palette.push_back(std::format("#{:02x}{:02x}{:02x}",
                                      static_cast<int>(r * factor),
                                      static_cast<int>(g * factor),
                                      static_cast<int>(b * factor)));
    }
    return palette;
}

std::vector<std::string> wrap(std::string_view text, int max_width,
                              const std::function<int(std::string_view)>& measure) {
    std::vector<std::string> lines;
    std::string line;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find_first_not_of(' ', pos);
        if (start == std::string_view::npos) break;
        size_t end = text.find(' ', start);
        if (end == std::string_view::npos) end = text.size();
        auto word = text.substr(start, end - start);
        pos = end;

        if (line.empty()) {
            line.assign(word);
            continue;
        }

        std::string candidate = line + ' ' + std::string(word);
        if (measure(candidate) <= max_width) {
            line = std::move(candidate);
        } else {
            lines.push_back(std::move(line));
            line.assign(word);
        }
    }
    if (!line.empty()) lines.push_back(std::move(line));
    return lines;
}

} // namespace layout
