#pragma once

#include "display/display.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

struct WindowGeometry {
    int x = 0;
    int y = 0;
    int width = 800;
    int height = 200;

    bool operator==(const WindowGeometry&) const = default;
};

namespace layout {

constexpr int kDockHeight = 250;
constexpr int kTaskbarAllowance = 40;
constexpr int kWrapMargin = 50;

// Where the overlay goes for `mode`. Floating keeps `current`.
WindowGeometry place(DockMode mode, bool fullscreen, int screen_width, int screen_height,
                     const WindowGeometry& current);

int wrap_width(int window_width);

// Colours for `count` history lines, index 0 newest. The fade is spread over
// `capacity` lines so a line keeps its colour as the history fills.
// Non-hex colours are repeated as-is.
std::vector<std::string> fade_palette(const std::string& base_color, size_t count,
                                      size_t capacity);

// Greedy word wrap. `measure` returns the rendered width of a string.
std::vector<std::string> wrap(std::string_view text, int max_width,
                              const std::function<int(std::string_view)>& measure);

} // namespace layout
