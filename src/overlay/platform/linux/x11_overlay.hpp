#pragma once

#include "display/display.hpp"
#include "display/layout.hpp"

#include <X11/Xft/Xft.h>
#include <X11/Xlib.h>
#include <string>
#include <string_view>
#include <vector>

// Always-on-top caption window: black background, Xft text, committed
// lines stacked above the live caption and fading with age.
class X11Overlay : public CaptionDisplay {
public:
    X11Overlay();
    ~X11Overlay() override;

    X11Overlay(const X11Overlay&) = delete;
    X11Overlay& operator=(const X11Overlay&) = delete;

    bool open(const DisplaySettings& settings);
    void close();

    int connection_fd() const;

    // Drains queued X events and repaints if needed.
    void process_events();

    bool close_requested() const { return close_requested_; }

    void set_text(const std::string& text) override;
    void set_history(const std::vector<std::string>& lines) override;
    void configure(const DisplaySettings& settings) override;

private:
    bool load_font(const DisplaySettings& settings);
    void apply_geometry();
    void send_wm_state(Atom state, bool enable);
    void redraw();
    int measure(std::string_view text) const;

    ::Display* dpy_ = nullptr;
    int screen_ = 0;
    Window window_ = 0;
    Visual* visual_ = nullptr;
    Colormap colormap_ = 0;
    XftDraw* draw_ = nullptr;
    XftFont* font_ = nullptr;

    Atom wm_delete_ = 0;
    Atom net_wm_state_ = 0;
    Atom net_wm_state_above_ = 0;
    Atom net_wm_state_fullscreen_ = 0;

    DisplaySettings settings_;
    WindowGeometry geometry_;
    bool fullscreen_applied_ = false;

    std::string text_;
    std::vector<std::string> history_;

    bool mapped_ = false;
    bool dirty_ = false;
    bool close_requested_ = false;
};
