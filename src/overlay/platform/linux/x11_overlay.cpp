#include "platform/linux/x11_overlay.hpp"

#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <cstring>
#include <print>

namespace {

constexpr const char* kTitle = "Live Captions";
constexpr int kMargin = 10;

int on_x_error(::Display* dpy, XErrorEvent* ev) {
    char msg[256];
    XGetErrorText(dpy, ev->error_code, msg, sizeof(msg));
    std::println(stderr, "display: X error {} (request {}): {}",
                 static_cast<int>(ev->error_code), static_cast<int>(ev->request_code), msg);
    return 0;
}

} // namespace

X11Overlay::X11Overlay() = default;

X11Overlay::~X11Overlay() {
    close();
}

bool X11Overlay::open(const DisplaySettings& settings) {
    dpy_ = XOpenDisplay(nullptr);
    if (!dpy_) {
        std::println(stderr, "display: cannot open X display");
        return false;
    }
    XSetErrorHandler(on_x_error);

    screen_ = DefaultScreen(dpy_);
    visual_ = DefaultVisual(dpy_, screen_);
    colormap_ = DefaultColormap(dpy_, screen_);
    settings_ = settings;

    geometry_ = layout::place(settings_.mode, settings_.fullscreen,
                              DisplayWidth(dpy_, screen_), DisplayHeight(dpy_, screen_),
                              geometry_);

    window_ = XCreateSimpleWindow(dpy_, RootWindow(dpy_, screen_),
                                  geometry_.x, geometry_.y,
                                  static_cast<unsigned>(geometry_.width),
                                  static_cast<unsigned>(geometry_.height),
                                  0, BlackPixel(dpy_, screen_), BlackPixel(dpy_, screen_));

    XStoreName(dpy_, window_, kTitle);
    Atom net_wm_name = XInternAtom(dpy_, "_NET_WM_NAME", False);
    Atom utf8 = XInternAtom(dpy_, "UTF8_STRING", False);
    XChangeProperty(dpy_, window_, net_wm_name, utf8, 8, PropModeReplace,
                    reinterpret_cast<const unsigned char*>(kTitle),
                    static_cast<int>(std::strlen(kTitle)));

    wm_delete_ = XInternAtom(dpy_, "WM_DELETE_WINDOW", False);
    XSetWMProtocols(dpy_, window_, &wm_delete_, 1);

    net_wm_state_ = XInternAtom(dpy_, "_NET_WM_STATE", False);
    net_wm_state_above_ = XInternAtom(dpy_, "_NET_WM_STATE_ABOVE", False);
    net_wm_state_fullscreen_ = XInternAtom(dpy_, "_NET_WM_STATE_FULLSCREEN", False);

    // Before mapping the state is a plain property; afterwards it has to go
    // through the window manager (send_wm_state).
    Atom initial[2] = {net_wm_state_above_, net_wm_state_fullscreen_};
    XChangeProperty(dpy_, window_, net_wm_state_, XA_ATOM, 32, PropModeReplace,
                    reinterpret_cast<unsigned char*>(initial), settings_.fullscreen ? 2 : 1);
    fullscreen_applied_ = settings_.fullscreen;

    XSizeHints* hints = XAllocSizeHints();
    if (hints) {
        hints->flags = PPosition | PSize;
        hints->x = geometry_.x;
        hints->y = geometry_.y;
        hints->width = geometry_.width;
        hints->height = geometry_.height;
        XSetWMNormalHints(dpy_, window_, hints);
        XFree(hints);
    }

    XSelectInput(dpy_, window_, ExposureMask | StructureNotifyMask);

    draw_ = XftDrawCreate(dpy_, window_, visual_, colormap_);
    if (!draw_ || !load_font(settings_)) {
        std::println(stderr, "display: cannot set up text rendering");
        close();
        return false;
    }

    XMapWindow(dpy_, window_);
    XFlush(dpy_);
    mapped_ = true;
    return true;
}

void X11Overlay::close() {
    if (!dpy_) return;
    if (font_) { XftFontClose(dpy_, font_); font_ = nullptr; }
    if (draw_) { XftDrawDestroy(draw_); draw_ = nullptr; }
    if (window_) { XDestroyWindow(dpy_, window_); window_ = 0; }
    XCloseDisplay(dpy_);
    dpy_ = nullptr;
    mapped_ = false;
}

int X11Overlay::connection_fd() const {
    return dpy_ ? ConnectionNumber(dpy_) : -1;
}

void X11Overlay::process_events() {
    if (!dpy_) return;

    while (XPending(dpy_) > 0) {
        XEvent ev;
        XNextEvent(dpy_, &ev);
        switch (ev.type) {
            case Expose:
                if (ev.xexpose.count == 0) dirty_ = true;
                break;
            case ConfigureNotify: {
                auto& c = ev.xconfigure;
                if (c.width != geometry_.width || c.height != geometry_.height) dirty_ = true;
                geometry_.width = c.width;
                geometry_.height = c.height;
                if (!settings_.fullscreen && settings_.mode == DockMode::Floating) {
                    geometry_.x = c.x;
                    geometry_.y = c.y;
                }
                break;
            }
            case ClientMessage:
                if (static_cast<Atom>(ev.xclient.data.l[0]) == wm_delete_) {
                    close_requested_ = true;
                }
                break;
            default:
                break;
        }
    }

    if (dirty_) redraw();
}

void X11Overlay::set_text(const std::string& text) {
    if (text == text_) return;
    text_ = text;
    redraw();
}

void X11Overlay::set_history(const std::vector<std::string>& lines) {
    if (lines == history_) return;
    history_ = lines;
    dirty_ = true;
}

void X11Overlay::configure(const DisplaySettings& settings) {
    if (!dpy_) {
        settings_ = settings;
        return;
    }

    bool font_changed = settings.font_family != settings_.font_family ||
                        settings.font_size != settings_.font_size;
    settings_ = settings;

    if (font_changed && !load_font(settings_)) {
        std::println(stderr, "display: keeping previous font");
    }

    if (settings_.fullscreen != fullscreen_applied_) {
        send_wm_state(net_wm_state_fullscreen_, settings_.fullscreen);
        fullscreen_applied_ = settings_.fullscreen;
    }
    apply_geometry();
    redraw();
}

bool X11Overlay::load_font(const DisplaySettings& settings) {
    XftFont* font = XftFontOpen(dpy_, screen_,
                                XFT_FAMILY, XftTypeString, settings.font_family.c_str(),
                                XFT_SIZE, XftTypeDouble, static_cast<double>(settings.font_size),
                                nullptr);
    if (!font) {
        std::println(stderr, "display: font '{}' not available, using sans",
                     settings.font_family);
        font = XftFontOpen(dpy_, screen_,
                           XFT_FAMILY, XftTypeString, "sans",
                           XFT_SIZE, XftTypeDouble, static_cast<double>(settings.font_size),
                           nullptr);
    }
    if (!font) return false;

    if (font_) XftFontClose(dpy_, font_);
    font_ = font;
    return true;
}

void X11Overlay::apply_geometry() {
    if (settings_.fullscreen) return;

    auto target = layout::place(settings_.mode, false,
                                DisplayWidth(dpy_, screen_), DisplayHeight(dpy_, screen_),
                                geometry_);
    if (target == geometry_) return;

    geometry_ = target;
    XMoveResizeWindow(dpy_, window_, geometry_.x, geometry_.y,
                      static_cast<unsigned>(geometry_.width),
                      static_cast<unsigned>(geometry_.height));
}

void X11Overlay::send_wm_state(Atom state, bool enable) {
    XEvent ev{};
    ev.xclient.type = ClientMessage;
    ev.xclient.window = window_;
    ev.xclient.message_type = net_wm_state_;
    ev.xclient.format = 32;
    ev.xclient.data.l[0] = enable ? 1 : 0; // _NET_WM_STATE_ADD / _REMOVE
    ev.xclient.data.l[1] = static_cast<long>(state);
    ev.xclient.data.l[2] = 0;
    ev.xclient.data.l[3] = 1;
    XSendEvent(dpy_, RootWindow(dpy_, screen_), False,
               SubstructureRedirectMask | SubstructureNotifyMask, &ev);
}

int X11Overlay::measure(std::string_view text) const {
    XGlyphInfo extents;
    XftTextExtentsUtf8(dpy_, font_, reinterpret_cast<const FcChar8*>(text.data()),
                       static_cast<int>(text.size()), &extents);
    return extents.xOff;
}

void X11Overlay::redraw() {
    dirty_ = false;
    if (!dpy_ || !mapped_ || !font_) return;

    XClearWindow(dpy_, window_);

    int max_width = layout::wrap_width(geometry_.width);
    auto measure_fn = [this](std::string_view s) { return measure(s); };
    int line_height = font_->ascent + font_->descent;
    int baseline = geometry_.height - kMargin - font_->descent;

    auto draw_block = [&](const std::string& text, const std::string& color_name) {
        auto lines = layout::wrap(text, max_width, measure_fn);
        if (lines.empty()) return;

        XftColor color;
        if (!XftColorAllocName(dpy_, visual_, colormap_, color_name.c_str(), &color) &&
            !XftColorAllocName(dpy_, visual_, colormap_, "white", &color)) {
            baseline -= line_height * static_cast<int>(lines.size());
            return;
        }

        for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
            if (baseline - font_->ascent >= 0) {
                XftDrawStringUtf8(draw_, &color, font_, kMargin, baseline,
                                  reinterpret_cast<const FcChar8*>(it->data()),
                                  static_cast<int>(it->size()));
            }
            baseline -= line_height;
        }
        XftColorFree(dpy_, visual_, colormap_, &color);
    };

    draw_block(text_, settings_.text_color);

    auto palette = layout::fade_palette(settings_.text_color, history_.size(),
                                        settings_.history_lines);
    for (size_t i = 0; i < history_.size() && baseline - font_->ascent >= 0; ++i) {
        draw_block(history_[i], palette[i]);
    }

    XFlush(dpy_);
}
