#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct CaptionSnapshot {
    std::vector<std::string> history;  // newest first
    std::string text;
};

// Single-slot hand-off from the capture thread to the UI thread. A newer
// snapshot replaces one the UI has not taken yet.
class CaptionMailbox {
public:
    using NotifyCallback = std::function<void()>;

    explicit CaptionMailbox(NotifyCallback notify = {}) : notify_(std::move(notify)) {}

    void post(CaptionSnapshot snapshot) {
        {
            std::lock_guard lock(mutex_);
            if (slot_) ++overwritten_;
            slot_ = std::move(snapshot);
        }
        if (notify_) notify_();
    }

    std::optional<CaptionSnapshot> take() {
        std::lock_guard lock(mutex_);
        std::optional<CaptionSnapshot> out;
        out.swap(slot_);
        return out;
    }

    size_t overwritten() const {
        std::lock_guard lock(mutex_);
        return overwritten_;
    }

private:
    NotifyCallback notify_;
    mutable std::mutex mutex_;
    std::optional<CaptionSnapshot> slot_;
    size_t overwritten_ = 0;
};
