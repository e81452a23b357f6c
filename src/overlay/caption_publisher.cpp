#include "caption_publisher.hpp"

CaptionPublisher::CaptionPublisher(CaptionMailbox& mailbox, TranscriptDb* db,
                                   size_t history_lines)
    : mailbox_(mailbox), db_(db), history_(history_lines) {}

void CaptionPublisher::publish(const Caption& caption) {
    CaptionSnapshot snapshot;
    std::string device;
    {
        std::lock_guard lock(mutex_);
        history_.apply(caption);
        snapshot.history = history_.lines();
        snapshot.text = history_.current();
        device = device_;
    }

    if (caption.final && !caption.text.empty() && db_) {
        db_->insert(caption.text, device);
    }

    mailbox_.post(std::move(snapshot));
}

void CaptionPublisher::set_device(std::string device) {
    std::lock_guard lock(mutex_);
    device_ = std::move(device);
}

void CaptionPublisher::set_history_lines(size_t lines) {
    std::lock_guard lock(mutex_);
    history_.set_max_lines(lines);
}

void CaptionPublisher::clear() {
    std::lock_guard lock(mutex_);
    history_.clear();
}
