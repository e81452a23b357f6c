#include "transcript.hpp"

void TranscriptHistory::apply(const Caption& caption) {
    if (current_committed_ && !current_.empty()) {
        push(std::move(current_));
    }
    current_ = caption.text;
    current_committed_ = caption.final;
}

void TranscriptHistory::set_max_lines(size_t max_lines) {
    max_lines_ = max_lines;
    while (lines_.size() > max_lines_) lines_.pop_back();
}

void TranscriptHistory::clear() {
    lines_.clear();
    current_.clear();
    current_committed_ = false;
}

void TranscriptHistory::push(std::string line) {
    if (max_lines_ == 0) return;
    lines_.push_front(std::move(line));
    while (lines_.size() > max_lines_) lines_.pop_back();
}
