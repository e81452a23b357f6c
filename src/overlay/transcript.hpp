#pragma once

#include "caption_sink.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

// Committed captions above the live line. A final caption stays the live
// line until the next caption arrives, then moves into history.
class TranscriptHistory {
public:
    explicit TranscriptHistory(size_t max_lines = 10) : max_lines_(max_lines) {}

    void apply(const Caption& caption);
    void set_max_lines(size_t max_lines);
    void clear();

    std::vector<std::string> lines() const { return {lines_.begin(), lines_.end()}; }
    const std::string& current() const { return current_; }

private:
    void push(std::string line);

    size_t max_lines_;
    std::deque<std::string> lines_;  // newest first
    std::string current_;
    bool current_committed_ = false;
};
