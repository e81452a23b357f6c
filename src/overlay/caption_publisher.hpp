#pragma once

#include "caption_mailbox.hpp"
#include "caption_sink.hpp"
#include "storage/transcript_db.hpp"
#include "transcript.hpp"

#include <cstddef>
#include <mutex>
#include <string>

// Capture-side sink: folds captions into the scrolling history, logs
// committed captions and posts a snapshot for the UI. History lives here
// rather than in the UI so an overwritten snapshot never loses a line.
class CaptionPublisher : public CaptionSink {
public:
    CaptionPublisher(CaptionMailbox& mailbox, TranscriptDb* db, size_t history_lines);

    void publish(const Caption& caption) override;

    void set_device(std::string device);
    void set_history_lines(size_t lines);
    void clear();

private:
    CaptionMailbox& mailbox_;
    TranscriptDb* db_;

    std::mutex mutex_;
    TranscriptHistory history_;
    std::string device_;
};
