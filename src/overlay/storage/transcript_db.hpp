#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct CaptionEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    std::string device;
};

// Log of committed captions. insert() runs on the capture thread and
// recent() on the UI thread, so both take the connection lock.
class TranscriptDb {
public:
    TranscriptDb();
    ~TranscriptDb();

    TranscriptDb(const TranscriptDb&) = delete;
    TranscriptDb& operator=(const TranscriptDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    bool insert(const std::string& text, const std::string& device);

    // Newest first. A non-empty `contains` keeps only captions containing
    // that exact substring (case-sensitive, no wildcards).
    std::vector<CaptionEntry> recent(int limit = 10, const std::string& contains = {});

private:
    bool create_tables();
    void finalize_all();
    static std::vector<CaptionEntry> collect(sqlite3_stmt* stmt);

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* search_stmt_ = nullptr;
};
