#include "transcript_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

TranscriptDb::TranscriptDb() = default;

TranscriptDb::~TranscriptDb() {
    close();
}

bool TranscriptDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);
    if (db_) return true;

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    const char* insert_sql = "INSERT INTO captions (text, device) VALUES (?, ?)";
    const char* recent_sql =
        "SELECT id, timestamp, text, device FROM captions ORDER BY id DESC LIMIT ?";
    const char* search_sql =
        "SELECT id, timestamp, text, device FROM captions "
        "WHERE instr(text, ?) > 0 ORDER BY id DESC LIMIT ?";

    if (!create_tables() ||
        sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db_, search_sql, -1, &search_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: setup failed: {}", sqlite3_errmsg(db_));
        finalize_all();
        return false;
    }

    return true;
}

void TranscriptDb::close() {
    std::lock_guard lock(mutex_);
    finalize_all();
}

void TranscriptDb::finalize_all() {
    for (auto* stmt : {&insert_stmt_, &recent_stmt_, &search_stmt_}) {
        sqlite3_finalize(*stmt);
        *stmt = nullptr;
    }
    sqlite3_close(db_);
    db_ = nullptr;
}

bool TranscriptDb::is_open() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

bool TranscriptDb::insert(const std::string& text, const std::string& device) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    if (device.empty()) sqlite3_bind_null(insert_stmt_, 2);
    else sqlite3_bind_text(insert_stmt_, 2, device.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

std::vector<CaptionEntry> TranscriptDb::recent(int limit, const std::string& contains) {
    std::lock_guard lock(mutex_);
    if (!db_) return {};

    if (contains.empty()) {
        sqlite3_reset(recent_stmt_);
        sqlite3_bind_int(recent_stmt_, 1, limit);
        return collect(recent_stmt_);
    }

    sqlite3_reset(search_stmt_);
    sqlite3_bind_text(search_stmt_, 1, contains.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(search_stmt_, 2, limit);
    return collect(search_stmt_);
}

std::vector<CaptionEntry> TranscriptDb::collect(sqlite3_stmt* stmt) {
    std::vector<CaptionEntry> entries;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(CaptionEntry{
            .id = sqlite3_column_int64(stmt, 0),
            .timestamp = column_text(stmt, 1),
            .text = column_text(stmt, 2),
            .device = column_text(stmt, 3),
        });
    }
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: query failed: {}", sqlite3_errmsg(sqlite3_db_handle(stmt)));
    }
    return entries;
}

bool TranscriptDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS captions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            device TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
