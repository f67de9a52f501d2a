#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

// One completed transcription as written to the history table.
struct HistoryRecord {
    std::string text;
    std::string raw_text;        // before post-processing; empty if identical
    double audio_duration = 0.0;
    double processing_time = 0.0;
    int segment_count = 0;
    std::string providers;       // comma-separated, in segment order
    std::string device;
    std::string language;
};

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    HistoryRecord record;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const HistoryRecord& record);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
