#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

// One delivered job as stored on disk.
struct JobRecord {
    uint64_t job_id = 0;
    std::string profile;
    std::string audio_source;
    double audio_duration = 0.0;
    double processing_time = 0.0;
    std::string state; // "succeeded", "failed" or "cancelled"
    std::string text;
    std::string error;
};

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    JobRecord record;
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

    bool insert(const JobRecord& record);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
