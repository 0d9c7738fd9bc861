#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct RunRecord {
    int64_t id = 0;
    std::string started_at;
    std::string stopped_at;
    std::string frequencies;
    uint32_t cycle_time_ms = 0;
    std::string final_phase;
    uint32_t error_count = 0;
    std::string last_error;
};

// Journal of sweep runs: one row per Start, completed when the run ends.
class RunHistory {
public:
    RunHistory();
    ~RunHistory();

    RunHistory(const RunHistory&) = delete;
    RunHistory& operator=(const RunHistory&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Returns the new run id, or 0 on failure.
    int64_t begin_run(const std::string& frequencies_json, uint32_t cycle_time_ms);

    bool finish_run(int64_t id, const std::string& final_phase, uint32_t error_count,
                    const std::string& last_error);

    std::vector<RunRecord> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* begin_stmt_ = nullptr;
    sqlite3_stmt* finish_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
