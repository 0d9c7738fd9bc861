#include "run_history.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

RunHistory::RunHistory() = default;

RunHistory::~RunHistory() {
    close();
}

bool RunHistory::open(const std::string& path) {
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

    if (!create_tables()) {
        close();
        return false;
    }

    const char* begin_sql =
        "INSERT INTO sweep_runs (frequencies, cycle_time_ms, final_phase) VALUES (?, ?, 'running')";

    const char* finish_sql =
        "UPDATE sweep_runs SET stopped_at = strftime('%Y-%m-%dT%H:%M:%f','now'), "
        "final_phase = ?, error_count = ?, last_error = ? WHERE id = ?";

    const char* recent_sql =
        "SELECT id, started_at, stopped_at, frequencies, cycle_time_ms, final_phase, "
        "error_count, last_error FROM sweep_runs ORDER BY id DESC LIMIT ?";

    auto prepare = [this](const char* sql, sqlite3_stmt** stmt, const char* what) {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", what, sqlite3_errmsg(db_));
            return false;
        }
        return true;
    };

    if (!prepare(begin_sql, &begin_stmt_, "begin") ||
        !prepare(finish_sql, &finish_stmt_, "finish") ||
        !prepare(recent_sql, &recent_stmt_, "recent")) {
        close();
        return false;
    }
    return true;
}

void RunHistory::close() {
    if (begin_stmt_) { sqlite3_finalize(begin_stmt_); begin_stmt_ = nullptr; }
    if (finish_stmt_) { sqlite3_finalize(finish_stmt_); finish_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

int64_t RunHistory::begin_run(const std::string& frequencies_json, uint32_t cycle_time_ms) {
    if (!begin_stmt_) return 0;

    sqlite3_reset(begin_stmt_);
    sqlite3_bind_text(begin_stmt_, 1, frequencies_json.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(begin_stmt_, 2, cycle_time_ms);

    if (sqlite3_step(begin_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: begin run failed: {}", sqlite3_errmsg(db_));
        return 0;
    }
    return sqlite3_last_insert_rowid(db_);
}

bool RunHistory::finish_run(int64_t id, const std::string& final_phase, uint32_t error_count,
                            const std::string& last_error) {
    if (!finish_stmt_ || id <= 0) return false;

    sqlite3_reset(finish_stmt_);
    sqlite3_bind_text(finish_stmt_, 1, final_phase.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(finish_stmt_, 2, error_count);
    if (last_error.empty()) sqlite3_bind_null(finish_stmt_, 3);
    else sqlite3_bind_text(finish_stmt_, 3, last_error.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(finish_stmt_, 4, id);

    if (sqlite3_step(finish_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: finish run failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) == 1;
}

std::vector<RunRecord> RunHistory::recent(int limit) {
    std::vector<RunRecord> runs;
    if (!recent_stmt_) return runs;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        RunRecord r;
        r.id = sqlite3_column_int64(recent_stmt_, 0);
        r.started_at = get_text(recent_stmt_, 1);
        r.stopped_at = get_text(recent_stmt_, 2);
        r.frequencies = get_text(recent_stmt_, 3);
        r.cycle_time_ms = static_cast<uint32_t>(sqlite3_column_int64(recent_stmt_, 4));
        r.final_phase = get_text(recent_stmt_, 5);
        r.error_count = static_cast<uint32_t>(sqlite3_column_int64(recent_stmt_, 6));
        r.last_error = get_text(recent_stmt_, 7);
        runs.push_back(std::move(r));
    }
    return runs;
}

bool RunHistory::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sweep_runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            started_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            stopped_at TEXT,
            frequencies TEXT NOT NULL,
            cycle_time_ms INTEGER NOT NULL,
            final_phase TEXT NOT NULL,
            error_count INTEGER NOT NULL DEFAULT 0,
            last_error TEXT
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
