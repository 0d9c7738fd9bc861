#include <catch2/catch_test_macros.hpp>

#include "storage/run_history.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("sw_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

} // namespace

TEST_CASE("RunHistory", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("OpenCreatesParentDirectory") {
        auto dir = std::filesystem::temp_directory_path() / ("sw_test_dir_" + std::to_string(getpid()));
        {
            RunHistory db;
            REQUIRE(db.open((dir / "nested" / "runs.db").string()));
        }
        REQUIRE(std::filesystem::exists(dir / "nested" / "runs.db"));
        std::filesystem::remove_all(dir);
    }

    SECTION("BeginAndFinish") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        auto id = db.begin_run(R"([{"center_mhz":100.0,"span_mhz":10.0}])", 10000);
        REQUIRE(id > 0);

        auto open_runs = db.recent(1);
        REQUIRE(open_runs.size() == 1);
        REQUIRE(open_runs[0].final_phase == "running");
        REQUIRE(open_runs[0].stopped_at.empty());
        REQUIRE_FALSE(open_runs[0].started_at.empty());

        REQUIRE(db.finish_run(id, "idle", 2, "sweep process exited unexpectedly"));
        auto runs = db.recent(1);
        REQUIRE(runs[0].id == id);
        REQUIRE(runs[0].final_phase == "idle");
        REQUIRE(runs[0].error_count == 2);
        REQUIRE(runs[0].last_error == "sweep process exited unexpectedly");
        REQUIRE(runs[0].cycle_time_ms == 10000);
        REQUIRE(runs[0].frequencies == R"([{"center_mhz":100.0,"span_mhz":10.0}])");
        REQUIRE_FALSE(runs[0].stopped_at.empty());
    }

    SECTION("FinishWithoutError") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));
        auto id = db.begin_run("[]", 5000);
        REQUIRE(db.finish_run(id, "idle", 0, ""));
        REQUIRE(db.recent(1)[0].last_error.empty());
    }

    SECTION("FinishUnknownRun") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));
        REQUIRE_FALSE(db.finish_run(42, "idle", 0, ""));
        REQUIRE_FALSE(db.finish_run(0, "idle", 0, ""));
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        RunHistory db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; i++) {
            db.begin_run("[]", 1000 * (i + 1));
        }

        auto runs = db.recent(3);
        REQUIRE(runs.size() == 3);
        // Most recent first
        REQUIRE(runs[0].cycle_time_ms == 5000);
        REQUIRE(runs[2].cycle_time_ms == 3000);
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            RunHistory db;
            REQUIRE(db.open(tmp.path));
            db.begin_run("[]", 1000);
        }
        RunHistory db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.recent(10).size() == 1);
    }

    SECTION("ClosedDatabaseIsInert") {
        RunHistory db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE(db.begin_run("[]", 1000) == 0);
        REQUIRE(db.recent(10).empty());
    }
}
