#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("sttpad_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

JobRecord succeeded(uint64_t id, const std::string& text) {
    return {.job_id = id, .profile = "silero-en", .audio_source = "clip.wav",
            .audio_duration = 2.5, .processing_time = 0.3, .state = "succeeded", .text = text};
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert(succeeded(12, "hello world")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        const auto& r = entries[0].record;
        REQUIRE(r.job_id == 12);
        REQUIRE(r.profile == "silero-en");
        REQUIRE(r.audio_source == "clip.wav");
        REQUIRE(r.audio_duration == 2.5);
        REQUIRE(r.processing_time == 0.3);
        REQUIRE(r.state == "succeeded");
        REQUIRE(r.text == "hello world");
        REQUIRE(r.error.empty());
    }

    SECTION("FailedJobKeepsError") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        JobRecord failed{.job_id = 3, .profile = "whisper-lan", .audio_source = "recorded",
                         .state = "failed", .error = "ModelError: server returned 500"};
        REQUIRE(db.insert(failed));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.text.empty());
        REQUIRE(entries[0].record.error == "ModelError: server returned 500");
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(succeeded(static_cast<uint64_t>(i), "entry " + std::to_string(i))));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(succeeded(1, "first")));
        REQUIRE(db.insert(succeeded(2, "second")));
        REQUIRE(db.insert(succeeded(3, "third")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].record.text == "third");
        REQUIRE(entries[1].record.text == "second");
        REQUIRE(entries[2].record.text == "first");
        REQUIRE(entries[0].id > entries[2].id);
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Empty strings are stored as NULL and read back as empty
        JobRecord cancelled{.job_id = 4, .profile = "silero-de", .state = "cancelled"};
        REQUIRE(db.insert(cancelled));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.audio_source.empty());
        REQUIRE(entries[0].record.text.empty());
        REQUIRE(entries[0].record.error.empty());
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert(succeeded(1, "test")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(succeeded(9, "kept")));
        }
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.text == "kept");
    }

    SECTION("InsertWhenClosedFails") {
        HistoryDb db;
        REQUIRE_FALSE(db.insert(succeeded(1, "nowhere")));
        REQUIRE(db.recent().empty());
    }
}
