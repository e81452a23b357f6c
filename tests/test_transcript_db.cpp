#include <catch2/catch_test_macros.hpp>

#include "storage/transcript_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("lc_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

} // namespace

TEST_CASE("TranscriptDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("hello world", "alsa_input.usb"));

        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].device == "alsa_input.usb");
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("DefaultDeviceStoredAsNull") {
        TmpDb tmp;
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("caption", ""));
        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].device.empty());
    }

    SECTION("RecentOrderAndLimit") {
        TmpDb tmp;
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert("line " + std::to_string(i), ""));
        }

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        // Most recent first
        REQUIRE(entries[0].text == "line 4");
        REQUIRE(entries[1].text == "line 3");
        REQUIRE(entries[2].text == "line 2");
        REQUIRE(entries[0].id > entries[1].id);
    }

    SECTION("SearchMatchesSubstring") {
        TmpDb tmp;
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("the weather is nice", ""));
        REQUIRE(db.insert("meeting at noon", ""));
        REQUIRE(db.insert("Weather report follows", ""));

        REQUIRE(db.insert("more weather later", ""));

        auto hits = db.recent(10, "weather");
        REQUIRE(hits.size() == 2);
        REQUIRE(hits[0].text == "more weather later");
        REQUIRE(hits[1].text == "the weather is nice");

        REQUIRE(db.recent(1, "weather").size() == 1);
        REQUIRE(db.recent(10, "snow").empty());
    }

    SECTION("SearchIsCaseSensitive") {
        TmpDb tmp;
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("Weather report follows", ""));
        REQUIRE(db.insert("the weather is nice", ""));

        auto upper = db.recent(10, "Weather");
        REQUIRE(upper.size() == 1);
        REQUIRE(upper[0].text == "Weather report follows");
        REQUIRE(db.recent(10, "WEATHER").empty());
    }

    SECTION("SearchWildcardsAreLiteral") {
        TmpDb tmp;
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("100% sure", ""));
        REQUIRE(db.insert("100 percent", ""));
        REQUIRE(db.insert("snake_case", ""));
        REQUIRE(db.insert("snakeXcase", ""));

        auto pct = db.recent(10, "0%");
        REQUIRE(pct.size() == 1);
        REQUIRE(pct[0].text == "100% sure");

        auto under = db.recent(10, "e_c");
        REQUIRE(under.size() == 1);
        REQUIRE(under[0].text == "snake_case");
    }

    SECTION("ReopenKeepsEntries") {
        TmpDb tmp;
        {
            TranscriptDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert("persisted", "mic"));
        }
        TranscriptDb db;
        REQUIRE(db.open(tmp.path));
        auto entries = db.recent(5);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "persisted");
    }

    SECTION("ClosedDbIsInert") {
        TranscriptDb db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert("ignored", ""));
        REQUIRE(db.recent(5).empty());
        REQUIRE(db.recent(5, "ignored").empty());
    }

    SECTION("UnwritableLocationFails") {
        TranscriptDb db;
        REQUIRE_FALSE(db.open("/proc/lc_test_no_such_dir/captions.db"));
        REQUIRE_FALSE(db.is_open());
    }
}
