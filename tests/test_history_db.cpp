#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("mindscribe_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() { std::filesystem::remove(path); }
};

HistoryRecord record(std::string text) {
    return HistoryRecord{.text = std::move(text), .raw_text = {}, .audio_duration = 1.0,
                         .processing_time = 0.1, .segment_count = 1, .providers = "groq",
                         .device = {}, .language = "fr"};
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

        HistoryRecord r{.text = "Bonjour tout le monde.", .raw_text = "euh bonjour tout le monde",
                        .audio_duration = 2.5, .processing_time = 0.3, .segment_count = 2,
                        .providers = "groq,openai", .device = "alsa_input.usb-mic",
                        .language = "fr"};
        REQUIRE(db.insert(r));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        auto& got = entries[0].record;
        REQUIRE(got.text == "Bonjour tout le monde.");
        REQUIRE(got.raw_text == "euh bonjour tout le monde");
        REQUIRE(got.audio_duration == 2.5);
        REQUIRE(got.processing_time == 0.3);
        REQUIRE(got.segment_count == 2);
        REQUIRE(got.providers == "groq,openai");
        REQUIRE(got.device == "alsa_input.usb-mic");
        REQUIRE(got.language == "fr");
        REQUIRE(entries[0].id > 0);
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(record("entry " + std::to_string(i))));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(record("first")));
        REQUIRE(db.insert(record("second")));
        REQUIRE(db.insert(record("third")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].record.text == "third");
        REQUIRE(entries[1].record.text == "second");
        REQUIRE(entries[2].record.text == "first");
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Empty strings are stored as NULL and come back empty
        HistoryRecord r{.text = "test", .raw_text = {}, .audio_duration = 1.0,
                        .processing_time = 0.1, .segment_count = 1, .providers = {},
                        .device = {}, .language = {}};
        REQUIRE(db.insert(r));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.raw_text.empty());
        REQUIRE(entries[0].record.providers.empty());
        REQUIRE(entries[0].record.device.empty());
        REQUIRE(entries[0].record.language.empty());
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(record("test")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("ReopenKeepsRows") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert(record("persisted")));
        }
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        auto entries = db.recent(10);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].record.text == "persisted");
    }

    SECTION("ClosedDbRejectsWrites") {
        HistoryDb db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert(record("nowhere")));
        REQUIRE(db.recent(5).empty());
    }
}
