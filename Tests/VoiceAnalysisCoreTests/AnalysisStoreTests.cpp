/**
 * @file AnalysisStoreTests.cpp
 * @brief Unit tests for the SQLite analysis store
 */

#include "AnalysisStore.hpp"

#include "Errors.hpp"
#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <chrono>

using namespace va;
using va::test::temp_directory;

namespace {

AnalysisRecord make_record(const std::string& title,
                           TimePoint created = TimePoint{std::chrono::seconds(1700000000)}) {
    AnalysisRecord r;
    r.title         = title;
    r.audio_path    = "/tmp/" + title + ".m4a";
    r.creation_date = created;
    return r;
}

/// Build a database as the first schema version left it.
void create_v1_database(const std::string& path) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    const char* sql = R"SQL(
        CREATE TABLE AudioAnalysis (
            _id INTEGER PRIMARY KEY AUTOINCREMENT,
            TITLE TEXT NOT NULL,
            DESCRIPTION TEXT,
            SEND_STATUS INTEGER NOT NULL,
            ERROR_MESSAGE TEXT,
            RECORDING_PATH TEXT NOT NULL,
            CREATION_DATE TEXT NOT NULL,
            COMPLETION_DATE TEXT,
            AGE_RESULT TEXT,
            GENDER_RESULT TEXT,
            NATIONALITY_RESULT TEXT,
            AGE_USER_FEEDBACK INTEGER,
            GENDER_USER_FEEDBACK INTEGER,
            NATIONALITY_USER_FEEDBACK INTEGER
        );
        INSERT INTO AudioAnalysis (TITLE, SEND_STATUS, RECORDING_PATH, CREATION_DATE,
                                   AGE_RESULT, AGE_USER_FEEDBACK)
        VALUES ('legacy', 1, '/old/recording_1/recording.m4a',
                '2023-05-01T08:00:00', '[20-29:0.8,30-39:0.2]', 1);
        PRAGMA user_version = 1;
    )SQL";
    char* err = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    const std::string msg = err ? err : "";
    sqlite3_free(err);
    sqlite3_close(db);
    INFO(msg);
    REQUIRE(rc == SQLITE_OK);
}

}  // namespace

// ============================================================================
// open / migrations
// ============================================================================

TEST_CASE("store: open creates the schema at the current version", "[store]") {
    temp_directory temp_dir;
    AnalysisStore store((temp_dir.path() / "nested" / "analysis.db").string());

    store.open();

    CHECK(store.is_open());
    CHECK(store.schema_version() == AnalysisStore::kSchemaVersion);
}

TEST_CASE("store: reopening is idempotent", "[store]") {
    temp_directory temp_dir;
    const std::string db_path = (temp_dir.path() / "analysis.db").string();

    int64_t id = 0;
    {
        AnalysisStore store(db_path);
        store.open();
        id = store.insert(make_record("kept"), true);
    }

    AnalysisStore store(db_path);
    REQUIRE_NOTHROW(store.open());
    CHECK(store.schema_version() == AnalysisStore::kSchemaVersion);
    auto row = store.get_by_id(id);
    REQUIRE(row.has_value());
    CHECK(row->title == "kept");
}

TEST_CASE("store: migrates a first-version database", "[store][migration]") {
    temp_directory temp_dir;
    const std::string db_path = (temp_dir.path() / "analysis.db").string();
    create_v1_database(db_path);

    AnalysisStore store(db_path);
    store.open();

    CHECK(store.schema_version() == AnalysisStore::kSchemaVersion);

    auto row = store.get_by_id(1);
    REQUIRE(row.has_value());
    CHECK(row->title == "legacy");
    CHECK(row->send_status == SendStatus::sent);
    REQUIRE(row->channel(Channel::age).prediction.has_value());
    CHECK(row->channel(Channel::age).prediction->at("20-29") == 0.8);
    CHECK(row->channel(Channel::age).feedback == std::optional<bool>(true));
    CHECK_FALSE(row->channel(Channel::emotion).prediction.has_value());

    // Legacy rows are visible without reconciliation.
    CHECK(store.is_path_resolved(1) == std::optional<bool>(true));
    CHECK(store.query_all().size() == 1);
}

TEST_CASE("store: refuses a database from a newer build", "[store][migration]") {
    temp_directory temp_dir;
    const std::string db_path = (temp_dir.path() / "analysis.db").string();
    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(db_path.c_str(), &db) == SQLITE_OK);
        REQUIRE(sqlite3_exec(db, "PRAGMA user_version = 99", nullptr, nullptr, nullptr) ==
                SQLITE_OK);
        sqlite3_close(db);
    }

    AnalysisStore store(db_path);
    CHECK_THROWS_AS(store.open(), StorageError);
    CHECK_FALSE(store.is_open());
}

TEST_CASE("store: calls on a closed store throw", "[store]") {
    temp_directory temp_dir;
    AnalysisStore store((temp_dir.path() / "analysis.db").string());

    CHECK_THROWS_AS(store.insert(make_record("x")), StorageError);
    CHECK_THROWS_AS(store.get_by_id(1), StorageError);
}

// ============================================================================
// insert / get / update
// ============================================================================

TEST_CASE("store: insert and read back", "[store]") {
    temp_directory temp_dir;
    AnalysisStore store((temp_dir.path() / "analysis.db").string());
    store.open();

    AnalysisRecord record = make_record("first");
    record.description = "morning sample";
    record.channel(Channel::gender).prediction = ProbabilityMap{{"female", 0.7}, {"male", 0.3}};

    const int64_t a = store.insert(record, true);
    const int64_t b = store.insert(make_record("second"), true);
    CHECK(b > a);

    auto row = store.get_by_id(a);
    REQUIRE(row.has_value());
    CHECK(row->id == std::optional<int64_t>(a));
    CHECK(row->title == "first");
    CHECK(row->description == std::optional<std::string>("morning sample"));
    CHECK(row->send_status == SendStatus::pending);
    CHECK(row->creation_date == record.creation_date);
    CHECK_FALSE(row->completion_date.has_value());
    CHECK(row->channel(Channel::gender).prediction == record.channel(Channel::gender).prediction);
    CHECK_FALSE(row->channel(Channel::gender).feedback.has_value());

    CHECK_FALSE(store.get_by_id(9999).has_value());
}

TEST_CASE("store: partial update touches only engaged fields", "[store]") {
    temp_directory temp_dir;
    AnalysisStore store((temp_dir.path() / "analysis.db").string());
    store.open();

    AnalysisRecord record = make_record("original");
    record.description = "keep me";
    record.channel(Channel::age).prediction = ProbabilityMap{{"40-49", 1.0}};
    const int64_t id = store.insert(record, true);

    AnalysisUpdate changes;
    changes.title = "renamed";
    changes.set_prediction(Channel::emotion, ProbabilityMap{{"calm", 0.6}});
    REQUIRE(store.update(id, changes));

    auto row = store.get_by_id(id);
    REQUIRE(row.has_value());
    CHECK(row->title == "renamed");
    CHECK(row->description == std::optional<std::string>("keep me"));
    CHECK(row->channel(Channel::age).prediction.has_value());
    CHECK(row->channel(Channel::emotion).prediction->at("calm") == 0.6);

    SECTION("nullable columns can be cleared") {
        AnalysisUpdate clear;
        clear.description.emplace(std::nullopt);
        clear.set_prediction(Channel::age, std::nullopt);
        REQUIRE(store.update(id, clear));

        auto cleared = store.get_by_id(id);
        REQUIRE(cleared.has_value());
        CHECK_FALSE(cleared->description.has_value());
        CHECK_FALSE(cleared->channel(Channel::age).prediction.has_value());
        CHECK(cleared->channel(Channel::emotion).prediction.has_value());
    }

    SECTION("unknown id reports false") {
        CHECK_FALSE(store.update(id + 100, changes));
    }

    SECTION("empty update only checks existence") {
        CHECK(store.update(id, AnalysisUpdate{}));
        CHECK_FALSE(store.update(id + 100, AnalysisUpdate{}));
    }
}

TEST_CASE("store: modify rolls back when the callback throws", "[store]") {
    temp_directory temp_dir;
    AnalysisStore store((temp_dir.path() / "analysis.db").string());
    store.open();
    const int64_t id = store.insert(make_record("guarded"), true);

    CHECK_THROWS_AS(store.modify(id,
                                 [](const AnalysisRecord&) -> AnalysisUpdate {
                                     throw ValidationError("rejected");
                                 }),
                    ValidationError);

    // The store is usable afterwards and the row unchanged.
    auto updated = store.modify(id, [](const AnalysisRecord& current) {
        AnalysisUpdate changes;
        changes.title = current.title + "!";
        return changes;
    });
    REQUIRE(updated.has_value());
    CHECK(updated->title == "guarded!");

    CHECK_FALSE(store.modify(id + 1, [](const AnalysisRecord&) {
        return AnalysisUpdate{};
    }).has_value());
}

TEST_CASE("store: unreadable prediction text loads as no prediction", "[store]") {
    temp_directory temp_dir;
    const std::string db_path = (temp_dir.path() / "analysis.db").string();
    AnalysisStore store(db_path);
    store.open();
    const int64_t id = store.insert(make_record("corrupt"), true);

    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(db_path.c_str(), &db) == SQLITE_OK);
        const std::string sql = "UPDATE AudioAnalysis SET NATIONALITY_RESULT = 'garbage', "
                                "SEND_STATUS = 42 WHERE _id = " + std::to_string(id);
        REQUIRE(sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }

    auto row = store.get_by_id(id);
    REQUIRE(row.has_value());
    CHECK_FALSE(row->channel(Channel::nationality).prediction.has_value());
    CHECK(row->send_status == SendStatus::error);
}

// ============================================================================
// query_all
// ============================================================================

TEST_CASE("store: query ordering, filters and limits", "[store][query]") {
    temp_directory temp_dir;
    AnalysisStore store((temp_dir.path() / "analysis.db").string());
    store.open();

    using std::chrono::seconds;
    const int64_t old_id = store.insert(make_record("old", TimePoint{seconds(1000)}), true);
    const int64_t mid_id = store.insert(make_record("mid", TimePoint{seconds(2000)}), true);
    const int64_t new_id = store.insert(make_record("new", TimePoint{seconds(3000)}), true);
    const int64_t hidden = store.insert(make_record("hidden", TimePoint{seconds(4000)}), false);

    AnalysisUpdate failed;
    failed.send_status = SendStatus::error;
    REQUIRE(store.update(mid_id, failed));

    AnalysisUpdate done;
    done.completion_date.emplace(TimePoint{seconds(5000)});
    REQUIRE(store.update(old_id, done));

    SECTION("newest first by default, unresolved hidden") {
        auto rows = store.query_all();
        REQUIRE(rows.size() == 3);
        CHECK(rows[0].id == std::optional<int64_t>(new_id));
        CHECK(rows[2].id == std::optional<int64_t>(old_id));
    }

    SECTION("oldest first with limit") {
        QueryOptions options;
        options.order = SortOrder::oldest_first;
        options.limit = 2;
        auto rows = store.query_all(options);
        REQUIRE(rows.size() == 2);
        CHECK(rows[0].title == "old");
        CHECK(rows[1].title == "mid");
    }

    SECTION("status filter") {
        QueryOptions options;
        options.status = SendStatus::error;
        auto rows = store.query_all(options);
        REQUIRE(rows.size() == 1);
        CHECK(rows[0].id == std::optional<int64_t>(mid_id));
    }

    SECTION("completed only") {
        QueryOptions options;
        options.completed_only = true;
        auto rows = store.query_all(options);
        REQUIRE(rows.size() == 1);
        CHECK(rows[0].title == "old");
    }

    SECTION("unresolved rows on request") {
        QueryOptions options;
        options.include_unresolved = true;
        CHECK(store.query_all(options).size() == 4);
        CHECK(store.unresolved_ids() == std::vector<int64_t>{hidden});
    }
}

// ============================================================================
// remove / tags
// ============================================================================

TEST_CASE("store: tags", "[store][tags]") {
    temp_directory temp_dir;
    AnalysisStore store((temp_dir.path() / "analysis.db").string());
    store.open();
    const int64_t a = store.insert(make_record("a"), true);
    const int64_t b = store.insert(make_record("b"), true);

    CHECK(store.add_tag(a, "work"));
    CHECK(store.add_tag(a, "  morning "));
    CHECK(store.add_tag(b, "work"));

    SECTION("duplicate link is refused") {
        CHECK_FALSE(store.add_tag(a, "work"));
    }

    SECTION("tags are shared by name and trimmed") {
        auto tags = store.tags_for(a);
        REQUIRE(tags.size() == 2);
        CHECK(tags[0].name == "morning");
        CHECK(tags[1].name == "work");
        CHECK(store.all_tags().size() == 2);
    }

    SECTION("blank names are rejected") {
        CHECK_THROWS_AS(store.add_tag(a, "   "), ValidationError);
    }

    SECTION("unknown analysis") {
        CHECK_FALSE(store.add_tag(9999, "work"));
    }

    SECTION("unlink keeps the tag") {
        CHECK(store.remove_tag(a, "work"));
        CHECK_FALSE(store.remove_tag(a, "work"));
        CHECK(store.tags_for(a).size() == 1);
        CHECK(store.tags_for(b).size() == 1);
        CHECK(store.all_tags().size() == 2);
    }

    SECTION("deleting a tag unlinks it everywhere") {
        int64_t work_id = 0;
        for (const auto& t : store.all_tags()) {
            if (t.name == "work") work_id = t.id;
        }
        REQUIRE(work_id != 0);
        CHECK(store.delete_tag(work_id));
        CHECK(store.tags_for(b).empty());
        CHECK(store.tags_for(a).size() == 1);
    }

    SECTION("removing an analysis drops its links") {
        CHECK(store.remove(a));
        CHECK_FALSE(store.exists(a));
        CHECK(store.tags_for(a).empty());
        CHECK(store.tags_for(b).size() == 1);
        CHECK_FALSE(store.remove(a));
    }
}
