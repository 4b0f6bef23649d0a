#include "AnalysisStore.hpp"

#include "Errors.hpp"
#include "Logging.hpp"
#include "ProbabilityMapCodec.hpp"
#include "TimeFormat.hpp"

#include <filesystem>
#include <utility>

#include <sqlite3.h>

namespace va {

namespace {

constexpr const char* kSelectColumns =
    "SELECT _id, TITLE, DESCRIPTION, SEND_STATUS, ERROR_MESSAGE, RECORDING_PATH, "
    "CREATION_DATE, COMPLETION_DATE, "
    "AGE_RESULT, GENDER_RESULT, NATIONALITY_RESULT, EMOTION_RESULT, "
    "AGE_USER_FEEDBACK, GENDER_USER_FEEDBACK, NATIONALITY_USER_FEEDBACK, "
    "EMOTION_USER_FEEDBACK "
    "FROM AudioAnalysis";

constexpr int kFirstResultColumn   = 8;
constexpr int kFirstFeedbackColumn = 12;

// ---------------------------------------------------------------------------
// Migrations, keyed by the version they bring the schema to.
// ---------------------------------------------------------------------------

struct Migration {
    int                      version;
    std::vector<const char*> statements;
};

const std::vector<Migration>& migrations() {
    static const std::vector<Migration> steps = {
        {1, {R"SQL(
            CREATE TABLE IF NOT EXISTS AudioAnalysis (
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
            )
        )SQL"}},
        {2, {
            "ALTER TABLE AudioAnalysis ADD COLUMN EMOTION_RESULT TEXT",
            "ALTER TABLE AudioAnalysis ADD COLUMN EMOTION_USER_FEEDBACK INTEGER",
        }},
        {3, {R"SQL(
            CREATE TABLE IF NOT EXISTS Tag (
                _id INTEGER PRIMARY KEY AUTOINCREMENT,
                NAME TEXT NOT NULL UNIQUE
            )
        )SQL", R"SQL(
            CREATE TABLE IF NOT EXISTS AudioAnalysisTag (
                ANALYSIS_ID INTEGER NOT NULL
                    REFERENCES AudioAnalysis(_id) ON DELETE CASCADE,
                TAG_ID INTEGER NOT NULL
                    REFERENCES Tag(_id) ON DELETE CASCADE,
                PRIMARY KEY (ANALYSIS_ID, TAG_ID)
            )
        )SQL",
            "CREATE INDEX IF NOT EXISTS idx_analysis_tag_tag ON AudioAnalysisTag(TAG_ID)",
        }},
        {4, {
            // Rows written before this version already point at the vault.
            "ALTER TABLE AudioAnalysis ADD COLUMN PATH_RESOLVED INTEGER NOT NULL DEFAULT 1",
            "CREATE INDEX IF NOT EXISTS idx_analysis_created ON AudioAnalysis(CREATION_DATE)",
            "CREATE INDEX IF NOT EXISTS idx_analysis_status ON AudioAnalysis(SEND_STATUS)",
        }},
    };
    return steps;
}

// ---------------------------------------------------------------------------
// RAII helper for SQLite transactions
// ---------------------------------------------------------------------------

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        char* err = nullptr;
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw StorageError("BEGIN failed: " + msg);
        }
    }
    void commit() {
        if (committed_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw StorageError("COMMIT failed: " + msg);
        }
        committed_ = true;
    }
    ~Transaction() {
        if (!committed_) {
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
                Log::error(std::string("ROLLBACK failed: ") + sqlite3_errmsg(db_));
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    sqlite3* db_;
    bool committed_ = false;
};

// ---------------------------------------------------------------------------
// RAII helper for SQLite prepared statements
// ---------------------------------------------------------------------------

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            stmt_ = nullptr;
            throw StorageError("Prepare failed: " + msg + " [" + sql + "]");
        }
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    operator sqlite3_stmt*() const { return stmt_; }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, int64_t v) {
        check(sqlite3_bind_int64(stmt_, idx, v));
    }
    void bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(stmt_, idx, v.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int idx, const std::optional<std::string>& v) {
        if (v) bind(idx, *v);
        else check(sqlite3_bind_null(stmt_, idx));
    }
    void bind(int idx, const std::optional<int64_t>& v) {
        if (v) bind(idx, *v);
        else check(sqlite3_bind_null(stmt_, idx));
    }

    /// Step once, expecting no result row.
    void run() {
        if (sqlite3_step(stmt_) != SQLITE_DONE) {
            throw StorageError(std::string("Step failed: ") + sqlite3_errmsg(db_));
        }
    }

    /// Step once; true if a row is available.
    bool next() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StorageError(std::string("Step failed: ") + sqlite3_errmsg(db_));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StorageError(std::string("Bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3*      db_;
    sqlite3_stmt* stmt_ = nullptr;
};

std::optional<std::string> column_text(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    const auto* t = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return std::string(t ? t : "");
}

std::optional<int64_t> column_int(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int64(stmt, col);
}

std::optional<int64_t> bool_to_column(const std::optional<bool>& v) {
    if (!v) return std::nullopt;
    return *v ? 1 : 0;
}

std::optional<std::string> date_to_column(const std::optional<TimePoint>& tp) {
    if (!tp) return std::nullopt;
    return to_iso8601(*tp);
}

std::string trim_name(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

} // namespace

// ---------------------------------------------------------------------------
// AnalysisUpdate
// ---------------------------------------------------------------------------

bool AnalysisUpdate::empty() const {
    if (title || description || send_status || error_message || audio_path ||
        path_resolved || completion_date) {
        return false;
    }
    for (const auto& p : predictions) {
        if (p) return false;
    }
    for (const auto& f : feedback) {
        if (f) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AnalysisStore::AnalysisStore(const std::string& db_path)
    : db_path_(db_path) {}

AnalysisStore::~AnalysisStore() {
    close();
}

// ---------------------------------------------------------------------------
// open / close / is_open
// ---------------------------------------------------------------------------

void AnalysisStore::open() {
    std::lock_guard<std::mutex> lock(mu_);

    if (db_) return;   // already open

    if (db_path_.empty()) throw StorageError("Database path is empty");

    // Ensure parent directory exists.
    auto parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StorageError("Cannot create database directory " +
                               parent.string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageError("Cannot open database " + db_path_ + ": " + msg);
    }

    try {
        // WAL for crash safety; foreign keys for tag cascades.
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA foreign_keys=ON");
        sqlite3_busy_timeout(db_, 5000);
        migrate();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    Log::info("Analysis store opened at " + db_path_ + " (schema v" +
              std::to_string(kSchemaVersion) + ")");
}

void AnalysisStore::close() {
    std::lock_guard<std::mutex> lock(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool AnalysisStore::is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return db_ != nullptr;
}

int AnalysisStore::schema_version() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");
    return read_user_version();
}

// ---------------------------------------------------------------------------
// migrate
// ---------------------------------------------------------------------------

void AnalysisStore::migrate() {
    const int current = read_user_version();
    if (current > kSchemaVersion) {
        throw StorageError("Database schema v" + std::to_string(current) +
                           " is newer than this build (v" +
                           std::to_string(kSchemaVersion) + ")");
    }

    for (const auto& step : migrations()) {
        if (step.version <= current) continue;

        Transaction txn(db_);
        for (const char* sql : step.statements) {
            exec(sql);
        }
        exec(("PRAGMA user_version = " + std::to_string(step.version)).c_str());
        txn.commit();

        Log::debug("Migrated analysis store to v" + std::to_string(step.version));
    }
}

int AnalysisStore::read_user_version() const {
    Statement stmt(db_, "PRAGMA user_version");
    if (!stmt.next()) return 0;
    return sqlite3_column_int(stmt, 0);
}

void AnalysisStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StorageError(msg + " [" + sql + "]");
    }
}

// ---------------------------------------------------------------------------
// Analyses
// ---------------------------------------------------------------------------

int64_t AnalysisStore::insert(const AnalysisRecord& record, bool path_resolved,
                              const std::function<void(int64_t)>& on_inserted) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Transaction txn(db_);

    Statement stmt(db_,
        "INSERT INTO AudioAnalysis ("
        "TITLE, DESCRIPTION, SEND_STATUS, ERROR_MESSAGE, RECORDING_PATH, "
        "CREATION_DATE, COMPLETION_DATE, "
        "AGE_RESULT, GENDER_RESULT, NATIONALITY_RESULT, EMOTION_RESULT, "
        "AGE_USER_FEEDBACK, GENDER_USER_FEEDBACK, NATIONALITY_USER_FEEDBACK, "
        "EMOTION_USER_FEEDBACK, PATH_RESOLVED) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");

    stmt.bind(1, record.title);
    stmt.bind(2, record.description);
    stmt.bind(3, static_cast<int64_t>(send_status_to_int(record.send_status)));
    stmt.bind(4, record.error_message);
    stmt.bind(5, record.audio_path);
    stmt.bind(6, to_iso8601(record.creation_date));
    stmt.bind(7, date_to_column(record.completion_date));
    for (size_t i = 0; i < kAllChannels.size(); ++i) {
        const auto& ch = record.channels[i];
        stmt.bind(8 + static_cast<int>(i), ProbabilityMapCodec::encode(ch.prediction));
        stmt.bind(12 + static_cast<int>(i), bool_to_column(ch.feedback));
    }
    stmt.bind(16, static_cast<int64_t>(path_resolved ? 1 : 0));
    stmt.run();

    const int64_t id = sqlite3_last_insert_rowid(db_);
    txn.commit();
    if (on_inserted) on_inserted(id);
    return id;
}

bool AnalysisStore::update(int64_t id, const AnalysisUpdate& changes) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Transaction txn(db_);
    bool found = apply_update(id, changes);
    txn.commit();
    return found;
}

std::optional<AnalysisRecord> AnalysisStore::modify(
    int64_t id,
    const std::function<AnalysisUpdate(const AnalysisRecord&)>& fn) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Transaction txn(db_);

    auto current = select_one(id);
    if (!current) return std::nullopt;

    AnalysisUpdate changes = fn(*current);
    apply_update(id, changes);
    auto updated = select_one(id);

    txn.commit();
    return updated;
}

bool AnalysisStore::apply_update(int64_t id, const AnalysisUpdate& changes) {
    if (changes.empty()) {
        Statement row(db_, "SELECT 1 FROM AudioAnalysis WHERE _id = ?");
        row.bind(1, id);
        return row.next();
    }

    // Build "SET col = ?" for the engaged fields only, remembering how to
    // bind each placeholder.
    std::string sql = "UPDATE AudioAnalysis SET ";
    std::vector<std::function<void(Statement&, int)>> binders;

    auto add = [&](const std::string& column, std::function<void(Statement&, int)> b) {
        if (!binders.empty()) sql += ", ";
        sql += column + " = ?";
        binders.push_back(std::move(b));
    };

    if (changes.title) {
        add("TITLE", [&](Statement& s, int i) { s.bind(i, *changes.title); });
    }
    if (changes.description) {
        add("DESCRIPTION", [&](Statement& s, int i) { s.bind(i, *changes.description); });
    }
    if (changes.send_status) {
        add("SEND_STATUS", [&](Statement& s, int i) {
            s.bind(i, static_cast<int64_t>(send_status_to_int(*changes.send_status)));
        });
    }
    if (changes.error_message) {
        add("ERROR_MESSAGE", [&](Statement& s, int i) { s.bind(i, *changes.error_message); });
    }
    if (changes.audio_path) {
        add("RECORDING_PATH", [&](Statement& s, int i) { s.bind(i, *changes.audio_path); });
    }
    if (changes.path_resolved) {
        add("PATH_RESOLVED", [&](Statement& s, int i) {
            s.bind(i, static_cast<int64_t>(*changes.path_resolved ? 1 : 0));
        });
    }
    if (changes.completion_date) {
        add("COMPLETION_DATE", [&](Statement& s, int i) {
            s.bind(i, date_to_column(*changes.completion_date));
        });
    }
    for (Channel c : kAllChannels) {
        const size_t idx = static_cast<size_t>(c);
        if (changes.predictions[idx]) {
            add(std::string(channel_to_string(c)) + "_RESULT",
                [&changes, idx](Statement& s, int i) {
                    s.bind(i, ProbabilityMapCodec::encode(*changes.predictions[idx]));
                });
        }
        if (changes.feedback[idx]) {
            add(std::string(channel_to_string(c)) + "_USER_FEEDBACK",
                [&changes, idx](Statement& s, int i) {
                    s.bind(i, bool_to_column(*changes.feedback[idx]));
                });
        }
    }

    sql += " WHERE _id = ?";

    Statement stmt(db_, sql);
    int i = 1;
    for (auto& b : binders) {
        b(stmt, i++);
    }
    stmt.bind(i, id);
    stmt.run();

    return sqlite3_changes(db_) > 0;
}

std::optional<AnalysisRecord> AnalysisStore::get_by_id(int64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");
    return select_one(id);
}

std::optional<AnalysisRecord> AnalysisStore::select_one(int64_t id) const {
    Statement stmt(db_, std::string(kSelectColumns) + " WHERE _id = ?");
    stmt.bind(1, id);
    if (!stmt.next()) return std::nullopt;
    return read_row(stmt);
}

std::vector<AnalysisRecord> AnalysisStore::query_all(const QueryOptions& options) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    std::string sql = kSelectColumns;
    std::vector<std::string> where;
    if (!options.include_unresolved) where.push_back("PATH_RESOLVED = 1");
    if (options.status) where.push_back("SEND_STATUS = ?");
    if (options.completed_only) where.push_back("COMPLETION_DATE IS NOT NULL");
    for (size_t i = 0; i < where.size(); ++i) {
        sql += (i == 0 ? " WHERE " : " AND ") + where[i];
    }

    switch (options.order) {
        case SortOrder::newest_first: sql += " ORDER BY CREATION_DATE DESC, _id DESC"; break;
        case SortOrder::oldest_first: sql += " ORDER BY CREATION_DATE ASC, _id ASC"; break;
        case SortOrder::id_ascending: sql += " ORDER BY _id ASC"; break;
    }
    if (options.limit) sql += " LIMIT ?";

    Statement stmt(db_, sql);
    int idx = 1;
    if (options.status) {
        stmt.bind(idx++, static_cast<int64_t>(send_status_to_int(*options.status)));
    }
    if (options.limit) {
        stmt.bind(idx++, static_cast<int64_t>(*options.limit));
    }

    std::vector<AnalysisRecord> results;
    while (stmt.next()) {
        results.push_back(read_row(stmt));
    }
    return results;
}

bool AnalysisStore::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Transaction txn(db_);

    // Delete tag links first (foreign key).
    {
        Statement stmt(db_, "DELETE FROM AudioAnalysisTag WHERE ANALYSIS_ID = ?");
        stmt.bind(1, id);
        stmt.run();
    }

    bool found = false;
    {
        Statement stmt(db_, "DELETE FROM AudioAnalysis WHERE _id = ?");
        stmt.bind(1, id);
        stmt.run();
        found = sqlite3_changes(db_) > 0;
    }

    txn.commit();
    return found;
}

bool AnalysisStore::exists(int64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Statement stmt(db_, "SELECT 1 FROM AudioAnalysis WHERE _id = ?");
    stmt.bind(1, id);
    return stmt.next();
}

std::optional<bool> AnalysisStore::is_path_resolved(int64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Statement stmt(db_, "SELECT PATH_RESOLVED FROM AudioAnalysis WHERE _id = ?");
    stmt.bind(1, id);
    if (!stmt.next()) return std::nullopt;
    return sqlite3_column_int(stmt, 0) != 0;
}

std::vector<int64_t> AnalysisStore::unresolved_ids() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Statement stmt(db_, "SELECT _id FROM AudioAnalysis WHERE PATH_RESOLVED = 0 ORDER BY _id");
    std::vector<int64_t> ids;
    while (stmt.next()) {
        ids.push_back(sqlite3_column_int64(stmt, 0));
    }
    return ids;
}

// ---------------------------------------------------------------------------
// Tags
// ---------------------------------------------------------------------------

bool AnalysisStore::add_tag(int64_t analysis_id, const std::string& name) {
    const std::string tag = trim_name(name);
    if (tag.empty()) throw ValidationError("Tag name must not be empty");

    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Transaction txn(db_);

    {
        Statement row(db_, "SELECT 1 FROM AudioAnalysis WHERE _id = ?");
        row.bind(1, analysis_id);
        if (!row.next()) return false;
    }
    {
        Statement stmt(db_, "INSERT OR IGNORE INTO Tag (NAME) VALUES (?)");
        stmt.bind(1, tag);
        stmt.run();
    }

    bool linked = false;
    {
        Statement stmt(db_,
            "INSERT OR IGNORE INTO AudioAnalysisTag (ANALYSIS_ID, TAG_ID) "
            "SELECT ?, _id FROM Tag WHERE NAME = ?");
        stmt.bind(1, analysis_id);
        stmt.bind(2, tag);
        stmt.run();
        linked = sqlite3_changes(db_) > 0;
    }

    txn.commit();
    return linked;
}

bool AnalysisStore::remove_tag(int64_t analysis_id, const std::string& name) {
    const std::string tag = trim_name(name);

    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Transaction txn(db_);
    Statement stmt(db_,
        "DELETE FROM AudioAnalysisTag WHERE ANALYSIS_ID = ? "
        "AND TAG_ID = (SELECT _id FROM Tag WHERE NAME = ?)");
    stmt.bind(1, analysis_id);
    stmt.bind(2, tag);
    stmt.run();
    bool removed = sqlite3_changes(db_) > 0;
    txn.commit();
    return removed;
}

std::vector<Tag> AnalysisStore::tags_for(int64_t analysis_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Statement stmt(db_,
        "SELECT t._id, t.NAME FROM Tag t "
        "JOIN AudioAnalysisTag l ON l.TAG_ID = t._id "
        "WHERE l.ANALYSIS_ID = ? ORDER BY t.NAME");
    stmt.bind(1, analysis_id);
    return select_tags(stmt);
}

std::vector<Tag> AnalysisStore::all_tags() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Statement stmt(db_, "SELECT _id, NAME FROM Tag ORDER BY NAME");
    return select_tags(stmt);
}

bool AnalysisStore::delete_tag(int64_t tag_id) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!db_) throw StorageError("Database is not open");

    Transaction txn(db_);
    {
        Statement stmt(db_, "DELETE FROM AudioAnalysisTag WHERE TAG_ID = ?");
        stmt.bind(1, tag_id);
        stmt.run();
    }
    bool found = false;
    {
        Statement stmt(db_, "DELETE FROM Tag WHERE _id = ?");
        stmt.bind(1, tag_id);
        stmt.run();
        found = sqlite3_changes(db_) > 0;
    }
    txn.commit();
    return found;
}

std::vector<Tag> AnalysisStore::select_tags(sqlite3_stmt* stmt) const {
    std::vector<Tag> tags;
    while (true) {
        int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            throw StorageError(std::string("Step failed: ") + sqlite3_errmsg(db_));
        }
        Tag t;
        t.id   = sqlite3_column_int64(stmt, 0);
        t.name = column_text(stmt, 1).value_or("");
        tags.push_back(std::move(t));
    }
    return tags;
}

// ---------------------------------------------------------------------------
// Row mapping
// ---------------------------------------------------------------------------

AnalysisRecord AnalysisStore::read_row(sqlite3_stmt* stmt) {
    AnalysisRecord r;
    r.id            = sqlite3_column_int64(stmt, 0);
    r.title         = column_text(stmt, 1).value_or("");
    r.description   = column_text(stmt, 2);
    r.send_status   = send_status_from_int(sqlite3_column_int64(stmt, 3));
    r.error_message = column_text(stmt, 4);
    r.audio_path    = column_text(stmt, 5).value_or("");

    const std::string created = column_text(stmt, 6).value_or("");
    if (auto tp = from_iso8601(created)) {
        r.creation_date = *tp;
    } else {
        Log::warn("Analysis " + std::to_string(*r.id) +
                  " has unreadable CREATION_DATE '" + created + "'");
    }

    if (auto completed = column_text(stmt, 7)) {
        r.completion_date = from_iso8601(*completed);
    }

    for (size_t i = 0; i < kAllChannels.size(); ++i) {
        auto& ch = r.channels[i];
        ch.prediction = ProbabilityMapCodec::decode(
            column_text(stmt, kFirstResultColumn + static_cast<int>(i)));
        if (auto fb = column_int(stmt, kFirstFeedbackColumn + static_cast<int>(i))) {
            ch.feedback = (*fb == 1);
        }
    }
    return r;
}

} // namespace va
