#pragma once

#include "Types.hpp"

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Forward-declare sqlite3 so we don't leak its header into consumers.
struct sqlite3;
struct sqlite3_stmt;

namespace va {

/// Field-level partial update.  A field is written only if its outer
/// optional is engaged; for nullable columns the inner optional carries the
/// value or NULL.
struct AnalysisUpdate {
    std::optional<std::string>                title;
    std::optional<std::optional<std::string>> description;
    std::optional<SendStatus>                 send_status;
    std::optional<std::optional<std::string>> error_message;
    std::optional<std::string>                audio_path;
    std::optional<bool>                       path_resolved;
    std::optional<std::optional<TimePoint>>   completion_date;
    std::array<std::optional<std::optional<ProbabilityMap>>, 4> predictions{};
    std::array<std::optional<std::optional<bool>>, 4>           feedback{};

    void set_prediction(Channel c, std::optional<ProbabilityMap> map) {
        predictions[static_cast<size_t>(c)].emplace(std::move(map));
    }
    void set_feedback(Channel c, std::optional<bool> value) {
        feedback[static_cast<size_t>(c)].emplace(value);
    }

    bool empty() const;
};

enum class SortOrder {
    newest_first,   // CREATION_DATE DESC
    oldest_first,   // CREATION_DATE ASC
    id_ascending
};

struct QueryOptions {
    SortOrder                 order = SortOrder::newest_first;
    std::optional<size_t>     limit;
    std::optional<SendStatus> status;
    bool                      completed_only = false;   // COMPLETION_DATE set
    bool                      include_unresolved = false;
};

/// Persistent storage for analysis rows and their tags.
///
/// One SQLite connection guarded by a mutex: every public call is atomic
/// with respect to every other, so concurrent field-level updates to the
/// same row never lose each other.  WAL mode, foreign keys on.  The schema
/// is versioned through PRAGMA user_version and migrated in open().
///
/// Failures are reported as StorageError; "not found" is reported through
/// optional / bool results.
class AnalysisStore {
public:
    /// Schema version this build writes.
    static constexpr int kSchemaVersion = 4;

    explicit AnalysisStore(const std::string& db_path);
    ~AnalysisStore();

    // Non-copyable.
    AnalysisStore(const AnalysisStore&) = delete;
    AnalysisStore& operator=(const AnalysisStore&) = delete;

    /// Open (or create) the database and run pending migrations.
    void open();

    void close();
    bool is_open() const;

    /// PRAGMA user_version of the open database.
    int schema_version() const;

    // ---- Analyses ----

    /// Insert a new row and return the id SQLite assigned.  `record.id`
    /// is ignored.  Tags are not written.  `on_inserted`, if set, runs with
    /// the new id before any other call can see the row; it must not call
    /// back into the store.
    int64_t insert(const AnalysisRecord& record, bool path_resolved = false,
                   const std::function<void(int64_t)>& on_inserted = nullptr);

    /// Apply a partial update.  Returns false if no row has this id.
    bool update(int64_t id, const AnalysisUpdate& changes);

    /// Read the row, let `fn` compute the changes, and write them, all in
    /// one transaction.  `fn` must not call back into the store.  If `fn`
    /// throws, nothing is written and the exception propagates.
    /// Returns the updated record, or nullopt if no row has this id.
    std::optional<AnalysisRecord> modify(
        int64_t id,
        const std::function<AnalysisUpdate(const AnalysisRecord&)>& fn);

    /// Returns the row regardless of its PATH_RESOLVED flag.
    std::optional<AnalysisRecord> get_by_id(int64_t id) const;

    std::vector<AnalysisRecord> query_all(const QueryOptions& options = {}) const;

    /// Delete the row and its tag links.  Returns false if it did not exist.
    bool remove(int64_t id);

    bool exists(int64_t id) const;
    std::optional<bool> is_path_resolved(int64_t id) const;

    /// Rows still waiting for their permanent audio path.
    std::vector<int64_t> unresolved_ids() const;

    // ---- Tags ----

    /// Link tag `name` to the analysis, creating the tag if needed.
    /// Returns false if the analysis does not exist or was already tagged.
    bool add_tag(int64_t analysis_id, const std::string& name);

    /// Unlink; the tag itself survives.  Returns false if it was not linked.
    bool remove_tag(int64_t analysis_id, const std::string& name);

    std::vector<Tag> tags_for(int64_t analysis_id) const;
    std::vector<Tag> all_tags() const;

    /// Delete a tag and every link to it.
    bool delete_tag(int64_t tag_id);

private:
    void migrate();
    int  read_user_version() const;

    void exec(const char* sql);
    std::optional<AnalysisRecord> select_one(int64_t id) const;
    bool apply_update(int64_t id, const AnalysisUpdate& changes);
    std::vector<Tag> select_tags(sqlite3_stmt* stmt) const;

    static AnalysisRecord read_row(sqlite3_stmt* stmt);

    std::string        db_path_;
    sqlite3*           db_ = nullptr;
    mutable std::mutex mu_;
};

} // namespace va
