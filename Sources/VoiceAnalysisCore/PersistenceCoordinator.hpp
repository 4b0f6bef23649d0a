#pragma once

#include "AnalysisStore.hpp"
#include "FileVault.hpp"
#include "Types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace va {

/// Orchestrates the store and the vault so that every analysis visible to
/// readers owns exactly one audio file under recording_<id>/.
///
///   create_analysis()
///        |
///   insert row (PATH_RESOLVED = 0)  -->  vault.store()  -->  commit path
///                                             |                   |
///                                   fail: roll the row back   fail: row stays
///                                                             unresolved,
///                                                             reconcile() later
///
/// Operations that read, modify and write one row are serialised per id;
/// different ids proceed in parallel.
class PersistenceCoordinator {
public:
    /// Both collaborators must outlive the coordinator.
    PersistenceCoordinator(AnalysisStore& store, FileVault& vault);

    // Non-copyable.
    PersistenceCoordinator(const PersistenceCoordinator&) = delete;
    PersistenceCoordinator& operator=(const PersistenceCoordinator&) = delete;

    // ---- Create / reconcile / delete ----

    /// Persist a new analysis and move its audio into the vault.  The source
    /// file is copied, never moved; the caller may delete it afterwards.
    ///
    /// Throws ValidationError (blank title, missing source), StorageError
    /// (insert failed), FileSystemError (copy failed, row rolled back) or
    /// UnresolvedAnalysisError (file copied but the path commit failed, or
    /// the rollback after a failed copy did not go through).
    AnalysisRecord create_analysis(const std::string& title,
                                   const std::optional<std::string>& description,
                                   const std::string& source_path);

    /// Finish or discard one unresolved row.  Returns false if there is no
    /// such row, it was already resolved, or create_analysis() is still
    /// working on it.
    bool reconcile(int64_t id);

    /// reconcile() every unresolved row.  Returns how many were handled.
    /// Rows that still fail are logged and left for the next run.
    size_t reconcile_all();

    /// Remove the row, its tag links and its vault directory.  Returns
    /// whether a row was removed.  Rows still being created are left alone.
    /// A directory that cannot be deleted once the row is gone is logged,
    /// not thrown.
    bool delete_analysis(int64_t id);

    /// Delete vault directories that no row refers to.  Returns the count.
    size_t sweep_orphaned_directories();

    // ---- Results ----

    /// Merge one channel's map into the row.  The first map to arrive also
    /// sets the completion date.  Other channels are untouched.
    /// Throws ValidationError for maps the codec cannot store faithfully
    /// and StorageError for an unknown id.
    AnalysisRecord apply_predictions(int64_t id,
                                     Channel channel,
                                     const ProbabilityMap& probabilities,
                                     TimePoint completed_at = Clock::now());

    /// Record the user's verdict on a channel.  ValidationError if the
    /// channel has no prediction yet.
    AnalysisRecord set_feedback(int64_t id, Channel channel, bool correct);

    // ---- Status ----

    AnalysisRecord mark_sent(int64_t id);
    AnalysisRecord mark_error(int64_t id, const std::string& message);

    /// error -> pending.  ValidationError from any other status.
    AnalysisRecord retry_analysis(int64_t id);

    // ---- Read surface (resolved rows only, tags loaded) ----

    std::optional<AnalysisRecord> get_analysis_by_id(int64_t id) const;
    std::vector<AnalysisRecord> query_all(const QueryOptions& options = {}) const;
    std::vector<AnalysisRecord> recent(size_t limit = 5) const;
    std::vector<AnalysisRecord> pending() const;
    std::vector<AnalysisRecord> failed() const;
    std::vector<AnalysisRecord> completed() const;

    // ---- Tags ----

    /// Returns false for unknown or unresolved ids and for duplicate links.
    bool add_tag(int64_t id, const std::string& name);
    bool remove_tag(int64_t id, const std::string& name);
    std::vector<Tag> all_tags() const;
    bool delete_tag(int64_t tag_id);

private:
    /// Holds the per-id mutex for as long as it lives.
    class IdGuard {
    public:
        explicit IdGuard(std::shared_ptr<std::mutex> mu)
            : mu_(std::move(mu)), lock_(*mu_) {}

    private:
        std::shared_ptr<std::mutex>  mu_;
        std::unique_lock<std::mutex> lock_;
    };

    IdGuard lock_id(int64_t id);

    /// Marks an id whose create_analysis() has not finished yet.
    class CreatingMark {
    public:
        CreatingMark(PersistenceCoordinator& owner, int64_t id) : owner_(owner), id_(id) {}
        ~CreatingMark();

        CreatingMark(const CreatingMark&) = delete;
        CreatingMark& operator=(const CreatingMark&) = delete;

    private:
        PersistenceCoordinator& owner_;
        int64_t                 id_;
    };

    bool is_creating(int64_t id);

    void commit_path(int64_t id, const std::string& permanent_path);
    [[noreturn]] void roll_back_create(int64_t id, const std::string& reason);
    AnalysisRecord require(const std::optional<AnalysisRecord>& record,
                           int64_t id) const;
    std::vector<AnalysisRecord> with_tags(std::vector<AnalysisRecord> records) const;

    AnalysisStore& store_;
    FileVault&     vault_;

    std::mutex                                               locks_mu_;
    std::unordered_map<int64_t, std::weak_ptr<std::mutex>>   id_locks_;
    std::unordered_set<int64_t>                              creating_;
};

} // namespace va
