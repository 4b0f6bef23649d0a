#include "PersistenceCoordinator.hpp"

#include "Errors.hpp"
#include "Logging.hpp"
#include "ProbabilityMapCodec.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace va {

namespace {

/// Stored dates carry milliseconds; keep the in-memory copy identical.
TimePoint now_millis() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now().time_since_epoch());
    return TimePoint(ms);
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(ws) - first + 1);
}

std::string label(int64_t id) {
    return "analysis " + std::to_string(id);
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

PersistenceCoordinator::PersistenceCoordinator(AnalysisStore& store, FileVault& vault)
    : store_(store), vault_(vault) {}

// ---------------------------------------------------------------------------
// Per-id locks
// ---------------------------------------------------------------------------

PersistenceCoordinator::IdGuard PersistenceCoordinator::lock_id(int64_t id) {
    std::shared_ptr<std::mutex> mu;
    {
        std::lock_guard<std::mutex> lock(locks_mu_);

        auto& slot = id_locks_[id];
        mu = slot.lock();
        if (!mu) {
            mu = std::make_shared<std::mutex>();
            slot = mu;
        }

        // Forget ids nobody is working on.
        for (auto it = id_locks_.begin(); it != id_locks_.end();) {
            if (it->second.expired()) it = id_locks_.erase(it);
            else ++it;
        }
    }
    // Block outside the table lock so other ids are not held up.
    return IdGuard(std::move(mu));
}

PersistenceCoordinator::CreatingMark::~CreatingMark() {
    std::lock_guard<std::mutex> lock(owner_.locks_mu_);
    owner_.creating_.erase(id_);
}

bool PersistenceCoordinator::is_creating(int64_t id) {
    std::lock_guard<std::mutex> lock(locks_mu_);
    return creating_.count(id) > 0;
}

// ---------------------------------------------------------------------------
// create_analysis
// ---------------------------------------------------------------------------

AnalysisRecord PersistenceCoordinator::create_analysis(
    const std::string& title,
    const std::optional<std::string>& description,
    const std::string& source_path) {
    // 1. Validate before touching anything.
    const std::string clean_title = trim(title);
    if (clean_title.empty()) {
        throw ValidationError("Title must not be empty");
    }
    std::error_code ec;
    if (source_path.empty() || !fs::is_regular_file(source_path, ec)) {
        throw ValidationError("Source audio file not found: " + source_path);
    }

    // 2. Insert; the store hands out the id.
    AnalysisRecord record;
    record.title         = clean_title;
    record.description   = description;
    record.send_status   = SendStatus::pending;
    record.audio_path    = source_path;
    record.creation_date = now_millis();

    // The id is marked before the row becomes visible, so reconcile() and
    // delete_analysis() never act on a row that is still being created.
    const int64_t id = store_.insert(record, /*path_resolved=*/false, [this](int64_t new_id) {
        std::lock_guard<std::mutex> lock(locks_mu_);
        creating_.insert(new_id);
    });
    CreatingMark mark(*this, id);
    record.id = id;

    IdGuard guard = lock_id(id);

    // 3. Relocate into the vault.
    std::string permanent;
    try {
        permanent = vault_.store(source_path, id);
    } catch (const FileSystemError& e) {
        roll_back_create(id, e.what());
    } catch (const fs::filesystem_error& e) {
        roll_back_create(id, e.what());
    }

    // 4. Commit the permanent path.
    commit_path(id, permanent);
    record.audio_path = permanent;

    Log::info("Created " + label(id) + " at " + permanent);
    return record;
}

void PersistenceCoordinator::roll_back_create(int64_t id, const std::string& reason) {
    Log::warn("Relocation failed for " + label(id) + ", rolling back: " + reason);

    try {
        vault_.remove(id);
    } catch (const FileSystemError& e) {
        Log::warn("Could not clear partial vault directory for " + label(id) +
                  ": " + e.what());
    }

    try {
        store_.remove(id);
    } catch (const StorageError& e) {
        Log::error("Rollback of " + label(id) + " failed; row left unresolved: " +
                   e.what());
        throw UnresolvedAnalysisError(
            id, "Could not store audio for " + label(id) + " (" + reason +
                ") and the row could not be rolled back: " + e.what());
    }

    throw FileSystemError("Could not store audio for new analysis: " + reason);
}

void PersistenceCoordinator::commit_path(int64_t id, const std::string& permanent_path) {
    AnalysisUpdate changes;
    changes.audio_path    = permanent_path;
    changes.path_resolved = true;

    bool found = false;
    try {
        found = store_.update(id, changes);
    } catch (const StorageError& e) {
        Log::error("Path commit failed for " + label(id) + ": " + e.what());
        throw UnresolvedAnalysisError(
            id, "Audio for " + label(id) + " is at " + permanent_path +
                " but the path could not be recorded: " + e.what());
    }

    if (!found) {
        try {
            vault_.remove(id);
        } catch (const FileSystemError& e) {
            Log::error("Orphaned vault directory for vanished " + label(id) + ": " + e.what());
        }
        throw StorageError(label(id) + " vanished before its audio path was recorded");
    }
}

// ---------------------------------------------------------------------------
// reconcile
// ---------------------------------------------------------------------------

bool PersistenceCoordinator::reconcile(int64_t id) {
    IdGuard guard = lock_id(id);
    if (is_creating(id)) return false;

    const auto resolved = store_.is_path_resolved(id);
    if (!resolved || *resolved) return false;

    const auto record = store_.get_by_id(id);
    if (!record) return false;

    // Copy finished but the commit did not.
    if (auto stored = vault_.recording_path(id)) {
        commit_path(id, *stored);
        Log::info("Reconciled " + label(id) + ": recorded existing " + *stored);
        return true;
    }

    // Interrupted before the copy finished; the source is still around.
    std::error_code ec;
    if (fs::is_regular_file(record->audio_path, ec) &&
        !vault_.owns(record->audio_path, id)) {
        const std::string permanent = vault_.store(record->audio_path, id);
        commit_path(id, permanent);
        Log::info("Reconciled " + label(id) + ": relocated to " + permanent);
        return true;
    }

    // Nothing left to attach the row to.
    vault_.remove(id);
    store_.remove(id);
    Log::warn("Reconciled " + label(id) + ": audio missing, row removed");
    return true;
}

size_t PersistenceCoordinator::reconcile_all() {
    size_t handled = 0;
    for (int64_t id : store_.unresolved_ids()) {
        try {
            if (reconcile(id)) ++handled;
        } catch (const Error& e) {
            Log::error("Could not reconcile " + label(id) + ": " + e.what());
        } catch (const fs::filesystem_error& e) {
            Log::error("Could not reconcile " + label(id) + ": " + e.what());
        }
    }
    if (handled > 0) {
        Log::info("Reconciled " + std::to_string(handled) + " unresolved analyses");
    }
    return handled;
}

// ---------------------------------------------------------------------------
// delete_analysis / sweep_orphaned_directories
// ---------------------------------------------------------------------------

bool PersistenceCoordinator::delete_analysis(int64_t id) {
    IdGuard guard = lock_id(id);
    if (is_creating(id)) {
        Log::warn("Not deleting " + label(id) + ": it is still being created");
        return false;
    }

    // Row first: a leftover directory is harmless, a row without audio is not.
    const bool found = store_.remove(id);

    try {
        vault_.remove(id);
    } catch (const FileSystemError& e) {
        Log::error("Orphaned vault directory for deleted " + label(id) + ": " + e.what());
    } catch (const fs::filesystem_error& e) {
        Log::error("Orphaned vault directory for deleted " + label(id) + ": " + e.what());
    }

    if (found) Log::info("Deleted " + label(id));
    return found;
}

size_t PersistenceCoordinator::sweep_orphaned_directories() {
    size_t removed = 0;
    for (int64_t id : vault_.stored_ids()) {
        IdGuard guard = lock_id(id);
        if (is_creating(id) || store_.exists(id)) continue;
        if (vault_.remove(id)) {
            Log::info("Removed orphaned vault directory for " + label(id));
            ++removed;
        }
    }
    return removed;
}

// ---------------------------------------------------------------------------
// Results
// ---------------------------------------------------------------------------

AnalysisRecord PersistenceCoordinator::apply_predictions(int64_t id,
                                                         Channel channel,
                                                         const ProbabilityMap& probabilities,
                                                         TimePoint completed_at) {
    if (!ProbabilityMapCodec::is_encodable(probabilities)) {
        throw ValidationError(std::string("Cannot store ") + channel_to_string(channel) +
                              " prediction for " + label(id) +
                              ": labels must not contain ':' ',' '[' ']' and "
                              "values must be finite");
    }

    IdGuard guard = lock_id(id);
    auto updated = store_.modify(id, [&](const AnalysisRecord& current) {
        AnalysisUpdate changes;
        changes.set_prediction(channel, probabilities);
        if (!current.completion_date) {
            changes.completion_date.emplace(completed_at);
        }
        return changes;
    });

    Log::debug(std::string("Applied ") + channel_to_string(channel) +
               " prediction to " + label(id));
    return require(updated, id);
}

AnalysisRecord PersistenceCoordinator::set_feedback(int64_t id, Channel channel, bool correct) {
    IdGuard guard = lock_id(id);
    auto updated = store_.modify(id, [&](const AnalysisRecord& current) {
        if (!current.channel(channel).prediction) {
            throw ValidationError(std::string("No ") + channel_to_string(channel) +
                                  " prediction on " + label(id) + " to give feedback on");
        }
        AnalysisUpdate changes;
        changes.set_feedback(channel, correct);
        return changes;
    });
    return require(updated, id);
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

AnalysisRecord PersistenceCoordinator::mark_sent(int64_t id) {
    IdGuard guard = lock_id(id);
    auto updated = store_.modify(id, [](const AnalysisRecord&) {
        AnalysisUpdate changes;
        changes.send_status = SendStatus::sent;
        changes.error_message.emplace(std::nullopt);
        return changes;
    });
    return require(updated, id);
}

AnalysisRecord PersistenceCoordinator::mark_error(int64_t id, const std::string& message) {
    IdGuard guard = lock_id(id);
    auto updated = store_.modify(id, [&](const AnalysisRecord&) {
        AnalysisUpdate changes;
        changes.send_status = SendStatus::error;
        changes.error_message.emplace(message);
        return changes;
    });
    Log::warn("Marked " + label(id) + " as failed: " + message);
    return require(updated, id);
}

AnalysisRecord PersistenceCoordinator::retry_analysis(int64_t id) {
    IdGuard guard = lock_id(id);
    auto updated = store_.modify(id, [&](const AnalysisRecord& current) {
        if (current.send_status != SendStatus::error) {
            throw ValidationError("Only failed analyses can be retried; " + label(id) +
                                  " is " + send_status_to_string(current.send_status));
        }
        AnalysisUpdate changes;
        changes.send_status = SendStatus::pending;
        changes.error_message.emplace(std::nullopt);
        return changes;
    });
    return require(updated, id);
}

AnalysisRecord PersistenceCoordinator::require(const std::optional<AnalysisRecord>& record,
                                               int64_t id) const {
    if (!record) {
        throw StorageError("No " + label(id));
    }
    AnalysisRecord result = *record;
    result.tags = store_.tags_for(id);
    return result;
}

// ---------------------------------------------------------------------------
// Read surface
// ---------------------------------------------------------------------------

std::optional<AnalysisRecord> PersistenceCoordinator::get_analysis_by_id(int64_t id) const {
    const auto resolved = store_.is_path_resolved(id);
    if (!resolved || !*resolved) return std::nullopt;

    auto record = store_.get_by_id(id);
    if (record) record->tags = store_.tags_for(id);
    return record;
}

std::vector<AnalysisRecord> PersistenceCoordinator::query_all(const QueryOptions& options) const {
    QueryOptions visible = options;
    visible.include_unresolved = false;
    return with_tags(store_.query_all(visible));
}

std::vector<AnalysisRecord> PersistenceCoordinator::recent(size_t limit) const {
    QueryOptions options;
    options.order = SortOrder::newest_first;
    options.limit = limit;
    return query_all(options);
}

std::vector<AnalysisRecord> PersistenceCoordinator::pending() const {
    QueryOptions options;
    options.status = SendStatus::pending;
    return query_all(options);
}

std::vector<AnalysisRecord> PersistenceCoordinator::failed() const {
    QueryOptions options;
    options.status = SendStatus::error;
    return query_all(options);
}

std::vector<AnalysisRecord> PersistenceCoordinator::completed() const {
    QueryOptions options;
    options.completed_only = true;
    return query_all(options);
}

std::vector<AnalysisRecord> PersistenceCoordinator::with_tags(
    std::vector<AnalysisRecord> records) const {
    for (auto& r : records) {
        if (r.id) r.tags = store_.tags_for(*r.id);
    }
    return records;
}

// ---------------------------------------------------------------------------
// Tags
// ---------------------------------------------------------------------------

bool PersistenceCoordinator::add_tag(int64_t id, const std::string& name) {
    IdGuard guard = lock_id(id);
    const auto resolved = store_.is_path_resolved(id);
    if (!resolved || !*resolved) return false;
    return store_.add_tag(id, name);
}

bool PersistenceCoordinator::remove_tag(int64_t id, const std::string& name) {
    IdGuard guard = lock_id(id);
    return store_.remove_tag(id, name);
}

std::vector<Tag> PersistenceCoordinator::all_tags() const {
    return store_.all_tags();
}

bool PersistenceCoordinator::delete_tag(int64_t tag_id) {
    return store_.delete_tag(tag_id);
}

} // namespace va
