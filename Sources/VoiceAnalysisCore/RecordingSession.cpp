#include "RecordingSession.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <random>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace va {

const char* session_state_to_string(SessionState s) {
    switch (s) {
        case SessionState::idle:      return "idle";
        case SessionState::recording: return "recording";
        case SessionState::paused:    return "paused";
        case SessionState::completed: return "completed";
        case SessionState::discarded: return "discarded";
        case SessionState::saved:     return "saved";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

RecordingSession::RecordingSession(CaptureDevice& device,
                                   PersistenceCoordinator& coordinator,
                                   SessionConfig config)
    : device_(device), coordinator_(coordinator), config_(std::move(config)) {
    if (config_.max_duration.count() <= 0) {
        throw ValidationError("Maximum recording duration must be positive");
    }
    if (config_.tick_interval.count() <= 0) {
        throw ValidationError("Tick interval must be positive");
    }
    if (config_.temp_dir.empty()) {
        std::error_code ec;
        const fs::path tmp = fs::temp_directory_path(ec);
        if (!ec) config_.temp_dir = tmp / "voice-analysis";
    }
}

RecordingSession::~RecordingSession() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ == SessionState::recording || state_ == SessionState::paused) {
            if (!device_.stop()) {
                Log::warn("Capture did not stop cleanly: " + device_.last_error());
            }
        }
        stop_timer_locked();
        // Unsaved takes do not outlive their session.
        if (state_ != SessionState::saved) discard_file_locked();
    }
    timer_.join();
}

// ---------------------------------------------------------------------------
// start / pause / resume / stop
// ---------------------------------------------------------------------------

bool RecordingSession::start() {
    Snapshot snap{};
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::idle) return false;
        if (!begin_take_locked()) return false;
        snap = snapshot_locked();
        observer = observer_;
    }
    notify(snap, observer);
    return true;
}

bool RecordingSession::pause() {
    Snapshot snap{};
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::recording) return false;
        if (!device_.pause()) {
            device_failed_locked("pause");
            return false;
        }
        state_ = SessionState::paused;
        stop_timer_locked();
        snap = snapshot_locked();
        observer = observer_;
    }
    timer_.join();
    notify(snap, observer);
    return true;
}

bool RecordingSession::resume() {
    Snapshot snap{};
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::paused) return false;
        if (!device_.resume()) {
            device_failed_locked("resume");
            return false;
        }
        state_ = SessionState::recording;
        start_timer_locked();
        snap = snapshot_locked();
        observer = observer_;
    }
    notify(snap, observer);
    return true;
}

bool RecordingSession::stop() {
    Snapshot snap{};
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::recording && state_ != SessionState::paused) {
            return false;
        }
        if (!device_.stop()) {
            device_failed_locked("stop");
            return false;
        }
        state_ = SessionState::completed;
        stop_timer_locked();
        Log::info("Recording stopped after " + std::to_string(elapsed_.count()) + " ms");
        snap = snapshot_locked();
        observer = observer_;
    }
    timer_.join();
    notify(snap, observer);
    return true;
}

// ---------------------------------------------------------------------------
// restart / cancel
// ---------------------------------------------------------------------------

bool RecordingSession::restart() {
    Snapshot snap{};
    Observer observer;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::completed) return false;

        drop_pending_locked();
        discard_file_locked();
        state_   = SessionState::idle;
        elapsed_ = std::chrono::milliseconds{0};

        started  = begin_take_locked();
        snap     = snapshot_locked();
        observer = observer_;
    }
    notify(snap, observer);
    return started;
}

bool RecordingSession::cancel() {
    Snapshot snap{};
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ == SessionState::discarded || state_ == SessionState::saved) {
            return false;
        }
        if (state_ == SessionState::recording || state_ == SessionState::paused) {
            // Cancel always goes through; a failed stop is only reported.
            if (!device_.stop()) device_failed_locked("stop");
        }
        stop_timer_locked();
        drop_pending_locked();
        discard_file_locked();
        state_ = SessionState::discarded;
        Log::info("Recording discarded");
        snap = snapshot_locked();
        observer = observer_;
    }
    timer_.join();
    notify(snap, observer);
    return true;
}

// ---------------------------------------------------------------------------
// save
// ---------------------------------------------------------------------------

AnalysisRecord RecordingSession::save(const std::string& title,
                                      const std::optional<std::string>& description) {
    Snapshot snap{};
    Observer observer;
    AnalysisRecord record;
    {
        // Held for the whole save: a concurrent cancel waits and then
        // finds the take already saved.
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::completed) {
            throw ValidationError(std::string("No completed recording to save (session is ") +
                                  session_state_to_string(state_) + ")");
        }

        std::optional<AnalysisRecord> finished;
        if (pending_id_) finished = finish_pending_locked();

        if (finished) {
            record = *finished;
        } else {
            try {
                record = coordinator_.create_analysis(title, description, current_path_);
            } catch (const UnresolvedAnalysisError& e) {
                // A row exists for this take now; a retry must finish it
                // rather than create a second one.
                pending_id_ = e.id();
                Log::warn("Save left analysis " + std::to_string(e.id()) +
                          " unresolved; retry will reconcile it");
                throw;
            }
        }

        state_        = SessionState::saved;
        saved_record_ = record;
        pending_id_.reset();

        // The vault holds its own copy now.
        std::error_code ec;
        fs::remove(current_path_, ec);
        if (ec) {
            Log::warn("Could not remove temporary recording " + current_path_ +
                      ": " + ec.message());
        }

        snap = snapshot_locked();
        observer = observer_;
    }
    notify(snap, observer);
    return record;
}

std::string RecordingSession::release_recording() {
    Snapshot snap{};
    Observer observer;
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::completed) return "";
        // An unresolved row from a failed save is dropped; the caller
        // owns the audio from here on.
        drop_pending_locked();
        path = current_path_;
        current_path_.clear();
        state_ = SessionState::discarded;
        Log::info("Recording released to " + path);
        snap = snapshot_locked();
        observer = observer_;
    }
    notify(snap, observer);
    return path;
}

// ---------------------------------------------------------------------------
// Ticks
// ---------------------------------------------------------------------------

bool RecordingSession::tick() {
    Snapshot snap{};
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != SessionState::recording) return false;
        advance_locked();
        snap = snapshot_locked();
        observer = observer_;
    }
    timer_.join();
    notify(snap, observer);
    return true;
}

void RecordingSession::on_timer_tick(uint64_t generation) {
    Snapshot snap{};
    Observer observer;
    {
        std::lock_guard<std::mutex> lock(mu_);
        // A tick from a run that was cancelled after it fired.
        if (generation != timer_generation_ || state_ != SessionState::recording) {
            return;
        }
        advance_locked();
        snap = snapshot_locked();
        observer = observer_;
    }
    notify(snap, observer);
}

void RecordingSession::advance_locked() {
    elapsed_ += config_.tick_interval;
    if (elapsed_ < config_.max_duration) return;

    elapsed_ = config_.max_duration;
    // The time box is absolute: the take completes even if the device
    // reports a problem while finalizing.
    if (!device_.stop()) device_failed_locked("stop");
    state_ = SessionState::completed;
    stop_timer_locked();
    Log::info("Recording reached its " + std::to_string(config_.max_duration.count()) +
              " s limit");
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

SessionState RecordingSession::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

std::chrono::milliseconds RecordingSession::elapsed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return elapsed_;
}

std::chrono::milliseconds RecordingSession::remaining() const {
    std::lock_guard<std::mutex> lock(mu_);
    return remaining_locked();
}

std::string RecordingSession::recording_path() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_path_;
}

std::optional<std::string> RecordingSession::last_error() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_error_;
}

std::optional<AnalysisRecord> RecordingSession::saved_record() const {
    std::lock_guard<std::mutex> lock(mu_);
    return saved_record_;
}

void RecordingSession::set_observer(Observer observer) {
    std::lock_guard<std::mutex> lock(mu_);
    observer_ = std::move(observer);
}

// ---------------------------------------------------------------------------
// Helpers (mu_ held)
// ---------------------------------------------------------------------------

bool RecordingSession::begin_take_locked() {
    if (config_.temp_dir.empty()) {
        last_error_ = "No temporary directory configured";
        Log::error(*last_error_);
        return false;
    }

    std::error_code ec;
    fs::create_directories(config_.temp_dir, ec);
    if (ec) {
        last_error_ = "Cannot create " + config_.temp_dir.string() + ": " + ec.message();
        Log::error(*last_error_);
        return false;
    }

    const std::string path =
        (config_.temp_dir / ("recording_" + generate_uuid() + ".m4a")).string();
    if (!device_.start(path)) {
        device_failed_locked("start");
        return false;
    }

    current_path_ = path;
    elapsed_      = std::chrono::milliseconds{0};
    state_        = SessionState::recording;
    last_error_.reset();
    start_timer_locked();

    Log::info("Recording to " + path);
    return true;
}

void RecordingSession::start_timer_locked() {
    if (!config_.auto_tick) return;
    timer_generation_ = timer_.start(config_.tick_interval,
                                     [this](uint64_t generation) {
                                         on_timer_tick(generation);
                                     });
}

void RecordingSession::stop_timer_locked() {
    timer_generation_ = 0;
    timer_.stop();
}

void RecordingSession::discard_file_locked() {
    if (current_path_.empty()) return;

    std::error_code ec;
    fs::remove(current_path_, ec);
    if (ec) {
        Log::warn("Could not remove discarded recording " + current_path_ +
                  ": " + ec.message());
    }
    current_path_.clear();
}

std::optional<AnalysisRecord> RecordingSession::finish_pending_locked() {
    const int64_t id = *pending_id_;
    coordinator_.reconcile(id);

    auto record = coordinator_.get_analysis_by_id(id);
    if (record) {
        Log::info("Save finished analysis " + std::to_string(id) + " by reconciling it");
        return record;
    }
    // The row is gone; the take is saved from scratch.
    pending_id_.reset();
    return std::nullopt;
}

void RecordingSession::drop_pending_locked() {
    if (!pending_id_) return;
    const int64_t id = *pending_id_;
    pending_id_.reset();
    try {
        coordinator_.delete_analysis(id);
    } catch (const Error& e) {
        Log::error("Could not drop unresolved analysis " + std::to_string(id) + ": " +
                   e.what());
    }
}

void RecordingSession::device_failed_locked(const std::string& action) {
    last_error_ = "Could not " + action + " capture: " + device_.last_error();
    Log::error(*last_error_);
}

std::chrono::milliseconds RecordingSession::remaining_locked() const {
    const std::chrono::milliseconds max = config_.max_duration;
    auto left = max - elapsed_;
    if (left < std::chrono::milliseconds{0}) left = std::chrono::milliseconds{0};
    if (left > max) left = max;
    return left;
}

RecordingSession::Snapshot RecordingSession::snapshot_locked() const {
    return Snapshot{state_, remaining_locked()};
}

void RecordingSession::notify(const Snapshot& snap, const Observer& observer) const {
    if (observer) observer(snap.state, snap.remaining);
}

// ---------------------------------------------------------------------------
// generate_uuid
// ---------------------------------------------------------------------------

std::string RecordingSession::generate_uuid() {
    // UUID v4 from <random>; only needs to be unique within temp_dir.
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<uint32_t> dist(0, 15);

    const char* hex = "0123456789abcdef";
    constexpr int kGroups[] = {8, 4, 4, 4, 12};

    std::string uuid;
    uuid.reserve(36);
    for (size_t g = 0; g < 5; ++g) {
        if (g > 0) uuid += '-';
        for (int i = 0; i < kGroups[g]; ++i) {
            uuid += hex[dist(rng)];
        }
    }

    uuid[14] = '4';
    uuid[19] = hex[(dist(rng) & 0x3) | 0x8];
    return uuid;
}

} // namespace va
