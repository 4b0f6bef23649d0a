#pragma once

#include "CaptureDevice.hpp"
#include "CountdownTimer.hpp"
#include "PersistenceCoordinator.hpp"
#include "Types.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace va {

enum class SessionState {
    idle,
    recording,
    paused,
    completed,
    discarded,
    saved
};

const char* session_state_to_string(SessionState s);

struct SessionConfig {
    std::chrono::seconds      max_duration{30};
    std::chrono::milliseconds tick_interval{1000};
    std::filesystem::path     temp_dir;

    /// When false no timer thread is started and time only advances
    /// through RecordingSession::tick().
    bool auto_tick = true;
};

/// One take from the microphone, time-boxed to `max_duration`:
///
///   idle --start--> recording <--pause/resume--> paused
///                       |                          |
///                  tick to max / stop            stop
///                       v                          |
///                   completed <--------------------+
///                    |     |
///              save  |     |  restart (new take)
///                    v     +--------> recording
///                  saved
///
///   cancel from idle, recording, paused or completed -> discarded
///   release_recording from completed -> discarded, file kept
///
/// Transitions return false and change nothing when they do not apply.
/// Capture failures are logged and kept in last_error(); the state stays
/// as it was.  save() is the exception: its errors propagate.  A take that
/// was never saved is deleted when the session is destroyed.
///
/// All transitions and ticks are serialised on one mutex.  The observer is
/// called after each of them, outside that mutex.
class RecordingSession {
public:
    using Observer = std::function<void(SessionState state,
                                        std::chrono::milliseconds remaining)>;

    /// `device` and `coordinator` must outlive the session.
    RecordingSession(CaptureDevice& device,
                     PersistenceCoordinator& coordinator,
                     SessionConfig config);
    ~RecordingSession();

    // Non-copyable.
    RecordingSession(const RecordingSession&) = delete;
    RecordingSession& operator=(const RecordingSession&) = delete;

    bool start();
    bool pause();
    bool resume();
    bool stop();

    /// Throw away the completed take and start a new one.
    bool restart();

    /// Abandon the take.  The temporary file is deleted, never submitted.
    bool cancel();

    /// Persist the completed take.  Throws ValidationError when there is
    /// no completed take, plus whatever create_analysis() throws; in that
    /// case the session stays completed, the take is kept, and save() may
    /// be retried.  If the failure left a row behind
    /// (UnresolvedAnalysisError), the retry reconciles that row instead of
    /// creating another; its original title is kept.
    AnalysisRecord save(const std::string& title,
                        const std::optional<std::string>& description = std::nullopt);

    /// Give up on a completed take without deleting its file.  Returns the
    /// temporary path, now owned by the caller, or "" when there is no
    /// completed take.  The session ends up discarded.
    std::string release_recording();

    /// Advance the clock by one tick interval.  Only applies while
    /// recording; returns whether it did.
    bool tick();

    SessionState              state() const;
    std::chrono::milliseconds elapsed() const;
    std::chrono::milliseconds remaining() const;

    /// Temporary file of the current take; empty before the first start.
    std::string recording_path() const;

    std::optional<std::string>    last_error() const;
    std::optional<AnalysisRecord> saved_record() const;

    void set_observer(Observer observer);

private:
    struct Snapshot {
        SessionState              state;
        std::chrono::milliseconds remaining;
    };

    void on_timer_tick(uint64_t generation);
    void advance_locked();

    bool begin_take_locked();
    void start_timer_locked();
    void stop_timer_locked();
    void discard_file_locked();
    void device_failed_locked(const std::string& action);
    std::optional<AnalysisRecord> finish_pending_locked();
    void drop_pending_locked();

    std::chrono::milliseconds remaining_locked() const;
    Snapshot snapshot_locked() const;
    void notify(const Snapshot& snap, const Observer& observer) const;

    static std::string generate_uuid();

    CaptureDevice&          device_;
    PersistenceCoordinator& coordinator_;
    SessionConfig           config_;
    CountdownTimer          timer_;

    mutable std::mutex            mu_;
    SessionState                  state_ = SessionState::idle;
    std::chrono::milliseconds     elapsed_{0};
    std::string                   current_path_;
    uint64_t                      timer_generation_ = 0;
    std::optional<std::string>    last_error_;
    std::optional<AnalysisRecord> saved_record_;
    std::optional<int64_t>        pending_id_;   // row left by a failed save
    Observer                      observer_;
};

} // namespace va
