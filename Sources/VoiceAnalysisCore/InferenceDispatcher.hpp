#pragma once

#include "InferenceEngine.hpp"
#include "PersistenceCoordinator.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace va {

/// Feeds pending analyses to an InferenceEngine on a background thread:
///
///   submit(id) --> queue --> worker: engine.analyze(audio)
///                                      |
///                       ok: apply_predictions() per channel, mark_sent()
///                     fail: mark_error(message)
///
/// recover_pending() re-queues analyses left pending by an earlier run.
class InferenceDispatcher {
public:
    /// Called on the worker thread after each analysis.
    using CompletionCallback =
        std::function<void(int64_t id, bool success, const std::string& error)>;

    InferenceDispatcher(PersistenceCoordinator& coordinator, InferenceEngine& engine);
    ~InferenceDispatcher();

    // Non-copyable.
    InferenceDispatcher(const InferenceDispatcher&) = delete;
    InferenceDispatcher& operator=(const InferenceDispatcher&) = delete;

    void start();

    /// Finish everything already queued, then join the worker.
    void stop();

    bool is_running() const;

    /// Queue one analysis.  Returns false if the dispatcher is not running
    /// or the id is already queued.
    bool submit(int64_t id);

    /// Queue every analysis whose status is pending.  Returns how many
    /// were queued.
    size_t recover_pending();

    /// Analyse `id` on the calling thread.  Returns true if predictions
    /// were stored and the analysis marked sent; false if it was skipped
    /// or marked as failed.
    bool process(int64_t id);

    size_t queued() const;

    void set_completion_callback(CompletionCallback cb);

private:
    void worker_loop();
    void report(int64_t id, bool success, const std::string& error);
    void fail(int64_t id, const std::string& message);

    PersistenceCoordinator& coordinator_;
    InferenceEngine&        engine_;

    std::thread              worker_;
    mutable std::mutex       mu_;
    std::condition_variable  cv_;
    std::deque<int64_t>      queue_;
    bool                     running_  = false;
    bool                     stopping_ = false;
    CompletionCallback       completion_cb_;
};

} // namespace va
