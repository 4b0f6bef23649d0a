#include "InferenceDispatcher.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace va {

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

InferenceDispatcher::InferenceDispatcher(PersistenceCoordinator& coordinator,
                                         InferenceEngine& engine)
    : coordinator_(coordinator), engine_(engine) {}

InferenceDispatcher::~InferenceDispatcher() {
    stop();
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------

void InferenceDispatcher::start() {
    std::lock_guard<std::mutex> lock(mu_);
    if (running_) return;

    running_  = true;
    stopping_ = false;
    worker_   = std::thread(&InferenceDispatcher::worker_loop, this);
    Log::debug("Inference dispatcher started (" + engine_.name() + ")");
}

void InferenceDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) return;
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mu_);
    running_  = false;
    stopping_ = false;
}

bool InferenceDispatcher::is_running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return running_ && !stopping_;
}

// ---------------------------------------------------------------------------
// Queueing
// ---------------------------------------------------------------------------

bool InferenceDispatcher::submit(int64_t id) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_ || stopping_) return false;
        if (std::find(queue_.begin(), queue_.end(), id) != queue_.end()) return false;
        queue_.push_back(id);
    }
    cv_.notify_one();
    return true;
}

size_t InferenceDispatcher::recover_pending() {
    size_t count = 0;
    for (const auto& record : coordinator_.pending()) {
        if (record.id && submit(*record.id)) ++count;
    }
    if (count > 0) {
        Log::info("Queued " + std::to_string(count) + " pending analyses");
    }
    return count;
}

size_t InferenceDispatcher::queued() const {
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

void InferenceDispatcher::set_completion_callback(CompletionCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    completion_cb_ = std::move(cb);
}

// ---------------------------------------------------------------------------
// process
// ---------------------------------------------------------------------------

bool InferenceDispatcher::process(int64_t id) {
    const auto record = coordinator_.get_analysis_by_id(id);
    if (!record) {
        Log::warn("Skipping analysis " + std::to_string(id) + ": not found");
        return false;
    }
    if (record->send_status != SendStatus::pending) {
        Log::debug("Skipping analysis " + std::to_string(id) + ": status is " +
                   send_status_to_string(record->send_status));
        return false;
    }

    std::vector<PredictionResult> results;
    try {
        results = engine_.analyze(record->audio_path, nullptr);
    } catch (const std::exception& e) {
        fail(id, engine_.name() + " failed: " + e.what());
        return false;
    }

    if (results.empty()) {
        fail(id, engine_.name() + " produced no predictions");
        return false;
    }

    try {
        for (const auto& r : results) {
            coordinator_.apply_predictions(id, r.channel, r.probabilities, r.completed_at);
        }
    } catch (const ValidationError& e) {
        fail(id, e.what());
        return false;
    }

    coordinator_.mark_sent(id);
    Log::info("Analysis " + std::to_string(id) + " completed with " +
              std::to_string(results.size()) + " channel(s)");
    report(id, true, "");
    return true;
}

void InferenceDispatcher::fail(int64_t id, const std::string& message) {
    coordinator_.mark_error(id, message);
    report(id, false, message);
}

void InferenceDispatcher::report(int64_t id, bool success, const std::string& error) {
    CompletionCallback cb;
    {
        std::lock_guard<std::mutex> lock(mu_);
        cb = completion_cb_;
    }
    if (cb) cb(id, success, error);
}

// ---------------------------------------------------------------------------
// worker_loop  (runs on background thread)
// ---------------------------------------------------------------------------

void InferenceDispatcher::worker_loop() {
    while (true) {
        int64_t id = 0;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break;   // stopping and drained
            id = queue_.front();
            queue_.pop_front();
        }

        try {
            process(id);
        } catch (const Error& e) {
            // Store or vault trouble; the row keeps its status for a retry.
            Log::error("Inference for analysis " + std::to_string(id) +
                       " could not be recorded: " + e.what());
            report(id, false, e.what());
        }
    }
}

} // namespace va
