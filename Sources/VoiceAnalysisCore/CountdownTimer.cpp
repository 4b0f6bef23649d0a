#include "CountdownTimer.hpp"

#include <utility>

namespace va {

CountdownTimer::~CountdownTimer() {
    stop();
    join();
}

// ---------------------------------------------------------------------------
// start / stop
// ---------------------------------------------------------------------------

uint64_t CountdownTimer::start(std::chrono::milliseconds interval, TickCallback on_tick) {
    std::lock_guard<std::mutex> lock(mu_);
    stop_locked();

    generation_ = ++last_generation_;
    current_.state  = std::make_shared<RunState>();
    current_.thread = std::thread(&CountdownTimer::run_loop, current_.state,
                                  interval, std::move(on_tick), generation_);
    return generation_;
}

void CountdownTimer::stop() {
    std::lock_guard<std::mutex> lock(mu_);
    stop_locked();
}

void CountdownTimer::stop_locked() {
    if (!current_.state) return;

    {
        std::lock_guard<std::mutex> run_lock(current_.state->mu);
        current_.state->stop = true;
    }
    current_.state->cv.notify_all();

    retired_.push_back(std::move(current_));
    current_ = Run{};
    generation_ = 0;
}

// ---------------------------------------------------------------------------
// join
// ---------------------------------------------------------------------------

void CountdownTimer::join() {
    std::vector<Run> runs;
    {
        std::lock_guard<std::mutex> lock(mu_);
        runs.swap(retired_);
    }

    const auto self = std::this_thread::get_id();
    for (auto& run : runs) {
        if (!run.thread.joinable()) continue;
        if (run.thread.get_id() == self) {
            run.thread.detach();
        } else {
            run.thread.join();
        }
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

uint64_t CountdownTimer::generation() const {
    std::lock_guard<std::mutex> lock(mu_);
    return generation_;
}

bool CountdownTimer::is_running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_.state != nullptr;
}

// ---------------------------------------------------------------------------
// run_loop  (runs on the timer thread)
// ---------------------------------------------------------------------------

void CountdownTimer::run_loop(std::shared_ptr<RunState> state,
                              std::chrono::milliseconds interval,
                              TickCallback on_tick,
                              uint64_t generation) {
    auto next = std::chrono::steady_clock::now() + interval;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(state->mu);
            if (state->cv.wait_until(lock, next, [&] { return state->stop; })) {
                return;
            }
        }

        if (on_tick) on_tick(generation);
        next += interval;
    }
}

} // namespace va
