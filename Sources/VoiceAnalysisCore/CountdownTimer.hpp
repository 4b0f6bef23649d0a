#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace va {

/// Periodic timer running on its own thread.
///
/// Each start() begins a new run identified by a generation number; the
/// callback receives that number so the owner can ignore ticks from a run
/// it has already abandoned.  stop() never blocks, which makes it safe to
/// call with the owner's lock held or from inside the callback.  join()
/// waits for stopped runs to exit and must be called without that lock.
class CountdownTimer {
public:
    using TickCallback = std::function<void(uint64_t generation)>;

    CountdownTimer() = default;
    ~CountdownTimer();

    // Non-copyable.
    CountdownTimer(const CountdownTimer&) = delete;
    CountdownTimer& operator=(const CountdownTimer&) = delete;

    /// Stop the current run (if any) and start a new one.
    /// Returns the generation of the new run.
    uint64_t start(std::chrono::milliseconds interval, TickCallback on_tick);

    /// Ask the current run to exit.  Does not wait.
    void stop();

    /// Wait for every stopped run.  A run joined from its own thread is
    /// detached instead; it exits as soon as its callback returns.
    void join();

    /// Generation of the current run, 0 if none.
    uint64_t generation() const;
    bool is_running() const;

private:
    struct RunState {
        std::mutex              mu;
        std::condition_variable cv;
        bool                    stop = false;
    };

    struct Run {
        std::thread               thread;
        std::shared_ptr<RunState> state;
    };

    static void run_loop(std::shared_ptr<RunState> state,
                         std::chrono::milliseconds interval,
                         TickCallback on_tick,
                         uint64_t generation);

    void stop_locked();

    mutable std::mutex mu_;
    Run                current_;
    std::vector<Run>   retired_;
    uint64_t           last_generation_ = 0;
    uint64_t           generation_ = 0;
};

} // namespace va
