#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include "utils.hpp"

using millis = std::chrono::milliseconds;

// Shared clock of a run: the start instant, the deadline every unit checks
// before starting new work, and the cooperative stop flag.
class RunControl {
public:
    explicit RunControl(millis duration);

    RunControl(const RunControl&) = delete;

    RunControl& operator=(const RunControl&) = delete;

    time_point start_time() const {
        return start;
    }

    time_point deadline() const {
        return end;
    }

    bool before_deadline() const;

    // True while new work may begin: not stopped and not past the deadline.
    bool running() const;

    // Sleeps for `duration`, cut short at the deadline or on stop(). Returns
    // false if the run was stopped.
    bool sleep_for(millis duration);

    // Same as sleep_for but towards an absolute instant.
    bool sleep_until(time_point when);

    void stop();

    bool stopped() const {
        return stop_requested.load(std::memory_order_acquire);
    }

    double elapsed_seconds() const;

private:
    time_point start;
    time_point end;
    std::atomic<bool> stop_requested = false;
    mutable std::mutex mu;
    std::condition_variable cv;
};
