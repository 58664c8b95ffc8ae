#include "run_control.hpp"

RunControl::RunControl(millis duration)
    : start(std::chrono::steady_clock::now()), end(start + duration) {}

bool RunControl::before_deadline() const {
    return std::chrono::steady_clock::now() < end;
}

bool RunControl::running() const {
    return !stopped() && before_deadline();
}

bool RunControl::sleep_for(millis duration) {
    return sleep_until(std::chrono::steady_clock::now() + duration);
}

bool RunControl::sleep_until(time_point when) {
    if (when > end) {
        when = end;
    }
    std::unique_lock<std::mutex> lock(mu);
    cv.wait_until(lock, when, [this] {
        return stop_requested.load(std::memory_order_acquire);
    });
    return !stopped();
}

void RunControl::stop() {
    {
        std::lock_guard<std::mutex> lock(mu);
        stop_requested.store(true, std::memory_order_release);
    }
    cv.notify_all();
}

double RunControl::elapsed_seconds() const {
    return seconds_between(start, std::chrono::steady_clock::now());
}
