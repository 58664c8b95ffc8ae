#pragma once
#include <atomic>
#include <mutex>
#include <vector>
#include "result_types.hpp"

// Append-only collector shared by every simulated user and the health
// monitor. Counters are atomics so progress can be read mid-run without
// taking the lock; full snapshots are copies taken under it.
class ResultStore {
public:
    ResultStore() = default;

    ResultStore(const ResultStore&) = delete;

    ResultStore& operator=(const ResultStore&) = delete;

    void add_outcome(RequestOutcome outcome);

    void add_health_sample(HealthSample sample);

    std::size_t outcome_count() const {
        return num_outcomes.load(std::memory_order_acquire);
    }

    std::size_t health_sample_count() const {
        return num_health_samples.load(std::memory_order_acquire);
    }

    int in_flight() const {
        return active_requests.load(std::memory_order_acquire);
    }

    std::vector<RequestOutcome> outcomes() const;

    std::vector<HealthSample> health_samples() const;

    std::vector<ResponseSample> response_samples() const;

    // Gauge of logical requests currently inside RequestExecutor::execute.
    std::atomic<int> active_requests = 0;

private:
    mutable std::mutex mu;
    std::vector<RequestOutcome> outcome_log;
    std::vector<HealthSample> health_log;
    std::vector<ResponseSample> sample_log;
    std::atomic<std::size_t> num_outcomes = 0;
    std::atomic<std::size_t> num_health_samples = 0;
};
