#include "result_store.hpp"
#include "utils.hpp"

void ResultStore::add_outcome(RequestOutcome outcome) {
    std::lock_guard<std::mutex> lock(mu);
    if (outcome.succeeded() && sample_log.size() < ResultLimits::MaxResponseSamples) {
        sample_log.push_back(ResponseSample{
            outcome.user_id,
            outcome.request_type,
            outcome.timestamp,
            truncate(outcome.response_content, ResultLimits::SampleExcerptChars)
        });
    }
    outcome_log.emplace_back(std::move(outcome));
    num_outcomes.fetch_add(1, std::memory_order_acq_rel);
}

void ResultStore::add_health_sample(HealthSample sample) {
    std::lock_guard<std::mutex> lock(mu);
    health_log.emplace_back(std::move(sample));
    num_health_samples.fetch_add(1, std::memory_order_acq_rel);
}

std::vector<RequestOutcome> ResultStore::outcomes() const {
    std::lock_guard<std::mutex> lock(mu);
    return outcome_log;
}

std::vector<HealthSample> ResultStore::health_samples() const {
    std::lock_guard<std::mutex> lock(mu);
    return health_log;
}

std::vector<ResponseSample> ResultStore::response_samples() const {
    std::lock_guard<std::mutex> lock(mu);
    return sample_log;
}
