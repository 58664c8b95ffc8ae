#pragma once
#include <functional>
#include <memory>
#include <string>
#include "result_store.hpp"
#include "result_types.hpp"
#include "run_config.hpp"
#include "transport.hpp"

using Sleeper = std::function<void(millis)>;

// Blocks the calling thread. Tests swap in a recorder.
void thread_sleep(millis duration);

// Runs one logical request to a terminal outcome: sends it, classifies the
// reply and retries 5xx, timeouts and transport failures with backoff. 4xx is
// never retried.
class RequestExecutor {
public:
    RequestExecutor(
        std::shared_ptr<HttpTransport> transport,
        RunConfig cfg,
        ResultStore& store,
        Sleeper sleeper = thread_sleep);

    RequestOutcome execute(
        int user_id,
        const std::string& prompt,
        const std::string& request_type,
        int target_tokens);

    // Delay before retry number `attempt + 1`.
    millis backoff_for(TransportState state, int attempt) const;

private:
    std::shared_ptr<HttpTransport> transport;
    RunConfig cfg;
    std::string url;
    ResultStore& store;
    Sleeper sleeper;
};

// Keeps ResultStore::active_requests accurate for the lifetime of a request.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<int>& gauge) : gauge(gauge) {
        gauge.fetch_add(1, std::memory_order_acq_rel);
    }

    ~InFlightGuard() {
        gauge.fetch_sub(1, std::memory_order_acq_rel);
    }

    InFlightGuard(const InFlightGuard&) = delete;

    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<int>& gauge;
};
