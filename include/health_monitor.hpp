#pragma once
#include <atomic>
#include <memory>
#include "result_store.hpp"
#include "run_config.hpp"
#include "run_control.hpp"
#include "transport.hpp"

// Sends the minimal deterministic probe and classifies the reply.
HealthSample probe_endpoint(HttpTransport& transport, const RunConfig& cfg);

// Probes the endpoint at start + delay + k * interval until the deadline and
// records every sample. Failures are reported, never acted on.
class HealthMonitor {
public:
    HealthMonitor(
        std::shared_ptr<HttpTransport> transport,
        const RunConfig& cfg,
        ResultStore& store,
        RunControl& control);

    void run();

    // One-off probe before the run starts. Sets the liveness flag but is not
    // stored with the monitor's samples.
    HealthSample preflight();

    HealthSample check();

    bool alive() const {
        return endpoint_alive.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<HttpTransport> transport;
    const RunConfig& cfg;
    ResultStore& store;
    RunControl& control;
    std::atomic<bool> endpoint_alive = true;
};
