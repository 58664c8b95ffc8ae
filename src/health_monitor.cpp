#include "health_monitor.hpp"
#include "completion_types.hpp"
#include "logger.hpp"
#include "request_parameters.hpp"
#include "utils.hpp"

HealthSample probe_endpoint(HttpTransport& transport, const RunConfig& cfg) {
    auto body = RequestParameters::probe(cfg.model_name).to_json().dump();
    auto resp = transport.post_json(cfg.completions_url(), body, cfg.timings.health_timeout);

    HealthSample sample;
    sample.timestamp = epoch_seconds();
    switch (resp.state) {
        case TransportState::RESPONDED:
            sample.http_status = resp.http_status;
            if (resp.http_status == 200) {
                sample.state = HealthState::HEALTHY;
                sample.response = truncate(CompletionResults(resp.body).content, ResultLimits::HealthExcerptChars);
            } else {
                sample.state = HealthState::UNHEALTHY;
                sample.response = truncate(resp.body, ResultLimits::HealthExcerptChars);
            }
            break;
        case TransportState::TIMED_OUT:
            sample.state = HealthState::ERROR;
            sample.error = "Request timeout";
            break;
        case TransportState::FAILED:
        default:
            sample.state = HealthState::ERROR;
            sample.error = truncate(resp.error.empty() ? "Transport error" : resp.error, ResultLimits::HealthExcerptChars);
            break;
    }
    return sample;
}

HealthMonitor::HealthMonitor(
    std::shared_ptr<HttpTransport> transport,
    const RunConfig& cfg,
    ResultStore& store,
    RunControl& control
) : transport(std::move(transport)), cfg(cfg), store(store), control(control) {}

HealthSample HealthMonitor::preflight() {
    Logger.raw("Performing initial health check...");
    auto sample = probe_endpoint(*transport, cfg);
    endpoint_alive.store(sample.healthy(), std::memory_order_release);
    if (sample.healthy()) {
        Logger.raw("✓ Initial health check PASSED - endpoint is responsive");
    } else {
        Logger.raw("✗ Initial health check FAILED - endpoint may not be available");
        Logger.raw("Continuing anyway to gather data...");
    }
    return sample;
}

HealthSample HealthMonitor::check() {
    auto sample = probe_endpoint(*transport, cfg);
    store.add_health_sample(sample);

    bool was_alive = endpoint_alive.exchange(sample.healthy(), std::memory_order_acq_rel);
    bool is_alive = sample.healthy();

    Logger.raw(std::string("[HEALTH CHECK ") + (is_alive ? "✓" : "✗") + "] Endpoint is " +
               (is_alive ? "ALIVE" : "DOWN") +
               " (Elapsed: " + format_fixed(control.elapsed_seconds(), 0) + "s, Active requests: " +
               std::to_string(store.in_flight()) + ")");

    if (!is_alive) {
        Logger.warn("Endpoint health check failed! Continuing test to gather failure data...");
    }
    if (was_alive && !is_alive) {
        Logger.warn("Endpoint went DOWN");
    } else if (!was_alive && is_alive) {
        Logger.info("Endpoint recovered");
    }
    return sample;
}

void HealthMonitor::run() {
    auto first = control.start_time() + cfg.timings.health_startup_delay;
    for (long long k = 0; ; ++k) {
        auto slot = first + cfg.timings.health_interval * k;
        if (slot > control.deadline() || control.stopped()) {
            break;
        }
        if (std::chrono::steady_clock::now() < slot && !control.sleep_until(slot)) {
            break;
        }
        check();
    }
}
