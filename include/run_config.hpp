#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "yaml-cpp/yaml.h"

using json = nlohmann::json;
using millis = std::chrono::milliseconds;

// Pacing constants of a run. The defaults reproduce a realistic user; tests
// shrink them to keep runs short.
struct RunTimings {
    millis jitter_min{0};
    millis jitter_max{5'000};
    millis think_min{2'000};
    millis think_max{8'000};
    millis health_startup_delay{2'000};
    millis health_interval{30'000};
    millis health_timeout{30'000};
    millis backoff_unit{1'000};   // 5xx: unit * 2^attempt
    millis fixed_backoff{1'000};  // timeouts and transport errors
};

struct RunConfig {
    std::string endpoint = "http://localhost:8000";
    std::string api_key;
    std::string model_name = "llama-scout-17b";
    int concurrent_users = 60;
    double test_duration_seconds = 300;
    int max_context_tokens = 6'000;
    double request_timeout = 60;
    int max_retries = 2;
    bool verify_ssl = false;
    std::string output_dir = ".";
    std::optional<unsigned int> seed;
    RunTimings timings;

    // Throws ValidationError. Normalises the endpoint (no trailing slash).
    void validate();

    std::string completions_url() const;

    millis duration() const;

    millis request_timeout_ms() const;

    // Connection pool size shared by all users and the health monitor.
    long max_connections() const {
        return concurrent_users + 10;
    }

    // Persisted form. The credential is deliberately left out.
    json to_json() const;

    std::string display() const;
};

millis seconds_to_millis(double seconds);

// "quick", "standard" or "stress"; throws ValidationError otherwise.
void apply_preset(RunConfig& cfg, const std::string& name);

// Overlays every key present in `node` on top of `cfg`.
void apply_yaml(RunConfig& cfg, const YAML::Node& node);

RunConfig load_run_config(const std::string& path, RunConfig base = RunConfig());
