#include "run_config.hpp"
#include <cmath>
#include "errors.hpp"
#include "request_parameters.hpp"
#include "utils.hpp"

namespace {
    struct Preset {
        const char* name;
        int concurrent_users;
        double test_duration_seconds;
        int max_context_tokens;
        double request_timeout;
        int max_retries;
    };

    constexpr Preset presets[] = {
        {"quick", 10, 60, 6'000, 30, 1},
        {"standard", 60, 300, 6'000, 60, 2},
        {"stress", 120, 600, 128'000, 120, 3},
    };

    template<typename T>
    void read_key(const YAML::Node& node, const char* key, T& out) {
        const auto& value = node[key];
        if (!value || value.IsNull()) {
            return;
        }
        try {
            out = value.as<T>();
        } catch (const YAML::Exception& e) {
            throw ValidationError(std::string("Invalid value for '") + key + "': " + e.what());
        }
    }

    void read_millis(const YAML::Node& node, const char* key, millis& out) {
        double seconds = -1;
        if (!node[key] || node[key].IsNull()) {
            return;
        }
        read_key(node, key, seconds);
        if (seconds < 0) {
            throw ValidationError(std::string("'") + key + "' must be a non-negative number of seconds");
        }
        out = seconds_to_millis(seconds);
    }

    void require(bool ok, const std::string& message) {
        if (!ok) {
            throw ValidationError(message);
        }
    }
}

millis seconds_to_millis(double seconds) {
    return millis(static_cast<long long>(std::llround(seconds * 1000.0)));
}

void RunConfig::validate() {
    rtrim(endpoint);
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    require(!endpoint.empty(), "endpoint is required");
    require(endpoint.starts_with("http://") || endpoint.starts_with("https://"),
            "endpoint must start with http:// or https://, got: " + endpoint);
    require(!model_name.empty(), "model_name is required");
    require(concurrent_users >= 1, "concurrent_users must be at least 1");
    require(std::isfinite(test_duration_seconds) && test_duration_seconds > 0,
            "test_duration_seconds must be positive");
    require(max_context_tokens >= 1, "max_context_tokens must be at least 1");
    require(std::isfinite(request_timeout) && request_timeout > 0, "request_timeout must be positive");
    require(request_timeout < test_duration_seconds,
            "request_timeout must be shorter than test_duration_seconds");
    require(max_retries >= 0, "max_retries cannot be negative");
    require(!output_dir.empty(), "output_dir cannot be empty");

    const auto& t = timings;
    require(t.jitter_min.count() >= 0 && t.jitter_min <= t.jitter_max, "timings: jitter range is invalid");
    require(t.think_min.count() >= 0 && t.think_min <= t.think_max, "timings: think time range is invalid");
    require(t.health_startup_delay.count() >= 0, "timings: health_startup_delay cannot be negative");
    require(t.health_interval.count() > 0, "timings: health_interval must be positive");
    require(t.health_timeout.count() > 0, "timings: health_timeout must be positive");
    require(t.backoff_unit.count() >= 0 && t.fixed_backoff.count() >= 0, "timings: backoff cannot be negative");
}

std::string RunConfig::completions_url() const {
    return endpoint + RequestConstants::CompletionsPath;
}

millis RunConfig::duration() const {
    return seconds_to_millis(test_duration_seconds);
}

millis RunConfig::request_timeout_ms() const {
    return seconds_to_millis(request_timeout);
}

json RunConfig::to_json() const {
    json j;
    j["endpoint"] = endpoint;
    j["model"] = model_name;
    j["concurrent_users"] = concurrent_users;
    j["test_duration"] = test_duration_seconds;
    j["max_context"] = max_context_tokens;
    j["request_timeout"] = request_timeout;
    j["max_retries"] = max_retries;
    j["verify_ssl"] = verify_ssl;
    return j;
}

std::string RunConfig::display() const {
    std::string str;
    str += "Endpoint: " + endpoint + "\n";
    str += "Model: " + model_name + "\n";
    str += "Concurrent Users: " + std::to_string(concurrent_users) + "\n";
    str += "Test Duration: " + format_fixed(test_duration_seconds, 0) + " seconds\n";
    str += "Max Context: " + std::to_string(max_context_tokens / 1000) + "K tokens\n";
    str += "Request Timeout: " + format_fixed(request_timeout, 0) + "s\n";
    str += "Max Retries: " + std::to_string(max_retries) + "\n";
    str += std::string("Verify SSL: ") + (verify_ssl ? "yes" : "no");
    return str;
}

void apply_preset(RunConfig& cfg, const std::string& name) {
    for (const auto& preset : presets) {
        if (name == preset.name) {
            cfg.concurrent_users = preset.concurrent_users;
            cfg.test_duration_seconds = preset.test_duration_seconds;
            cfg.max_context_tokens = preset.max_context_tokens;
            cfg.request_timeout = preset.request_timeout;
            cfg.max_retries = preset.max_retries;
            return;
        }
    }
    throw ValidationError("Unknown preset: " + name + " (expected quick, standard or stress)");
}

void apply_yaml(RunConfig& cfg, const YAML::Node& node) {
    if (!node.IsMap()) {
        throw ValidationError("Configuration must be a mapping of keys to values");
    }
    read_key(node, "endpoint", cfg.endpoint);
    read_key(node, "api_key", cfg.api_key);
    read_key(node, "model_name", cfg.model_name);
    read_key(node, "concurrent_users", cfg.concurrent_users);
    read_key(node, "test_duration_seconds", cfg.test_duration_seconds);
    read_key(node, "max_context_tokens", cfg.max_context_tokens);
    read_key(node, "request_timeout", cfg.request_timeout);
    read_key(node, "max_retries", cfg.max_retries);
    read_key(node, "verify_ssl", cfg.verify_ssl);
    read_key(node, "output_dir", cfg.output_dir);

    if (node["seed"] && !node["seed"].IsNull()) {
        unsigned int seed = 0;
        read_key(node, "seed", seed);
        cfg.seed = seed;
    }

    const auto& timings = node["timings"];
    if (timings) {
        if (!timings.IsMap()) {
            throw ValidationError("'timings' must be a mapping");
        }
        auto& t = cfg.timings;
        read_millis(timings, "jitter_min", t.jitter_min);
        read_millis(timings, "jitter_max", t.jitter_max);
        read_millis(timings, "think_min", t.think_min);
        read_millis(timings, "think_max", t.think_max);
        read_millis(timings, "health_startup_delay", t.health_startup_delay);
        read_millis(timings, "health_interval", t.health_interval);
        read_millis(timings, "health_timeout", t.health_timeout);
        read_millis(timings, "backoff_unit", t.backoff_unit);
        read_millis(timings, "fixed_backoff", t.fixed_backoff);
    }
}

RunConfig load_run_config(const std::string& path, RunConfig base) {
    YAML::Node node;
    try {
        node = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ValidationError("Could not load config " + path + ": " + e.what());
    }
    apply_yaml(base, node);
    return base;
}
