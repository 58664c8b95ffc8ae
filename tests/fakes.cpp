#include "fakes.hpp"
#include <atomic>
#include <filesystem>
#include <thread>
#include <unistd.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

ScriptedTransport::ScriptedTransport(std::vector<ScriptStep> script, ScriptStep fallback)
    : script(script.begin(), script.end()), fallback(std::move(fallback)) {}

TransportResponse ScriptedTransport::post_json(
    const std::string& url,
    const std::string& body,
    std::chrono::milliseconds timeout
) {
    ScriptStep step;
    {
        std::lock_guard<std::mutex> lock(mu);
        seen_urls.push_back(url);
        seen_bodies.push_back(body);
        seen_timeouts.push_back(timeout);
        if (script.empty()) {
            step = fallback;
        } else {
            step = script.front();
            script.pop_front();
        }
    }
    if (on_call) {
        on_call();
    }
    if (step.delay.count() > 0) {
        std::this_thread::sleep_for(step.delay);
    }
    return step.response;
}

std::size_t ScriptedTransport::calls() const {
    std::lock_guard<std::mutex> lock(mu);
    return seen_bodies.size();
}

std::vector<std::string> ScriptedTransport::bodies() const {
    std::lock_guard<std::mutex> lock(mu);
    return seen_bodies;
}

std::vector<std::string> ScriptedTransport::urls() const {
    std::lock_guard<std::mutex> lock(mu);
    return seen_urls;
}

std::vector<millis> ScriptedTransport::timeouts() const {
    std::lock_guard<std::mutex> lock(mu);
    return seen_timeouts;
}

TransportResponse ok_response(const std::string& content, int completion_tokens) {
    json choice;
    choice["index"] = 0;
    choice["message"] = {{"role", "assistant"}, {"content", content}};
    json j;
    j["choices"] = json::array();
    j["choices"].push_back(choice);
    j["usage"]["completion_tokens"] = completion_tokens;
    return status_response(200, j.dump());
}

TransportResponse status_response(long code, const std::string& body) {
    TransportResponse resp;
    resp.state = TransportState::RESPONDED;
    resp.http_status = code;
    resp.body = body;
    return resp;
}

TransportResponse timeout_response() {
    TransportResponse resp;
    resp.state = TransportState::TIMED_OUT;
    resp.error = "Request timeout";
    return resp;
}

TransportResponse failed_response(const std::string& error) {
    TransportResponse resp;
    resp.state = TransportState::FAILED;
    resp.error = error;
    return resp;
}

Sleeper SleepRecorder::sleeper() {
    return [this](millis delay) {
        std::lock_guard<std::mutex> lock(mu);
        recorded.push_back(delay);
    };
}

std::vector<millis> SleepRecorder::delays() const {
    std::lock_guard<std::mutex> lock(mu);
    return recorded;
}

RunConfig fast_config() {
    RunConfig cfg;
    cfg.endpoint = "http://127.0.0.1:9";
    cfg.model_name = "test-model";
    cfg.concurrent_users = 2;
    cfg.test_duration_seconds = 1.2;
    cfg.max_context_tokens = 400;
    cfg.request_timeout = 0.5;
    cfg.max_retries = 2;
    cfg.seed = 7;
    cfg.timings.jitter_min = millis(0);
    cfg.timings.jitter_max = millis(20);
    cfg.timings.think_min = millis(50);
    cfg.timings.think_max = millis(50);
    cfg.timings.health_startup_delay = millis(100);
    cfg.timings.health_interval = millis(250);
    cfg.timings.health_timeout = millis(200);
    cfg.timings.backoff_unit = millis(10);
    cfg.timings.fixed_backoff = millis(10);
    return cfg;
}

std::string make_temp_dir(const std::string& prefix) {
    static std::atomic<int> counter = 0;
    auto dir = std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir.string();
}
