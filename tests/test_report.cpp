#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include "fakes.hpp"
#include "report.hpp"

using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

namespace {
    RequestOutcome outcome_of(OutcomeStatus status, const std::string& type, double time,
                              std::optional<std::string> error = std::nullopt, int retries = 0) {
        RequestOutcome o;
        o.user_id = 1;
        o.request_type = type;
        o.context_length = 1'000;
        o.status = status;
        o.response_time = time;
        o.tokens_sent = status == OutcomeStatus::SUCCESS ? 100 : 50;
        o.tokens_received = status == OutcomeStatus::SUCCESS ? 10 : 0;
        o.response_content = status == OutcomeStatus::SUCCESS ? "answer" : "";
        o.error = std::move(error);
        o.retry_count = retries;
        o.timestamp = 1'000.0;
        return o;
    }

    HealthSample health_of(HealthState state, double timestamp) {
        HealthSample h;
        h.state = state;
        h.timestamp = timestamp;
        if (state != HealthState::ERROR) {
            h.http_status = state == HealthState::HEALTHY ? 200 : 500;
            h.response = state == HealthState::HEALTHY ? "OK" : "down";
        } else {
            h.error = "Connection refused";
        }
        return h;
    }
}


TEST_CASE( "percentile picks the element at floor(n * p)" ) {
    std::vector<double> values = {1, 2, 3, 4, 5};
    REQUIRE(percentile(values, 0.95) == 5);
    REQUIRE(percentile(values, 0.99) == 5);
    REQUIRE(percentile(values, 0.5) == 3);
    REQUIRE(percentile(values, 0.0) == 1);
    REQUIRE(percentile({}, 0.95) == 0);

    std::vector<double> hundred;
    for (int i = 1; i <= 100; ++i) hundred.push_back(i);
    REQUIRE(percentile(hundred, 0.95) == 96);
    REQUIRE(percentile(hundred, 0.99) == 100);
}

TEST_CASE( "median of odd and even sequences" ) {
    REQUIRE(median({1, 2, 3}) == 2);
    REQUIRE(median({1, 2, 3, 4}) == 2.5);
    REQUIRE(median({}) == 0);
}

TEST_CASE( "report counts statuses, retries and latency" ) {
    std::vector<RequestOutcome> outcomes = {
        outcome_of(OutcomeStatus::SUCCESS, "MCP_file_search", 1.0),
        outcome_of(OutcomeStatus::SUCCESS, "MCP_file_search", 3.0, std::nullopt, 1),
        outcome_of(OutcomeStatus::SUCCESS, "Agentic_research_task", 2.0),
        outcome_of(OutcomeStatus::CLIENT_ERROR, "Agentic_research_task", 0.1, "HTTP 400: bad"),
        outcome_of(OutcomeStatus::TIMEOUT_EXHAUSTED, "MCP_code_review", 0.5, "Request timeout", 2),
    };
    auto report = compute_report(outcomes, {}, {}, 10.0, 0.0, true, false);

    REQUIRE(report.total == 5);
    REQUIRE(report.successful == 3);
    REQUIRE(report.failed == 2);
    REQUIRE(report.retried == 2);
    REQUIRE(report.count(OutcomeStatus::CLIENT_ERROR) == 1);
    REQUIRE(report.count(OutcomeStatus::TIMEOUT_EXHAUSTED) == 1);
    REQUIRE(report.count(OutcomeStatus::SERVER_ERROR_EXHAUSTED) == 0);

    REQUIRE(report.latency.has_value());
    REQUIRE(report.latency->min == 1.0);
    REQUIRE(report.latency->max == 3.0);
    REQUIRE_THAT(report.latency->mean, WithinAbs(2.0, 1e-9));
    REQUIRE(report.latency->median == 2.0);
    REQUIRE(report.latency->p95 == 3.0);

    REQUIRE(report.total_tokens_sent == 300);
    REQUIRE(report.total_tokens_received == 30);
    REQUIRE_THAT(report.avg_tokens_sent, WithinAbs(100.0, 1e-9));

    REQUIRE_THAT(report.requests_per_second, WithinAbs(0.5, 1e-9));
    REQUIRE_THAT(report.successful_per_second, WithinAbs(0.3, 1e-9));
}

TEST_CASE( "breakdown is grouped by type in ascending order" ) {
    std::vector<RequestOutcome> outcomes = {
        outcome_of(OutcomeStatus::SUCCESS, "MCP_file_search", 1.0),
        outcome_of(OutcomeStatus::SUCCESS, "Agentic_research_task", 2.0),
        outcome_of(OutcomeStatus::SERVER_ERROR_EXHAUSTED, "MCP_file_search", 9.0, "HTTP 500: x", 2),
        outcome_of(OutcomeStatus::SUCCESS, "MCP_file_search", 3.0),
    };
    auto report = compute_report(outcomes, {}, {}, 1.0, 0.0, true, false);

    REQUIRE(report.breakdown.size() == 2);
    REQUIRE(report.breakdown[0].request_type == "Agentic_research_task");
    REQUIRE(report.breakdown[1].request_type == "MCP_file_search");
    REQUIRE(report.breakdown[1].count == 3);
    REQUIRE(report.breakdown[1].successful == 2);
    REQUIRE_THAT(report.breakdown[1].avg_time, WithinAbs(2.0, 1e-9));
}

TEST_CASE( "top errors rank by count with ties in first-seen order" ) {
    std::vector<RequestOutcome> outcomes;
    outcomes.push_back(outcome_of(OutcomeStatus::CLIENT_ERROR, "t", 0, "HTTP 401: a"));
    outcomes.push_back(outcome_of(OutcomeStatus::TIMEOUT_EXHAUSTED, "t", 0, "Request timeout"));
    outcomes.push_back(outcome_of(OutcomeStatus::TRANSPORT_ERROR_EXHAUSTED, "t", 0, std::nullopt));
    outcomes.push_back(outcome_of(OutcomeStatus::TIMEOUT_EXHAUSTED, "t", 0, "Request timeout"));
    outcomes.push_back(outcome_of(OutcomeStatus::SERVER_ERROR_EXHAUSTED, "t", 0, "HTTP 500: " + std::string(300, 'z')));

    auto report = compute_report(outcomes, {}, {}, 1.0, 0.0, true, false);

    REQUIRE(report.top_errors.size() == 4);
    REQUIRE(report.top_errors[0].message == "Request timeout");
    REQUIRE(report.top_errors[0].count == 2);
    REQUIRE(report.top_errors[1].message == "HTTP 401: a");
    REQUIRE(report.top_errors[2].message == "Unknown");
    REQUIRE(report.top_errors[3].message.size() == 100);
}

TEST_CASE( "at most ten distinct errors are listed" ) {
    std::vector<RequestOutcome> outcomes;
    for (int i = 0; i < 15; ++i) {
        outcomes.push_back(outcome_of(OutcomeStatus::CLIENT_ERROR, "t", 0, "HTTP 4" + std::to_string(i)));
    }
    auto report = compute_report(outcomes, {}, {}, 1.0, 0.0, true, false);
    REQUIRE(report.top_errors.size() == 10);
    REQUIRE(report.top_errors[0].message == "HTTP 40");
}

TEST_CASE( "report is a pure function of its inputs" ) {
    std::vector<RequestOutcome> outcomes = {
        outcome_of(OutcomeStatus::SUCCESS, "MCP_file_search", 1.5),
        outcome_of(OutcomeStatus::CLIENT_ERROR, "MCP_file_search", 0.2, "HTTP 403: no"),
    };
    std::vector<HealthSample> health = {health_of(HealthState::HEALTHY, 5.0)};

    auto first = compute_report(outcomes, health, {}, 4.0, 0.0, true, false);
    auto second = compute_report(outcomes, health, {}, 4.0, 0.0, true, false);

    REQUIRE(first.display() == second.display());
    REQUIRE(first.summary_json() == second.summary_json());
}

TEST_CASE( "health summary and timeline" ) {
    std::vector<HealthSample> health = {
        health_of(HealthState::HEALTHY, 102.0),
        health_of(HealthState::UNHEALTHY, 132.0),
        health_of(HealthState::ERROR, 162.0),
    };
    auto report = compute_report({}, health, {}, 60.0, 100.0, false, false);

    REQUIRE(report.health_checks == 3);
    REQUIRE(report.healthy_checks == 1);
    REQUIRE(report.health_timeline.size() == 3);

    auto text = report.display();
    REQUIRE_THAT(text, ContainsSubstring("No requests completed!"));
    REQUIRE_THAT(text, ContainsSubstring("Total health checks: 3"));
    REQUIRE_THAT(text, ContainsSubstring("[     2s] ✓ HEALTHY - Response: OK"));
    REQUIRE_THAT(text, ContainsSubstring("[    32s] ✗ UNHEALTHY - down"));
    REQUIRE_THAT(text, ContainsSubstring("[    62s] ✗ UNHEALTHY - Connection refused"));

    auto summary = report.summary_json();
    REQUIRE(summary["endpoint_health"]["total_checks"] == 3);
    REQUIRE(summary["endpoint_health"]["healthy_checks"] == 1);
    REQUIRE(summary["endpoint_health"]["final_status"] == "unhealthy");
}

TEST_CASE( "timeline is dropped for long runs" ) {
    std::vector<HealthSample> health;
    for (int i = 0; i < 21; ++i) {
        health.push_back(health_of(HealthState::HEALTHY, i * 30.0));
    }
    auto report = compute_report({}, health, {}, 600.0, 0.0, true, false);
    REQUIRE(report.health_checks == 21);
    REQUIRE(report.health_timeline.empty());
}

TEST_CASE( "human report shows at most five samples" ) {
    std::vector<ResponseSample> samples;
    for (int i = 0; i < 8; ++i) {
        samples.push_back(ResponseSample{i, "MCP_file_search", 10.0 + i, std::string(400, 'r')});
    }
    std::vector<RequestOutcome> outcomes = {outcome_of(OutcomeStatus::SUCCESS, "MCP_file_search", 1.0)};
    auto report = compute_report(outcomes, {}, samples, 20.0, 0.0, true, false);

    REQUIRE(report.samples.size() == 5);
    auto text = report.display();
    REQUIRE_THAT(text, ContainsSubstring("Sample Responses (first 5 successful requests):"));
    REQUIRE_THAT(text, ContainsSubstring("Sample 5 [14s] - User 004 - MCP_file_search:"));
    REQUIRE_THAT(text, ContainsSubstring("    " + std::string(300, 'r') + "...\n"));
    REQUIRE_FALSE(text.find("Sample 6") != std::string::npos);
}

TEST_CASE( "summary carries every status count" ) {
    std::vector<RequestOutcome> outcomes = {
        outcome_of(OutcomeStatus::SUCCESS, "t", 1.0),
        outcome_of(OutcomeStatus::SERVER_ERROR_EXHAUSTED, "t", 1.0, "HTTP 500: x", 2),
        outcome_of(OutcomeStatus::TRANSPORT_ERROR_EXHAUSTED, "t", 1.0, "reset", 2),
    };
    auto summary = compute_report(outcomes, {}, {}, 3.0, 0.0, true, true).summary_json();

    REQUIRE(summary["total_requests"] == 3);
    REQUIRE(summary["successful"] == 1);
    REQUIRE(summary["client_errors"] == 0);
    REQUIRE(summary["server_errors_exhausted"] == 1);
    REQUIRE(summary["timeouts"] == 0);
    REQUIRE(summary["transport_errors_exhausted"] == 1);
    REQUIRE(summary["failed"] == 2);
    REQUIRE(summary["retried"] == 2);
    REQUIRE(summary["stopped_early"] == true);
}

TEST_CASE( "results document never contains the credential" ) {
    auto cfg = fast_config();
    cfg.api_key = "sk-very-secret";
    std::vector<RequestOutcome> outcomes = {
        outcome_of(OutcomeStatus::SUCCESS, "t", 1.0),
        outcome_of(OutcomeStatus::CLIENT_ERROR, "t", 1.0, "HTTP 401: denied"),
    };
    auto report = compute_report(outcomes, {}, {}, 3.0, 0.0, true, false);
    auto doc = results_document(cfg, report, health_of(HealthState::HEALTHY, 1.0), {}, {}, outcomes);

    REQUIRE(doc.dump().find("sk-very-secret") == std::string::npos);
    REQUIRE(doc["config"]["model"] == "test-model");
    REQUIRE(doc["config"]["verify_ssl"] == false);
    REQUIRE(doc["initial_health"]["status"] == "healthy");
    REQUIRE(doc["health_checks"].is_array());
    REQUIRE(doc["response_samples"].is_array());
    REQUIRE(doc["results"].size() == 2);
    REQUIRE(doc["results"][0]["response_content"] == "answer");
    REQUIRE(doc["results"][0]["error"].is_null());
    REQUIRE(doc["results"][1]["response_content"].is_null());
    REQUIRE(doc["results"][1]["status"] == "client_error");
}

TEST_CASE( "result files are never overwritten" ) {
    auto dir = make_temp_dir("llmload_report");
    auto first = unique_results_path(dir, "20250101_120000");
    REQUIRE(std::filesystem::path(first).filename().string() == "load_test_results_20250101_120000.json");

    std::ofstream(first) << "{}";
    auto second = unique_results_path(dir, "20250101_120000");
    REQUIRE(std::filesystem::path(second).filename().string() == "load_test_results_20250101_120000_1.json");

    std::ofstream(second) << "{}";
    auto third = unique_results_path(dir, "20250101_120000");
    REQUIRE(std::filesystem::path(third).filename().string() == "load_test_results_20250101_120000_2.json");
    std::filesystem::remove_all(dir);
}

TEST_CASE( "written results parse back as JSON" ) {
    auto dir = make_temp_dir("llmload_report");
    json doc = {{"summary", {{"total_requests", 0}}}};
    auto path = write_results_document(dir, doc);

    std::ifstream in(path);
    auto parsed = json::parse(in);
    REQUIRE(parsed["summary"]["total_requests"] == 0);
    std::filesystem::remove_all(dir);
}

TEST_CASE( "writing into a missing directory throws" ) {
    REQUIRE_THROWS_AS(write_results_document("/nonexistent/llmload/dir", json::object()), std::runtime_error);
}
