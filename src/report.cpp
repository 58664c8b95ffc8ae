#include "report.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <numeric>
#include <stdexcept>
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {
    const std::string rule(80, '=');

    std::string percent_of(int part, std::size_t whole) {
        double pct = whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole) * 100.0;
        return format_fixed(pct, 1) + "%";
    }

    std::string pad_left(const std::string& str, std::size_t width) {
        if (str.size() >= width) {
            return str;
        }
        return std::string(width - str.size(), ' ') + str;
    }

    double mean_of(const std::vector<double>& values) {
        if (values.empty()) {
            return 0;
        }
        return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    }

    std::string error_key(const RequestOutcome& outcome) {
        if (!outcome.error.has_value() || outcome.error->empty()) {
            return "Unknown";
        }
        return truncate(outcome.error.value(), ReportConstants::ErrorKeyChars);
    }
}

double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0;
    }
    auto idx = static_cast<std::size_t>(std::floor(static_cast<double>(sorted.size()) * p));
    return sorted[std::min(idx, sorted.size() - 1)];
}

double median(const std::vector<double>& sorted) {
    if (sorted.empty()) {
        return 0;
    }
    auto n = sorted.size();
    if (n % 2 == 1) {
        return sorted[n / 2];
    }
    return (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0;
}

AggregateReport compute_report(
    const std::vector<RequestOutcome>& outcomes,
    const std::vector<HealthSample>& health,
    const std::vector<ResponseSample>& samples,
    double test_duration,
    double start_epoch,
    bool final_alive,
    bool stopped_early
) {
    AggregateReport report;
    report.total = outcomes.size();
    report.test_duration = test_duration;
    report.start_epoch = start_epoch;
    report.final_alive = final_alive;
    report.stopped_early = stopped_early;

    std::vector<double> latencies;
    std::vector<double> sent;
    std::vector<double> received;
    std::map<std::string, std::vector<const RequestOutcome*>> by_type;
    std::vector<ErrorCount> errors;

    for (const auto& outcome : outcomes) {
        report.status_counts[static_cast<std::size_t>(outcome.status)]++;
        if (outcome.retry_count > 0) {
            report.retried++;
        }
        by_type[outcome.request_type].push_back(&outcome);

        if (outcome.succeeded()) {
            latencies.push_back(outcome.response_time);
            sent.push_back(outcome.tokens_sent);
            received.push_back(outcome.tokens_received);
            report.total_tokens_sent += outcome.tokens_sent;
            report.total_tokens_received += outcome.tokens_received;
            continue;
        }

        auto key = error_key(outcome);
        auto it = std::find_if(errors.begin(), errors.end(), [&key](const ErrorCount& e) {
            return e.message == key;
        });
        if (it == errors.end()) {
            errors.push_back(ErrorCount{key, 1});
        } else {
            it->count++;
        }
    }

    report.successful = report.count(OutcomeStatus::SUCCESS);
    report.failed = static_cast<int>(report.total) - report.successful;

    if (!latencies.empty()) {
        std::sort(latencies.begin(), latencies.end());
        LatencyStats stats;
        stats.min = latencies.front();
        stats.max = latencies.back();
        stats.mean = mean_of(latencies);
        stats.median = median(latencies);
        stats.p95 = percentile(latencies, 0.95);
        stats.p99 = percentile(latencies, 0.99);
        report.latency = stats;
        report.latency_samples = latencies.size();
        report.avg_tokens_sent = mean_of(sent);
        report.avg_tokens_received = mean_of(received);
    }

    for (const auto& [request_type, group] : by_type) {
        TypeBreakdown row;
        row.request_type = request_type;
        row.count = static_cast<int>(group.size());
        std::vector<double> times;
        for (const auto* outcome : group) {
            if (outcome->succeeded()) {
                times.push_back(outcome->response_time);
            }
        }
        row.successful = static_cast<int>(times.size());
        row.avg_time = mean_of(times);
        report.breakdown.push_back(row);
    }

    // Stable so equal counts keep first-seen order
    std::stable_sort(errors.begin(), errors.end(), [](const ErrorCount& a, const ErrorCount& b) {
        return a.count > b.count;
    });
    if (errors.size() > ReportConstants::TopErrors) {
        errors.resize(ReportConstants::TopErrors);
    }
    report.top_errors = std::move(errors);

    if (test_duration > 0) {
        report.requests_per_second = static_cast<double>(report.total) / test_duration;
        report.successful_per_second = static_cast<double>(report.successful) / test_duration;
    }

    report.health_checks = health.size();
    report.healthy_checks = static_cast<std::size_t>(std::count_if(health.begin(), health.end(), [](const HealthSample& h) {
        return h.healthy();
    }));
    if (!health.empty() && health.size() <= ReportConstants::MaxTimelineChecks) {
        report.health_timeline = health;
    }

    auto shown = std::min(samples.size(), ReportConstants::DisplayedSamples);
    report.samples.assign(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(shown));
    return report;
}

std::string AggregateReport::display() const {
    std::string str = "\n" + rule + "\nLoad Test Results\n" + rule + "\n\n";
    if (stopped_early) {
        str += "Run was stopped before the configured duration.\n\n";
    }
    if (total == 0) {
        str += "No requests completed!\n";
    } else {
        str += "Total Requests: " + std::to_string(total) + "\n";
        str += "Successful: " + std::to_string(successful) + " (" + percent_of(successful, total) + ")\n";
        for (auto status : AllOutcomeStatuses) {
            if (status == OutcomeStatus::SUCCESS) {
                continue;
            }
            int n = count(status);
            str += std::string(outcome_status_as_str(status)) + ": " + std::to_string(n) +
                   " (" + percent_of(n, total) + ")\n";
        }
        if (retried > 0) {
            str += "Retried requests: " + std::to_string(retried) + " (" + percent_of(retried, total) + ")\n";
        }

        if (latency.has_value()) {
            const auto& l = latency.value();
            str += "\nResponse Time Statistics:\n";
            str += "  Min: " + format_fixed(l.min, 2) + "s\n";
            str += "  Max: " + format_fixed(l.max, 2) + "s\n";
            str += "  Mean: " + format_fixed(l.mean, 2) + "s\n";
            str += "  Median: " + format_fixed(l.median, 2) + "s\n";
            if (latency_samples > 1) {
                str += "  P95: " + format_fixed(l.p95, 2) + "s\n";
                str += "  P99: " + format_fixed(l.p99, 2) + "s\n";
            }

            str += "\nToken Statistics:\n";
            str += "  Avg Context Length: " + format_fixed(avg_tokens_sent, 0) + " tokens\n";
            if (total_tokens_received > 0) {
                str += "  Avg Response Length: " + format_fixed(avg_tokens_received, 0) + " tokens\n";
            }
            str += "  Total Tokens Sent: " + with_thousands(total_tokens_sent) + "\n";
            str += "  Total Tokens Received: " + with_thousands(total_tokens_received) + "\n";
        }

        str += "\nBreakdown by Request Type:\n";
        for (const auto& row : breakdown) {
            str += "  " + row.request_type + ": " + std::to_string(row.count) + " requests, " +
                   std::to_string(row.successful) + " successful, avg time: " + format_fixed(row.avg_time, 2) + "s\n";
        }

        if (!top_errors.empty()) {
            str += "\nError Details:\n";
            for (const auto& e : top_errors) {
                str += "  [" + std::to_string(e.count) + "x] " + e.message + "\n";
            }
        }

        str += "\nThroughput:\n";
        str += "  Requests/second: " + format_fixed(requests_per_second, 2) + "\n";
        str += "  Successful requests/second: " + format_fixed(successful_per_second, 2) + "\n";
    }

    str += "\nEndpoint Health Monitoring:\n";
    str += "  Total health checks: " + std::to_string(health_checks) + "\n";
    str += "  Healthy: " + std::to_string(healthy_checks) + "\n";
    str += "  Unhealthy: " + std::to_string(health_checks - healthy_checks) + "\n";
    str += std::string("  Final status: ") + (final_alive ? "healthy" : "unhealthy") + "\n";

    if (!health_timeline.empty()) {
        str += "\n  Health Check Timeline:\n";
        for (const auto& check : health_timeline) {
            auto elapsed = pad_left(format_fixed(check.timestamp - start_epoch, 0), 6);
            if (check.healthy()) {
                str += "    [" + elapsed + "s] ✓ HEALTHY - Response: " + truncate(check.response, 50) + "\n";
            } else {
                std::string detail = check.error.value_or(check.response);
                if (detail.empty()) {
                    detail = "Unknown error";
                }
                str += "    [" + elapsed + "s] ✗ UNHEALTHY - " + truncate(detail, 100) + "\n";
            }
        }
    }

    if (!samples.empty()) {
        str += "\nSample Responses (first " + std::to_string(samples.size()) + " successful requests):\n";
        int i = 1;
        for (const auto& sample : samples) {
            str += "\n  Sample " + std::to_string(i++) + " [" + format_fixed(sample.timestamp - start_epoch, 0) +
                   "s] - User " + zero_pad(sample.user_id, 3) + " - " + sample.request_type + ":\n";
            str += "    " + truncate(sample.response, ReportConstants::DisplayedSampleChars) + "...\n";
        }
    }

    str += "\n" + rule + "\n";
    return str;
}

json AggregateReport::summary_json() const {
    json j;
    j["total_requests"] = total;
    j["successful"] = successful;
    j["client_errors"] = count(OutcomeStatus::CLIENT_ERROR);
    j["server_errors_exhausted"] = count(OutcomeStatus::SERVER_ERROR_EXHAUSTED);
    j["timeouts"] = count(OutcomeStatus::TIMEOUT_EXHAUSTED);
    j["transport_errors_exhausted"] = count(OutcomeStatus::TRANSPORT_ERROR_EXHAUSTED);
    j["failed"] = failed;
    j["retried"] = retried;
    j["test_duration"] = test_duration;
    j["stopped_early"] = stopped_early;
    j["endpoint_health"] = {
        {"total_checks", health_checks},
        {"healthy_checks", healthy_checks},
        {"final_status", final_alive ? "healthy" : "unhealthy"}
    };
    return j;
}

json results_document(
    const RunConfig& cfg,
    const AggregateReport& report,
    const std::optional<HealthSample>& initial_health,
    const std::vector<HealthSample>& health,
    const std::vector<ResponseSample>& samples,
    const std::vector<RequestOutcome>& outcomes
) {
    json doc;
    doc["config"] = cfg.to_json();
    doc["summary"] = report.summary_json();
    doc["initial_health"] = initial_health.has_value() ? initial_health->to_json() : json(nullptr);

    doc["health_checks"] = json::array();
    for (const auto& sample : health) {
        doc["health_checks"].push_back(sample.to_json());
    }
    doc["response_samples"] = json::array();
    for (const auto& sample : samples) {
        doc["response_samples"].push_back(sample.to_json());
    }
    doc["results"] = json::array();
    for (const auto& outcome : outcomes) {
        doc["results"].push_back(outcome.to_json());
    }
    return doc;
}

std::string unique_results_path(const std::string& dir, const std::string& timestamp) {
    auto base = "load_test_results_" + timestamp;
    auto path = fs::path(dir) / (base + ".json");
    for (int n = 1; fs::exists(path); ++n) {
        path = fs::path(dir) / (base + "_" + std::to_string(n) + ".json");
    }
    return path.string();
}

std::string write_results_document(const std::string& dir, const json& document) {
    auto path = unique_results_path(dir, timestamp_for_filename());
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Could not open " + path + " for writing");
    }
    out << document.dump(2) << '\n';
    out.close();
    if (!out) {
        throw std::runtime_error("Failed writing results to " + path);
    }
    return path;
}
