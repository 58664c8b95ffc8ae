#pragma once
#include <array>
#include <iterator>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "result_types.hpp"
#include "run_config.hpp"

using json = nlohmann::json;

namespace ReportConstants {
    static constexpr std::size_t ErrorKeyChars = 100;
    static constexpr std::size_t TopErrors = 10;
    static constexpr std::size_t MaxTimelineChecks = 20;
    static constexpr std::size_t DisplayedSamples = 5;
    static constexpr std::size_t DisplayedSampleChars = 300;
}

struct LatencyStats {
    double min = 0;
    double max = 0;
    double mean = 0;
    double median = 0;
    double p95 = 0;
    double p99 = 0;
};

struct TypeBreakdown {
    std::string request_type;
    int count = 0;
    int successful = 0;
    double avg_time = 0;  // over the successful subset, 0 if there is none
};

struct ErrorCount {
    std::string message;
    int count = 0;
};

struct AggregateReport {
    std::size_t total = 0;
    std::array<int, std::size(AllOutcomeStatuses)> status_counts{};
    int successful = 0;
    int failed = 0;
    int retried = 0;

    // Only set when at least one request succeeded.
    std::optional<LatencyStats> latency;
    std::size_t latency_samples = 0;

    double avg_tokens_sent = 0;
    double avg_tokens_received = 0;
    long long total_tokens_sent = 0;
    long long total_tokens_received = 0;

    std::vector<TypeBreakdown> breakdown;  // ascending by tag
    std::vector<ErrorCount> top_errors;

    double test_duration = 0;
    double requests_per_second = 0;
    double successful_per_second = 0;
    bool stopped_early = false;

    std::size_t health_checks = 0;
    std::size_t healthy_checks = 0;
    bool final_alive = true;
    // Relative to the run start; only kept for short runs.
    std::vector<HealthSample> health_timeline;
    std::vector<ResponseSample> samples;
    double start_epoch = 0;

    int count(OutcomeStatus status) const {
        return status_counts[static_cast<std::size_t>(status)];
    }

    std::string display() const;

    json summary_json() const;
};

// Element at index floor(n * p) of an ascending sequence. 0 when empty.
double percentile(const std::vector<double>& sorted, double p);

double median(const std::vector<double>& sorted);

// Pure; calling it twice on the same input gives the same report.
AggregateReport compute_report(
    const std::vector<RequestOutcome>& outcomes,
    const std::vector<HealthSample>& health,
    const std::vector<ResponseSample>& samples,
    double test_duration,
    double start_epoch,
    bool final_alive,
    bool stopped_early);

json results_document(
    const RunConfig& cfg,
    const AggregateReport& report,
    const std::optional<HealthSample>& initial_health,
    const std::vector<HealthSample>& health,
    const std::vector<ResponseSample>& samples,
    const std::vector<RequestOutcome>& outcomes);

// load_test_results_<timestamp>[_N].json inside `dir`. Never overwrites.
std::string unique_results_path(const std::string& dir, const std::string& timestamp);

// Writes the pretty-printed document and returns its path. Throws
// std::runtime_error when the file cannot be written.
std::string write_results_document(const std::string& dir, const json& document);
