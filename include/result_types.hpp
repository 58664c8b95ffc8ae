#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ResultLimits {
    static constexpr std::size_t ResponseExcerptChars = 1'000;
    static constexpr std::size_t ErrorChars = 200;
    static constexpr std::size_t HealthExcerptChars = 200;
    static constexpr std::size_t SampleExcerptChars = 500;
    static constexpr std::size_t MaxResponseSamples = 50;
}

enum class OutcomeStatus {
    SUCCESS,
    CLIENT_ERROR,
    SERVER_ERROR_EXHAUSTED,
    TIMEOUT_EXHAUSTED,
    TRANSPORT_ERROR_EXHAUSTED,
};

inline const char* outcome_status_as_str(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::SUCCESS: return "success";
        case OutcomeStatus::CLIENT_ERROR: return "client_error";
        case OutcomeStatus::SERVER_ERROR_EXHAUSTED: return "server_error_exhausted";
        case OutcomeStatus::TIMEOUT_EXHAUSTED: return "timeout_exhausted";
        case OutcomeStatus::TRANSPORT_ERROR_EXHAUSTED: return "transport_error_exhausted";
        default: return "invalid";
    }
}

constexpr OutcomeStatus AllOutcomeStatuses[] = {
    OutcomeStatus::SUCCESS,
    OutcomeStatus::CLIENT_ERROR,
    OutcomeStatus::SERVER_ERROR_EXHAUSTED,
    OutcomeStatus::TIMEOUT_EXHAUSTED,
    OutcomeStatus::TRANSPORT_ERROR_EXHAUSTED,
};

// One per logical request, however many attempts it took.
struct RequestOutcome {
    int user_id = 0;
    std::string request_type;
    int context_length = 0;
    OutcomeStatus status = OutcomeStatus::SUCCESS;
    double response_time = 0;  // seconds, final attempt only
    int tokens_sent = 0;
    int tokens_received = 0;
    std::string response_content;
    std::optional<std::string> error;
    double timestamp = 0;
    int retry_count = 0;
    std::optional<long> http_status;

    bool succeeded() const {
        return status == OutcomeStatus::SUCCESS;
    }

    json to_json() const;
};

enum class HealthState {
    HEALTHY,
    UNHEALTHY,  // endpoint answered with something other than 200
    ERROR,      // no answer at all
};

inline const char* health_state_as_str(HealthState state) {
    switch (state) {
        case HealthState::HEALTHY: return "healthy";
        case HealthState::UNHEALTHY: return "unhealthy";
        case HealthState::ERROR: return "error";
        default: return "invalid";
    }
}

struct HealthSample {
    double timestamp = 0;
    HealthState state = HealthState::ERROR;
    std::optional<long> http_status;
    std::string response;
    std::optional<std::string> error;

    bool healthy() const {
        return state == HealthState::HEALTHY;
    }

    json to_json() const;
};

struct ResponseSample {
    int user_id = 0;
    std::string request_type;
    double timestamp = 0;
    std::string response;

    json to_json() const;
};
