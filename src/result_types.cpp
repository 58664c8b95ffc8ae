#include "result_types.hpp"
#include "utils.hpp"

json RequestOutcome::to_json() const {
    json j = json::object();
    j["user_id"] = user_id;
    j["request_type"] = request_type;
    j["context_length"] = context_length;
    j["status"] = outcome_status_as_str(status);
    j["response_time"] = response_time;
    j["tokens_sent"] = tokens_sent;
    j["tokens_received"] = tokens_received;
    if (response_content.empty()) {
        j["response_content"] = nullptr;
    } else {
        j["response_content"] = truncate(response_content, ResultLimits::ResponseExcerptChars);
    }
    j["timestamp"] = timestamp;
    j["retry_count"] = retry_count;
    if (error.has_value()) {
        j["error"] = error.value();
    } else {
        j["error"] = nullptr;
    }
    if (http_status.has_value()) {
        j["http_status"] = http_status.value();
    } else {
        j["http_status"] = nullptr;
    }
    return j;
}

json HealthSample::to_json() const {
    json j = json::object();
    j["timestamp"] = timestamp;
    j["status"] = health_state_as_str(state);
    if (http_status.has_value()) {
        j["http_status"] = http_status.value();
        j["response"] = response;
    }
    if (error.has_value()) {
        j["error"] = error.value();
    }
    return j;
}

json ResponseSample::to_json() const {
    json j = json::object();
    j["user_id"] = user_id;
    j["request_type"] = request_type;
    j["timestamp"] = timestamp;
    j["response"] = response;
    return j;
}
