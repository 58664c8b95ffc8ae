#include "request_executor.hpp"
#include <algorithm>
#include <thread>
#include "completion_types.hpp"
#include "logger.hpp"
#include "prompt_catalog.hpp"
#include "request_parameters.hpp"
#include "utils.hpp"

namespace {
    bool is_success(long code) {
        return code >= 200 && code < 300;
    }

    bool is_client_error(long code) {
        return code >= 400 && code < 500;
    }

    std::string http_error_text(const TransportResponse& resp) {
        return "HTTP " + std::to_string(resp.http_status) + ": " + truncate(resp.body, ResultLimits::ErrorChars);
    }
}

void thread_sleep(millis duration) {
    std::this_thread::sleep_for(duration);
}

RequestExecutor::RequestExecutor(
    std::shared_ptr<HttpTransport> transport,
    RunConfig cfg,
    ResultStore& store,
    Sleeper sleeper
) : transport(std::move(transport)), cfg(std::move(cfg)), store(store), sleeper(std::move(sleeper)) {
    url = this->cfg.completions_url();
}

millis RequestExecutor::backoff_for(TransportState state, int attempt) const {
    if (state == TransportState::RESPONDED) {
        return cfg.timings.backoff_unit * (1LL << std::min(attempt, 30));
    }
    return cfg.timings.fixed_backoff;
}

RequestOutcome RequestExecutor::execute(
    int user_id,
    const std::string& prompt,
    const std::string& request_type,
    int target_tokens
) {
    InFlightGuard in_flight(store.active_requests);

    RequestOutcome outcome;
    outcome.user_id = user_id;
    outcome.request_type = request_type;
    outcome.context_length = target_tokens;
    outcome.tokens_sent = estimate_tokens(prompt);

    auto body = RequestParameters::workload(cfg.model_name, prompt).to_json().dump();
    auto timeout = cfg.request_timeout_ms();

    int attempt = 0;
    while (true) {
        auto attempt_start = std::chrono::steady_clock::now();
        auto resp = transport->post_json(url, body, timeout);
        outcome.response_time = seconds_between(attempt_start, std::chrono::steady_clock::now());
        outcome.retry_count = attempt;
        outcome.http_status = std::nullopt;

        std::string reason;
        OutcomeStatus exhausted_status;
        switch (resp.state) {
            case TransportState::RESPONDED:
                outcome.http_status = resp.http_status;
                if (is_success(resp.http_status)) {
                    CompletionResults results(resp.body);
                    outcome.status = OutcomeStatus::SUCCESS;
                    outcome.response_content = truncate(results.content, ResultLimits::ResponseExcerptChars);
                    outcome.tokens_received = results.completion_tokens;
                    outcome.timestamp = epoch_seconds();
                    return outcome;
                }
                reason = http_error_text(resp);
                if (is_client_error(resp.http_status)) {
                    outcome.status = OutcomeStatus::CLIENT_ERROR;
                    outcome.error = reason;
                    outcome.timestamp = epoch_seconds();
                    return outcome;
                }
                exhausted_status = OutcomeStatus::SERVER_ERROR_EXHAUSTED;
                break;
            case TransportState::TIMED_OUT:
                reason = "Request timeout";
                exhausted_status = OutcomeStatus::TIMEOUT_EXHAUSTED;
                break;
            case TransportState::FAILED:
            default:
                reason = resp.error.empty() ? "Transport error" : truncate(resp.error, ResultLimits::ErrorChars);
                exhausted_status = OutcomeStatus::TRANSPORT_ERROR_EXHAUSTED;
                break;
        }

        if (attempt >= cfg.max_retries) {
            outcome.status = exhausted_status;
            outcome.error = reason;
            outcome.timestamp = epoch_seconds();
            return outcome;
        }

        auto delay = backoff_for(resp.state, attempt);
        ++attempt;
        Logger.raw("  [Retry " + std::to_string(attempt) + "/" + std::to_string(cfg.max_retries) +
                   "] User " + zero_pad(user_id, 3) + ": " + reason);
        sleeper(delay);
    }
}
