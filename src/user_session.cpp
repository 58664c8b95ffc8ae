#include "user_session.hpp"
#include "logger.hpp"
#include "utils.hpp"

UserSession::UserSession(
    int user_id,
    const RunConfig& cfg,
    RequestExecutor& executor,
    ResultStore& store,
    RunControl& control,
    unsigned int seed
) : user_id(user_id), cfg(cfg), executor(executor), store(store), control(control), rng(seed) {}

millis UserSession::uniform_millis(millis lo, millis hi) {
    std::uniform_int_distribution<long long> dist(lo.count(), hi.count());
    return millis(dist(rng));
}

const PromptTemplate& UserSession::pick_template() {
    std::bernoulli_distribution mcp(0.5);
    const auto& family = PromptCatalog::templates(mcp(rng) ? WorkloadFamily::MCP : WorkloadFamily::AGENTIC);
    std::uniform_int_distribution<std::size_t> pick(0, family.size() - 1);
    return family[pick(rng)];
}

int UserSession::target_tokens(const PromptTemplate& tmpl) {
    int base_context = static_cast<int>(cfg.max_context_tokens * tmpl.context_fraction);
    std::uniform_real_distribution<double> variation(0.7, 1.0);
    return static_cast<int>(base_context * variation(rng));
}

RequestOutcome UserSession::step() {
    const auto& tmpl = pick_template();
    int target = target_tokens(tmpl);
    auto prompt = tmpl.render(target);

    auto outcome = executor.execute(user_id, prompt, tmpl.request_type(), target);
    Logger.raw(progress_line(outcome));
    store.add_outcome(outcome);
    return outcome;
}

void UserSession::run() {
    // Stagger the first request so users don't arrive together
    if (!control.sleep_for(uniform_millis(cfg.timings.jitter_min, cfg.timings.jitter_max))) {
        return;
    }
    while (control.running()) {
        step();
        if (!control.sleep_for(uniform_millis(cfg.timings.think_min, cfg.timings.think_max))) {
            return;
        }
    }
}

std::string progress_line(const RequestOutcome& outcome) {
    std::string line = "[User " + zero_pad(outcome.user_id, 3) + "] " + outcome.request_type;
    line += " | Context: " + std::to_string(outcome.context_length / 1000) + "K tokens";
    line += " | Status: " + std::string(outcome_status_as_str(outcome.status));
    if (outcome.retry_count > 0) {
        line += " (retry " + std::to_string(outcome.retry_count) + ")";
    }
    line += " | Time: " + format_fixed(outcome.response_time, 2) + "s";
    if (!outcome.response_content.empty()) {
        line += " | Response: " + truncate(outcome.response_content, 80) + "...";
    }
    return line;
}
