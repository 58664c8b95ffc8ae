#pragma once
#include <random>
#include "prompt_catalog.hpp"
#include "request_executor.hpp"
#include "result_store.hpp"
#include "run_config.hpp"
#include "run_control.hpp"

// One simulated user: jitter, then request/think cycles until the deadline.
class UserSession {
public:
    UserSession(
        int user_id,
        const RunConfig& cfg,
        RequestExecutor& executor,
        ResultStore& store,
        RunControl& control,
        unsigned int seed);

    void run();

    // A single request cycle without the think time.
    RequestOutcome step();

    const PromptTemplate& pick_template();

    int target_tokens(const PromptTemplate& tmpl);

private:
    millis uniform_millis(millis lo, millis hi);

    int user_id;
    const RunConfig& cfg;
    RequestExecutor& executor;
    ResultStore& store;
    RunControl& control;
    std::mt19937 rng;
};

std::string progress_line(const RequestOutcome& outcome);
