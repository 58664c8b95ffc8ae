#pragma once
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// The two fields of a chat completion the load test cares about. Anything
// missing or malformed reads as empty/zero instead of failing the request.
struct CompletionResults {
    CompletionResults() = default;

    explicit CompletionResults(const std::string& json_str);

    std::string content;
    int completion_tokens = 0;
};
