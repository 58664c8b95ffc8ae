#pragma once
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace RequestConstants {
    static constexpr int WorkloadMaxTokens = 500;
    static constexpr double WorkloadTemperature = 0.7;
    static constexpr int ProbeMaxTokens = 10;
    static constexpr double ProbeTemperature = 0.0;
    static constexpr const char* ProbePrompt = "Reply with OK if you can read this.";
    static constexpr const char* CompletionsPath = "/v1/chat/completions";
}

// One chat completion request carrying a single user message. Decoding
// parameters are fixed per kind of traffic: workload or health probe.
struct RequestParameters {
    std::string model;
    std::string prompt;
    int max_tokens = RequestConstants::WorkloadMaxTokens;
    double temperature = RequestConstants::WorkloadTemperature;

    static RequestParameters workload(const std::string& model, std::string prompt);

    static RequestParameters probe(const std::string& model);

    json to_json() const;

    std::string to_str() const;
};

inline RequestParameters RequestParameters::workload(const std::string& model, std::string prompt) {
    RequestParameters req;
    req.model = model;
    req.prompt = std::move(prompt);
    return req;
}

inline RequestParameters RequestParameters::probe(const std::string& model) {
    RequestParameters req;
    req.model = model;
    req.prompt = RequestConstants::ProbePrompt;
    req.max_tokens = RequestConstants::ProbeMaxTokens;
    req.temperature = RequestConstants::ProbeTemperature;
    return req;
}

inline json RequestParameters::to_json() const {
    json j;
    j["model"] = model;
    json message = {{"role", "user"}, {"content", prompt}};
    j["messages"] = json::array({message});
    j["max_tokens"] = max_tokens;
    j["temperature"] = temperature;
    return j;
}

inline std::string RequestParameters::to_str() const {
    std::string str = "==========\nREQUEST PARAMETERS\n";
    str += "model: " + model + "\n";
    str += "prompt chars: " + std::to_string(prompt.size()) + "\n";
    str += "max_tokens: " + std::to_string(max_tokens) + "\n";
    str += "temperature: " + std::to_string(temperature) + "\n";
    str += "==========\n";
    return str;
}
