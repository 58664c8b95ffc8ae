#include "completion_types.hpp"

CompletionResults::CompletionResults(const std::string& json_str) {
    auto as_json = json::parse(json_str, nullptr, false);
    if (as_json.is_discarded() || !as_json.is_object()) {
        return;
    }

    auto usage = as_json.find("usage");
    if (usage != as_json.end() && usage->is_object()) {
        auto tokens = usage->find("completion_tokens");
        if (tokens != usage->end() && tokens->is_number_integer()) {
            completion_tokens = tokens->get<int>();
        }
    }

    auto choices = as_json.find("choices");
    if (choices == as_json.end() || !choices->is_array() || choices->empty()) {
        return;
    }
    const auto& first = (*choices)[0];
    if (!first.is_object()) {
        return;
    }
    auto message = first.find("message");
    if (message == first.end() || !message->is_object()) {
        return;
    }
    auto text = message->find("content");
    if (text != message->end() && text->is_string()) {
        content = text->get<std::string>();
    }
}
