#pragma once
#include <string>
#include <string_view>
#include <vector>

enum class WorkloadFamily {
    MCP,
    AGENTIC,
};

inline const char* workload_family_as_str(WorkloadFamily family) {
    switch (family) {
        case WorkloadFamily::MCP: return "MCP";
        case WorkloadFamily::AGENTIC: return "Agentic";
        default: return "Unknown";
    }
}

// ~4 characters per token. Used for sizing prompts and for reporting, it is
// not a tokenizer.
int estimate_tokens(const std::string& text);

struct PromptTemplate {
    WorkloadFamily family;
    std::string_view name;
    double context_fraction;  // share of max context given to this template
    std::string_view body;    // contains one "{context}" placeholder
    const std::string& (*context)();

    // e.g. "MCP_file_search"
    std::string request_type() const;

    // Fills in the context block and pads with filler text until the
    // estimate reaches `target_tokens`. Never shortens the template.
    std::string render(int target_tokens) const;
};

namespace PromptCatalog {
    const std::vector<PromptTemplate>& templates(WorkloadFamily family);

    const PromptTemplate* find(const std::string& request_type);
}
