#include "prompt_catalog.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
    constexpr std::string_view placeholder = "{context}";

    std::string repeat(const std::string& str, int times) {
        std::string out;
        if (times <= 0) {
            return out;
        }
        out.reserve(str.size() * static_cast<std::size_t>(times));
        for (int i = 0; i < times; ++i) {
            out += str;
        }
        return out;
    }

    const std::string& file_tree() {
        static const std::string tree = [] {
            std::string out;
            for (int i = 0; i < 10; ++i) {
                for (int j = 0; j < 5; ++j) {
                    if (!out.empty()) out += "\n";
                    out += "src/module_" + std::to_string(i) + "/file_" + std::to_string(j) + ".py";
                }
            }
            return out;
        }();
        return tree;
    }

    const std::string& schema_data() {
        static const std::string schema = [] {
            auto columns = [](std::vector<std::string> names) {
                json cols = json::array();
                for (int i = 0; i < 10; ++i) {
                    for (const auto& name : names) cols.push_back(name);
                }
                return cols;
            };
            json j;
            j["tables"]["sales"]["columns"] = columns({"id", "product_id", "amount", "date", "customer_id"});
            j["tables"]["products"]["columns"] = columns({"id", "name", "category", "price"});
            j["tables"]["customers"]["columns"] = columns({"id", "name", "email", "region"});
            j["sample_data"] = json::array();
            for (int i = 0; i < 20; ++i) {
                j["sample_data"].push_back({{"record", i}, {"data", repeat("sample", 10)}});
            }
            return j.dump(2);
        }();
        return schema;
    }

    const std::string& code_files() {
        static const std::string files = [] {
            std::string out;
            for (int i = 0; i < 5; ++i) {
                if (!out.empty()) out += "\n\n";
                out += "# File: module_" + std::to_string(i) + ".py\n" + repeat("def function():\n    pass\n", 20);
            }
            return out;
        }();
        return files;
    }

    const std::string& research_context() {
        static const std::string research = [] {
            std::string out;
            for (int i = 0; i < 10; ++i) {
                if (!out.empty()) out += "\n";
                out += "Study " + std::to_string(i) + ": " + repeat("Finding ", 30);
            }
            return out;
        }();
        return research;
    }

    const std::string& planning_history() {
        static const std::string history = [] {
            json sessions = json::array();
            for (int i = 0; i < 5; ++i) {
                json tasks = json::array();
                for (int t = 0; t < 5; ++t) tasks.push_back(repeat("task", 10));
                sessions.push_back({{"session", i}, {"tasks", tasks}, {"outcomes", repeat("success", 20)}});
            }
            return sessions.dump(2);
        }();
        return history;
    }

    const std::string& problem_context() {
        static const std::string logs = [] {
            std::string out;
            for (int i = 0; i < 15; ++i) {
                json entry = {
                    {"timestamp", i},
                    {"level", "ERROR"},
                    {"message", repeat("error", 10)},
                    {"stack", repeat("trace", 10)}
                };
                if (!out.empty()) out += "\n";
                out += "Log entry " + std::to_string(i) + ": " + entry.dump();
            }
            return out;
        }();
        return logs;
    }

    const std::vector<PromptTemplate> mcp_templates = {
        {
            WorkloadFamily::MCP, "file_search", 0.3,
            "You are an AI assistant with access to a file system.\n"
            "The user has asked you to search for files matching a pattern.\n"
            "Available tools:\n"
            "- search_files(pattern: str, path: str) -> List[str]\n"
            "- read_file(path: str) -> str\n"
            "- list_directory(path: str) -> List[str]\n"
            "\n"
            "Context: You have access to a large codebase with the following structure:\n"
            "{context}\n"
            "\n"
            "User request: Find all Python files that contain database connection logic and summarize their contents.\n",
            &file_tree
        },
        {
            WorkloadFamily::MCP, "data_analysis", 0.5,
            "You are a data analysis AI with access to query tools.\n"
            "Available tools:\n"
            "- execute_query(sql: str) -> DataFrame\n"
            "- calculate_statistics(data: List) -> Dict\n"
            "- create_visualization(data: List, chart_type: str) -> Image\n"
            "\n"
            "Context: Database schema and sample data:\n"
            "{context}\n"
            "\n"
            "User request: Analyze the sales trends over the last quarter and identify the top performing products.\n",
            &schema_data
        },
        {
            WorkloadFamily::MCP, "code_review", 0.4,
            "You are a code review AI assistant.\n"
            "Available tools:\n"
            "- analyze_code(file_path: str) -> CodeAnalysis\n"
            "- check_security(code: str) -> SecurityReport\n"
            "- suggest_improvements(code: str) -> List[Suggestion]\n"
            "\n"
            "Context: Review the following code files:\n"
            "{context}\n"
            "\n"
            "User request: Review these files for security vulnerabilities and performance issues.\n",
            &code_files
        },
    };

    const std::vector<PromptTemplate> agentic_templates = {
        {
            WorkloadFamily::AGENTIC, "research_task", 0.6,
            "You are an autonomous research agent. Your task involves:\n"
            "1. Gathering information from multiple sources\n"
            "2. Synthesizing the information\n"
            "3. Drawing conclusions\n"
            "4. Providing recommendations\n"
            "\n"
            "Previous research context:\n"
            "{context}\n"
            "\n"
            "Current task: Research the impact of AI on software development practices and provide a comprehensive analysis.\n"
            "Please break this down into subtasks and execute them systematically.\n",
            &research_context
        },
        {
            WorkloadFamily::AGENTIC, "planning_task", 0.7,
            "You are a planning agent responsible for breaking down complex tasks.\n"
            "You have access to previous planning sessions and outcomes.\n"
            "\n"
            "Historical planning data:\n"
            "{context}\n"
            "\n"
            "Current objective: Design and implement a scalable microservices architecture for an e-commerce platform.\n"
            "Create a detailed implementation plan with:\n"
            "- Architecture decisions\n"
            "- Technology choices\n"
            "- Implementation steps\n"
            "- Risk assessment\n"
            "- Timeline estimates\n",
            &planning_history
        },
        {
            WorkloadFamily::AGENTIC, "problem_solving", 0.8,
            "You are a problem-solving agent with reasoning capabilities.\n"
            "You need to analyze complex scenarios and provide solutions.\n"
            "\n"
            "Problem context and constraints:\n"
            "{context}\n"
            "\n"
            "Problem: A distributed system is experiencing intermittent failures. Analyze the logs, identify root causes, and propose solutions.\n"
            "Use chain-of-thought reasoning to work through this systematically.\n",
            &problem_context
        },
    };
}

int estimate_tokens(const std::string& text) {
    return static_cast<int>(text.size() / 4);
}

std::string PromptTemplate::request_type() const {
    return std::string(workload_family_as_str(family)) + "_" + std::string(name);
}

std::string PromptTemplate::render(int target_tokens) const {
    std::string prompt(body);
    auto at = prompt.find(placeholder);
    if (at != std::string::npos) {
        prompt.replace(at, placeholder.size(), context());
    }

    int current_tokens = estimate_tokens(prompt);
    if (current_tokens < target_tokens) {
        int padding_needed = (target_tokens - current_tokens) * 4;
        prompt += "\n\nAdditional context: " + repeat("detail ", padding_needed / 7);
    }
    return prompt;
}

const std::vector<PromptTemplate>& PromptCatalog::templates(WorkloadFamily family) {
    return family == WorkloadFamily::MCP ? mcp_templates : agentic_templates;
}

const PromptTemplate* PromptCatalog::find(const std::string& request_type) {
    for (auto family : {WorkloadFamily::MCP, WorkloadFamily::AGENTIC}) {
        for (const auto& tmpl : templates(family)) {
            if (tmpl.request_type() == request_type) {
                return &tmpl;
            }
        }
    }
    return nullptr;
}
