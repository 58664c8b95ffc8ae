#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <map>
#include <set>
#include "fakes.hpp"
#include "prompt_catalog.hpp"
#include "user_session.hpp"

using Catch::Matchers::ContainsSubstring;


TEST_CASE( "catalog holds three templates per family" ) {
    const auto& mcp = PromptCatalog::templates(WorkloadFamily::MCP);
    const auto& agentic = PromptCatalog::templates(WorkloadFamily::AGENTIC);
    REQUIRE(mcp.size() == 3);
    REQUIRE(agentic.size() == 3);

    std::map<std::string, double> fractions;
    for (const auto* family : {&mcp, &agentic}) {
        for (const auto& tmpl : *family) {
            fractions[tmpl.request_type()] = tmpl.context_fraction;
        }
    }
    REQUIRE(fractions == std::map<std::string, double>{
        {"MCP_file_search", 0.3},
        {"MCP_data_analysis", 0.5},
        {"MCP_code_review", 0.4},
        {"Agentic_research_task", 0.6},
        {"Agentic_planning_task", 0.7},
        {"Agentic_problem_solving", 0.8},
    });
}

TEST_CASE( "templates are found by their type tag" ) {
    const auto* tmpl = PromptCatalog::find("Agentic_planning_task");
    REQUIRE(tmpl != nullptr);
    REQUIRE(tmpl->family == WorkloadFamily::AGENTIC);
    REQUIRE(tmpl->name == "planning_task");
    REQUIRE(PromptCatalog::find("MCP_unknown") == nullptr);
}

TEST_CASE( "rendering fills in the context block" ) {
    auto prompt = PromptCatalog::find("MCP_file_search")->render(0);
    REQUIRE_THAT(prompt, ContainsSubstring("src/module_0/file_0.py"));
    REQUIRE_THAT(prompt, ContainsSubstring("src/module_9/file_4.py"));
    REQUIRE(prompt.find("{context}") == std::string::npos);
    REQUIRE(prompt.find("Additional context") == std::string::npos);

    auto schema = PromptCatalog::find("MCP_data_analysis")->render(0);
    REQUIRE_THAT(schema, ContainsSubstring("\"sample_data\""));
    REQUIRE_THAT(schema, ContainsSubstring("product_id"));
}

TEST_CASE( "rendering pads small prompts up to the target size" ) {
    for (const auto family : {WorkloadFamily::MCP, WorkloadFamily::AGENTIC}) {
        for (const auto& tmpl : PromptCatalog::templates(family)) {
            int natural = estimate_tokens(tmpl.render(0));
            for (int target : {natural + 1, natural + 100, 5'000, 60'000}) {
                auto prompt = tmpl.render(target);
                int estimated = estimate_tokens(prompt);
                REQUIRE(estimated >= target);
                REQUIRE(estimated <= target + 8);
                REQUIRE_THAT(prompt, ContainsSubstring("\n\nAdditional context: detail "));
            }
        }
    }
}

TEST_CASE( "rendering never shortens a template" ) {
    const auto* tmpl = PromptCatalog::find("Agentic_problem_solving");
    auto natural = tmpl->render(0);
    REQUIRE(tmpl->render(1) == natural);
    REQUIRE(tmpl->render(estimate_tokens(natural)) == natural);
}

TEST_CASE( "sessions pick both families and size prompts from the template" ) {
    auto cfg = fast_config();
    cfg.max_context_tokens = 10'000;
    auto transport = std::make_shared<ScriptedTransport>();
    ResultStore store;
    RunControl control(cfg.duration());
    RequestExecutor executor(transport, cfg, store);
    UserSession session(0, cfg, executor, store, control, 1234);

    std::set<std::string> seen;
    for (int i = 0; i < 400; ++i) {
        const auto& tmpl = session.pick_template();
        seen.insert(tmpl.request_type());
        int target = session.target_tokens(tmpl);
        int base = static_cast<int>(cfg.max_context_tokens * tmpl.context_fraction);
        REQUIRE(target >= static_cast<int>(base * 0.7) - 1);
        REQUIRE(target <= base);
    }
    REQUIRE(seen.size() == 6);
}
