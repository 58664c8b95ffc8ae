#include <atomic>
#include <csignal>
#include <cstdlib>
#include <execinfo.h>
#include <iostream>
#include <optional>
#include <unistd.h>
#include "errors.hpp"
#include "load_test.hpp"
#include "logger.hpp"

const std::string filename = "stdout";

#ifdef NDEBUG
LoggingContext Logger(filename, INFO);
#else
LoggingContext Logger(filename, DEBUG);
#endif


const std::string_view help_text = R"(
Usage: llmload [<config.yaml>] [OPTIONS]

Options:
  <config.yaml>          YAML (or JSON) file with run settings; flags override it

  --preset <name>        quick, standard or stress
  --endpoint <url>       Base URL of the server (e.g. http://localhost:8000)
  --model <name>         Model identifier sent with every request
  --api-key <key>        Bearer credential (default: $OPENAI_API_KEY)
  --concurrency <int>    Number of simulated users (default 60)
  --duration <sec>       Length of the run in seconds (default 300)
  --max-context <int>    Largest prompt size in tokens (default 6000)
  --timeout <sec>        Per-request timeout in seconds (default 60)
  --max-retries <int>    Retries for 5xx, timeouts and transport errors (default 2)
  --verify-ssl           Verify TLS certificates
  --output-dir <path>    Where the results JSON is written (default .)
  --seed <int>           Seed for workload selection
  --log-level <level>    error, warn, info or debug
  --help                 Show this help message
)";

std::atomic<bool> stop_signalled = false;


int main(int argc, char* argv[]) {
    signal(SIGABRT, [](int) {
        void* trace[64];
        int n = backtrace(trace, 64);
        backtrace_symbols_fd(trace, n, STDERR_FILENO);
        _exit(1);
    });

    std::optional<std::string> config_path = std::nullopt;
    std::optional<std::string> preset = std::nullopt;
    std::optional<std::string> endpoint = std::nullopt;
    std::optional<std::string> model = std::nullopt;
    std::optional<std::string> api_key = std::nullopt;
    std::optional<std::string> concurrency = std::nullopt;
    std::optional<std::string> duration = std::nullopt;
    std::optional<std::string> max_context = std::nullopt;
    std::optional<std::string> timeout_sec = std::nullopt;
    std::optional<std::string> max_retries = std::nullopt;
    std::optional<std::string> output_dir = std::nullopt;
    std::optional<std::string> seed = std::nullopt;
    std::optional<std::string> log_level = std::nullopt;
    bool verify_ssl = false;

    std::string arg;
    for (int i = 1; i < argc; ++i) {
        arg = argv[i];
        if (arg == "--help") {
            std::cout << help_text << std::endl;
            return 0;
        } else if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--endpoint" && i + 1 < argc) {
            endpoint = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model = argv[++i];
        } else if (arg == "--api-key" && i + 1 < argc) {
            api_key = argv[++i];
        } else if (arg == "--concurrency" && i + 1 < argc) {
            concurrency = argv[++i];
        } else if (arg == "--duration" && i + 1 < argc) {
            duration = argv[++i];
        } else if (arg == "--max-context" && i + 1 < argc) {
            max_context = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_sec = argv[++i];
        } else if (arg == "--max-retries" && i + 1 < argc) {
            max_retries = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--verify-ssl") {
            verify_ssl = true;
        } else if (!arg.starts_with("--") && !config_path.has_value()) {
            config_path = arg;
        } else {
            std::cerr << "Unrecognized or incomplete argument: " << arg << "\n";
            return 1;
        }
    }

    if (log_level.has_value()) {
        auto level = log_level_from_str(log_level.value());
        if (!level.has_value()) {
            std::cerr << "Unknown log level: " << log_level.value() << "\n";
            return 1;
        }
        Logger.set_level(level.value());
    }

    RunConfig cfg;
    try {
        if (const char* env_key = std::getenv("OPENAI_API_KEY")) {
            cfg.api_key = env_key;
        }
        if (preset.has_value()) {
            apply_preset(cfg, preset.value());
        }
        if (config_path.has_value()) {
            Logger.debug("Loading config from " + config_path.value());
            cfg = load_run_config(config_path.value(), cfg);
        }
        if (endpoint.has_value()) cfg.endpoint = endpoint.value();
        if (model.has_value()) cfg.model_name = model.value();
        if (api_key.has_value()) cfg.api_key = api_key.value();
        if (concurrency.has_value()) cfg.concurrent_users = std::stoi(concurrency.value());
        if (duration.has_value()) cfg.test_duration_seconds = std::stod(duration.value());
        if (max_context.has_value()) cfg.max_context_tokens = std::stoi(max_context.value());
        if (timeout_sec.has_value()) cfg.request_timeout = std::stod(timeout_sec.value());
        if (max_retries.has_value()) cfg.max_retries = std::stoi(max_retries.value());
        if (output_dir.has_value()) cfg.output_dir = output_dir.value();
        if (seed.has_value()) cfg.seed = static_cast<unsigned int>(std::stoul(seed.value()));
        if (verify_ssl) cfg.verify_ssl = true;
    } catch (const ValidationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    } catch (const std::logic_error& e) {
        // std::stoi and friends
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return 1;
    }

    std::unique_ptr<RunHandle> handle;
    try {
        handle = start(cfg);
    } catch (const ValidationError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    signal(SIGINT, [](int) { stop_signalled.store(true); });
    signal(SIGTERM, [](int) { stop_signalled.store(true); });

    bool stop_sent = false;
    while (!handle->finished()) {
        if (stop_signalled.load() && !stop_sent) {
            Logger.warn("Stop requested, waiting for in-flight requests to finish...");
            stop(*handle);
            stop_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    auto status = handle->wait();
    Logger.info(std::string("Run ") + run_state_as_str(status.state));
    Logger.flush();
    if (status.state == RunState::FAILED) {
        std::cerr << status.error << "\n";
        return 1;
    }
    return 0;
}
