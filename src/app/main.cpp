/**
 * @file main.cpp
 * @brief agent_orchestrator command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the pipeline for one run:
 *   Config → Env overrides → Logger → Orchestrator → Run summary
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "orchestrator/orchestrator.hpp"
#include "telemetry/json_sink.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace agent_orchestrator;

namespace {

std::atomic<Orchestrator*> g_orchestrator{nullptr};

void signal_handler(int /*signal*/) {
    if (auto* orchestrator = g_orchestrator.load()) {
        orchestrator->request_stop();
    }
}

void print_usage() {
    std::cout << "Usage: agent_orchestrator [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/orchestrator.toml)\n"
              << "  --phase <name>      Phase to run: discovery, main, legacy, post (repeatable;\n"
              << "                      default: main)\n"
              << "  --dry-run           Validate the graph and print the execution order\n"
              << "  --include-manual    Also schedule tasks marked manual\n"
              << "  --help, -h          Show this help message\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/orchestrator.toml";
    std::vector<Phase> phases;
    bool dry_run = false;
    bool include_manual = false;
};

/// Parsed arguments, or an error message for the operator.
Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) return Error{ErrorKind::Config, "--config requires a path"};
            args.config_path = argv[++i];
        } else if (arg == "--phase") {
            if (i + 1 >= argc) return Error{ErrorKind::Config, "--phase requires a name"};
            auto phase = parse_phase(argv[++i]);
            if (!phase) {
                return Error{ErrorKind::Config, std::string{"unknown phase '"} + argv[i] + "'"};
            }
            args.phases.push_back(*phase);
        } else if (arg == "--dry-run") {
            args.dry_run = true;
        } else if (arg == "--include-manual") {
            args.include_manual = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorKind::Config, "unknown argument '" + arg + "'"};
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "[ERROR] " << args.error().message << "\n";
        print_usage();
        return kExitPreflight;
    }

    // Load configuration
    auto config_result = load_config(args->config_path);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().describe() << std::endl;
        return kExitPreflight;
    }
    auto config = std::move(*config_result);
    apply_env_overrides(config);

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (config.log.file) {
        log_sink = std::make_unique<JsonFileSink>(config.run.logs_dir / "orchestrator.ndjson",
                                                  config.log.max_file_size_mb,
                                                  config.log.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.log.level).value_or(LogLevel::Info));
    logger.log(LogLevel::Info, "main", "agent_orchestrator starting",
               {{"config", std::filesystem::absolute(args->config_path).string()},
                {"project_root", config.run.project_root.string()},
                {"tasks", config.tasks.size()},
                {"runners", config.runners.size()}});

    Orchestrator orchestrator(Orchestrator::Options{.config = std::move(config)}, logger);

    // Register signal handlers
    g_orchestrator.store(&orchestrator);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto report = orchestrator.run(RunRequest{
        .phases = args->phases,
        .include_manual = args->include_manual,
        .dry_run = args->dry_run,
    });

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_orchestrator.store(nullptr);

    logger.log(LogLevel::Info, "main", "agent_orchestrator finished",
               {{"run_id", report.run_id}, {"exit_code", report.exit_code}});
    logger.flush();
    return report.exit_code;
}
