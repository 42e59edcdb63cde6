/**
 * @file bench_core.cpp
 * @brief Performance benchmarks for the coordination hot paths.
 * @author Dimitris Kafetzis
 *
 * Measures graph construction, template expansion, event appends and
 * watchdog evaluation, i.e. the work the coordinating loop repeats every tick.
 *
 * Usage: ./bench_core [--csv]
 */

#include "core/config.hpp"
#include "core/template.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "graph/graph_builder.hpp"
#include "graph/task_graph.hpp"
#include "telemetry/event_log.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/run_summary.hpp"
#include "watchdog/indicators.hpp"
#include "watchdog/watchdog.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace agent_orchestrator;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// Layered declaration: each task depends on up to two tasks of the previous layer.
std::vector<TaskSpec> make_specs(size_t n, size_t width = 4) {
    std::vector<TaskSpec> specs;
    specs.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        TaskSpec spec;
        spec.id = "t" + std::to_string(i);
        spec.workspace_path = "../wt/{task}";
        spec.prompt = "prompts/" + spec.id + ".md";
        if (i >= width) {
            spec.depends_on.push_back("t" + std::to_string(i - width));
            if ((i % width) + 1 < width) spec.depends_on.push_back("t" + std::to_string(i - width + 1));
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

BuildOptions make_options() {
    BuildOptions opts;
    opts.project_root = "/bench/project";
    opts.logs_dir = "/bench/project/logs";
    opts.run_id = "bench";
    opts.runners["agent"] = RunnerConfig{.name = "agent", .command = "agent --prompt {prompt}"};
    return opts;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_graph() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;
    auto opts = make_options();

    for (size_t n : {10, 50, 200}) {
        auto specs = make_specs(n);
        R.push_back(run_bench("build(" + std::to_string(n) + ")", "Task Graph", N,
            [&]{ auto g = TaskGraphBuilder::build(specs, opts); (void)g; },
            std::to_string(n) + " tasks"));
    }

    auto graph = TaskGraphBuilder::build(make_specs(200), opts);
    if (!graph) return R;

    R.push_back(run_bench("topo_order(200)", "Task Graph", N,
        [&]{ auto o = graph->topological_order(); (void)o; }, "200 tasks"));
    R.push_back(run_bench("find_cycle(200)", "Task Graph", N,
        [&]{ auto c = graph->find_cycle(); (void)c; }, "200 tasks"));
    R.push_back(run_bench("ready_tasks(200)", "Task Graph", N,
        [&]{ auto r = graph->ready_tasks(false); (void)r; }, "200 tasks"));

    return R;
}

std::vector<BenchResult> bench_template() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;
    TemplateVars vars{{"task", "core"}, {"phase", "main"}, {"run_id", "20260101-000000-deadbeef"},
                      {"prompt", "/p/prompts/core.md"}, {"workspace", "/p/wt/core"}};

    R.push_back(run_bench("expand(short)", "Templates", N,
        [&]{ auto s = expand_template("task/{task}-{run_id}", vars); (void)s; }));
    R.push_back(run_bench("expand(command)", "Templates", N,
        [&]{ auto s = expand_template("agent exec --cd {workspace} --prompt {prompt} "
                                      "--label {{{phase}}}", vars); (void)s; }));
    R.push_back(run_bench("validate(command)", "Templates", N,
        [&]{ auto s = validate_template("agent --prompt {prompt} --cd {workspace}", vars); (void)s; }));

    return R;
}

std::vector<BenchResult> bench_events() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    EventLog log("bench", std::make_unique<NullSink>());
    R.push_back(run_bench("append", "Event Log", N, [&]{
        log.append("core", events::kTaskStart, {{"attempt", 1}, {"runner", "agent"}});
    }));
    R.push_back(run_bench("has_event", "Event Log", N,
        [&]{ auto h = log.has_event("core", events::kTaskSucceeded); (void)h; },
        std::to_string(N) + " records"));

    auto snapshot = log.snapshot();
    R.push_back(run_bench("summary_reduce", "Event Log", 100,
        [&]{ auto s = RunSummaryGenerator::reduce(snapshot); (void)s; },
        std::to_string(snapshot.size()) + " records"));

    ThreadPool pool(4);
    R.push_back(run_bench("append_x4_threads", "Event Log", 200, [&]{
        std::vector<std::future<void>> futures;
        for (int t = 0; t < 4; ++t) {
            futures.push_back(pool.submit([&log]{
                log.append("core", events::kEscalation, {{"action", "notify"}});
            }));
        }
        for (auto& f : futures) f.get();
    }));

    return R;
}

std::vector<BenchResult> bench_watchdog() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    std::vector<std::string> varied, looping;
    for (int i = 0; i < 30; ++i) {
        varied.push_back("step " + std::to_string(i) + ": edited src/module_" + std::to_string(i) + ".cpp");
        looping.push_back(i % 2 ? "Retrying request..." : "Error: rate limited");
    }
    R.push_back(run_bench("is_degenerate(varied)", "Watchdog", N,
        [&]{ auto d = is_degenerate(varied, 30, 3); (void)d; }, "30 lines"));
    R.push_back(run_bench("is_degenerate(looping)", "Watchdog", N,
        [&]{ auto d = is_degenerate(looping, 30, 3); (void)d; }, "30 lines"));

    std::string tail;
    for (int i = 0; i < 2000; ++i) tail += "line " + std::to_string(i) + " of agent output\n";
    R.push_back(run_bench("last_lines(30 of 2000)", "Watchdog", N,
        [&]{ auto l = last_lines(tail, 30); (void)l; }));

    WatchdogPolicy policy;
    ProgressWatchdog watchdog;
    auto t0 = std::chrono::system_clock::now();
    watchdog.attach("core", policy, t0);
    IndicatorSample quiet{.task_id = "core", .attempt = 1, .at = t0, .readings = {}};
    for (size_t i = 0; i < kIndicatorCount; ++i) {
        quiet.readings.push_back(IndicatorReading{.kind = static_cast<Indicator>(i)});
    }
    R.push_back(run_bench("observe(quiet)", "Watchdog", N,
        [&]{ auto v = watchdog.observe(quiet); (void)v; }));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  AgentOrchestrator Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_graph());
    append(bench_template());
    append(bench_events());
    append(bench_watchdog());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
