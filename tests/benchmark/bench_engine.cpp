/**
 * @file bench_engine.cpp
 * @brief Performance benchmarks for graph analysis and wave dispatch.
 *
 * Measures cycle detection, wave planning and the engine overhead of
 * executing no-op workflows of common shapes.
 *
 * Usage: ./bench_engine [--csv]
 */

#include "core/types.hpp"
#include "executor/function_registry.hpp"
#include "executor/task_runner.hpp"
#include "executor/thread_pool.hpp"
#include "scheduler/scheduler.hpp"
#include "workflow/generator.hpp"
#include "workflow/workflow.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <thread>
#include <vector>

using namespace dag_scheduler;
using Clock = std::chrono::steady_clock;

// ─────────────────────────────────────────────
// Harness
// ─────────────────────────────────────────────

/// Times each case and prints one row per case, grouped, as a table or CSV.
class Bench {
public:
    explicit Bench(bool csv) : csv_(csv) {
        if (csv_) std::cout << "group,name,mean_us,stddev_us,p99_us,min_us,note\n";
    }

    void group(std::string title) {
        group_ = std::move(title);
        if (csv_) return;
        std::cout << "\n== " << group_ << " ==\n"
                  << std::left << std::setw(36) << "case" << std::right
                  << std::setw(10) << "mean" << std::setw(10) << "stddev"
                  << std::setw(10) << "p99" << std::setw(10) << "min" << "  (us)\n";
    }

    template <typename Fn>
    void time(const std::string& name, size_t iterations, Fn&& fn, const std::string& note = "") {
        fn();  // warm caches and lazy allocations
        std::vector<double> us(iterations);
        for (auto& sample : us) {
            auto t0 = Clock::now();
            fn();
            sample = std::chrono::duration<double, std::micro>(Clock::now() - t0).count();
        }
        std::sort(us.begin(), us.end());

        double mean = std::accumulate(us.begin(), us.end(), 0.0) / static_cast<double>(us.size());
        double var = 0.0;
        for (double v : us) var += (v - mean) * (v - mean);
        double stddev = std::sqrt(var / static_cast<double>(us.size()));
        double p99 = us[(us.size() - 1) * 99 / 100];

        ++cases_;
        if (csv_) {
            std::cout << group_ << ',' << name << ',' << std::fixed << std::setprecision(2)
                      << mean << ',' << stddev << ',' << p99 << ',' << us.front() << ','
                      << note << '\n';
            return;
        }
        std::cout << std::left << std::setw(36) << name << std::right
                  << std::fixed << std::setprecision(1)
                  << std::setw(10) << mean << std::setw(10) << stddev
                  << std::setw(10) << p99 << std::setw(10) << us.front()
                  << (note.empty() ? "" : "  " + note) << '\n';
    }

    size_t cases() const { return cases_; }

private:
    bool csv_;
    std::string group_;
    size_t cases_ = 0;
};

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

void bench_graph(Bench& bench) {
    bench.group("Graph Analysis");
    constexpr size_t N = 500;

    for (size_t n : {10, 100, 1000}) {
        Workflow wf("chain", "chain");
        (void)WorkflowGenerator::populate(wf, WorkflowGenerator::linear_chain(n, "noop"));
        bench.time("validate_dag(chain " + std::to_string(n) + ")", N,
            [&]{ auto r = wf.validate_dag(); (void)r; }, std::to_string(n) + " tasks");
        bench.time("plan_waves(chain " + std::to_string(n) + ")", N,
            [&]{ auto w = wf.plan_waves(); (void)w; }, std::to_string(n) + " tasks");
    }

    std::mt19937 rng(1234);
    Workflow random("random", "random");
    (void)WorkflowGenerator::populate(random, WorkflowGenerator::random_dag(200, 0.05f, "noop", rng));
    bench.time("validate_dag(random 200)", N,
        [&]{ auto r = random.validate_dag(); (void)r; }, "200 tasks");
    bench.time("plan_waves(random 200)", N,
        [&]{ auto w = random.plan_waves(); (void)w; }, "200 tasks");
}

void bench_execution(Bench& bench) {
    bench.group("Wave Dispatch");
    constexpr size_t N = 50;

    EngineConfig config;
    config.max_concurrent_tasks = 8;
    Scheduler engine(Scheduler::Options{.config = config});
    engine.register_function("noop", [](const TaskContext&) { return Value{}; });

    size_t seq = 0;
    auto execute_shape = [&](const std::vector<Task>& shape) {
        auto id = "bench-" + std::to_string(seq++);
        auto wf = engine.create_workflow(id, id);
        if (!wf) return;
        if (WorkflowGenerator::populate(**wf, shape)) {
            auto summary = engine.execute_workflow(id);
            (void)summary;
        }
        (void)engine.remove_workflow(id);
    };

    for (size_t n : {10, 100}) {
        auto shape = WorkflowGenerator::independent(n, "noop");
        bench.time("independent(" + std::to_string(n) + ")", N,
            [&]{ execute_shape(shape); }, "1 wave");
    }

    auto chain = WorkflowGenerator::linear_chain(20, "noop");
    bench.time("linear_chain(20)", N,
        [&]{ execute_shape(chain); }, "20 waves");

    auto diamond = WorkflowGenerator::diamond(4, 8, "noop");
    bench.time("diamond(4x8)", N,
        [&]{ execute_shape(diamond); }, "12 waves, 40 tasks");
}

void bench_executor(Bench& bench) {
    bench.group("Executor");
    constexpr size_t N = 500;

    TaskRunner runner;
    TaskFunction noop = [](const TaskContext&) { return Value{}; };
    bench.time("attempt_overhead", N,
        [&]{ auto o = runner.execute(noop, AttemptRequest{.task_id = "b"}); (void)o; });

    FunctionRegistry registry;
    registry.register_function("noop", noop);
    WorkRef named = std::string{"noop"};
    bench.time("resolve_by_name", N,
        [&]{ auto f = resolve_work(named, registry); (void)f; });

    ThreadPool tpool(4);
    bench.time("threadpool_submit", N, [&]{
        tpool.submit([]{}).wait();
    });
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "DAG scheduler benchmarks (" << std::thread::hardware_concurrency()
                  << " hardware threads)\n";
    }

    Bench bench(csv);
    bench_graph(bench);
    bench_execution(bench);
    bench_executor(bench);

    if (!csv) std::cout << "\n" << bench.cases() << " cases\n";
    return 0;
}
