/**
 * @file benchmark_prediction.cpp
 * @brief SnapFetch hot-path latency benchmark
 *
 * Measures the operations that run on every host event: recording an
 * access, generating predictions for a route, a scheduler tick, and a
 * snapshot encode for persistence.
 *
 * Usage:
 *   benchmark_prediction [--iterations N] [--patterns N] [--routes N]
 */

#include "snapfetch/memory_cache_store.h"
#include "snapfetch/memory_durable_store.h"
#include "snapfetch/pattern_persistence.h"
#include "snapfetch/prefetch_engine.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <optional>
#include <string>
#include <vector>

using namespace snapfetch;
using namespace std::chrono;
using json = nlohmann::json;

// ============================================================================
// Benchmark Results
// ============================================================================

struct BenchmarkResult {
    std::string test_name;
    int iterations;
    double min_ms;
    double max_ms;
    double mean_ms;
    double median_ms;
    double stddev_ms;
    double p95_ms;
    double p99_ms;
    bool passed;  // <1ms target
};

// ============================================================================
// Statistics Helpers
// ============================================================================

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double calculate_median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t n = values.size();
    if (n % 2 == 0) {
        return (values[n/2 - 1] + values[n/2]) / 2.0;
    }
    return values[n/2];
}

double calculate_stddev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) return 0.0;
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / (values.size() - 1));
}

double calculate_percentile(std::vector<double> values, double percentile) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t index = static_cast<size_t>(percentile / 100.0 * (values.size() - 1));
    return values[index];
}

BenchmarkResult summarize(const std::string& name, const std::vector<double>& times_ms) {
    BenchmarkResult result;
    result.test_name = name;
    result.iterations = static_cast<int>(times_ms.size());
    result.min_ms = times_ms.empty() ? 0.0 : *std::min_element(times_ms.begin(), times_ms.end());
    result.max_ms = times_ms.empty() ? 0.0 : *std::max_element(times_ms.begin(), times_ms.end());
    result.mean_ms = calculate_mean(times_ms);
    result.median_ms = calculate_median(times_ms);
    result.stddev_ms = calculate_stddev(times_ms, result.mean_ms);
    result.p95_ms = calculate_percentile(times_ms, 95.0);
    result.p99_ms = calculate_percentile(times_ms, 99.0);
    result.passed = result.p99_ms < 1.0;
    return result;
}

template <typename Fn>
double time_ms(Fn&& fn) {
    auto start = high_resolution_clock::now();
    fn();
    auto end = high_resolution_clock::now();
    return duration<double, std::milli>(end - start).count();
}

// ============================================================================
// Fixtures
// ============================================================================

// Runs jobs on the ticking thread so tick latency includes the fetch
class InlineExecutor : public ITaskExecutor {
public:
    void submit(std::function<void()> task) override { task(); }
};

class SyntheticFetcher : public IDataFetcher {
public:
    std::optional<json> fetch(const DataRequirement& requirement) override {
        return json::array({json{{"id", requirement.identifier}, {"category", requirement.category}}});
    }
};

struct BenchEnvironment {
    PrefetchConfig config;
    MemoryCacheStore cache{SystemClock::instance()};
    SyntheticFetcher fetcher;
    MemoryDurableStore durable;
    InlineExecutor executor;
    PrefetchEngine engine;

    explicit BenchEnvironment(const PrefetchConfig& cfg)
        : config(cfg)
        , engine(config, cache, fetcher, durable, SystemClock::instance(), &executor)
    {
        engine.initialize();
    }
};

PrefetchConfig bench_config() {
    PrefetchConfig config;
    config.persist_patterns = false;
    config.min_confidence_score = 0.1;
    config.max_concurrent_prefetch = 8;
    return config;
}

// Routes /r0 .. /rN, each visited often enough to predict the next one
void seed_routes(PrefetchEngine& engine, int routes) {
    for (int i = 0; i < routes; ++i) {
        std::string from = "/r" + std::to_string(i);
        for (int k = 1; k <= 3; ++k) {
            std::string to = "/r" + std::to_string((i + k) % routes);
            for (int n = 0; n < 4; ++n) {
                engine.tracker().record_route_transition(from, to, 1000);
            }
        }
    }
}

// Patterns read in small bursts so related counts build up
void seed_patterns(PrefetchEngine& engine, int patterns) {
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < patterns; ++i) {
            engine.tracker().record_data_access("products", "p" + std::to_string(i));
        }
    }
}

// ============================================================================
// Benchmark Functions
// ============================================================================

BenchmarkResult benchmark_record_access(int patterns, int iterations) {
    BenchEnvironment env(bench_config());
    seed_patterns(env.engine, patterns);

    std::vector<double> times_ms;
    times_ms.reserve(iterations);
    for (int i = 0; i < iterations; i++) {
        DataAccessEvent event;
        event.category = "products";
        event.identifier = "p" + std::to_string(i % patterns);
        times_ms.push_back(time_ms([&]() { env.engine.on_data_access(event); }));
    }

    return summarize("record_access_" + std::to_string(patterns) + "_patterns", times_ms);
}

BenchmarkResult benchmark_generate_predictions(int routes, int patterns, int iterations) {
    BenchEnvironment env(bench_config());
    seed_routes(env.engine, routes);
    seed_patterns(env.engine, patterns);

    // Warm up
    env.engine.predictions_for("/r0");

    std::vector<double> times_ms;
    times_ms.reserve(iterations);
    size_t produced = 0;
    for (int i = 0; i < iterations; i++) {
        std::string route = "/r" + std::to_string(i % routes);
        times_ms.push_back(time_ms([&]() { produced += env.engine.predictions_for(route).size(); }));
    }

    std::cout << "  (" << produced / std::max(iterations, 1) << " candidates per call)\n";
    return summarize("generate_predictions_" + std::to_string(routes) + "_routes", times_ms);
}

BenchmarkResult benchmark_route_change(int routes, int iterations) {
    BenchEnvironment env(bench_config());
    seed_routes(env.engine, routes);

    std::vector<double> times_ms;
    times_ms.reserve(iterations);
    for (int i = 0; i < iterations; i++) {
        RouteChangeEvent event;
        event.from_route = "/r" + std::to_string(i % routes);
        event.to_route = "/r" + std::to_string((i + 1) % routes);
        event.time_spent_ms = 500;

        times_ms.push_back(time_ms([&]() {
            env.engine.on_route_change(event);
            env.engine.process_tick();
        }));
    }

    return summarize("route_change_and_tick", times_ms);
}

BenchmarkResult benchmark_snapshot_encode(int patterns, int iterations) {
    BenchEnvironment env(bench_config());
    seed_routes(env.engine, 20);
    seed_patterns(env.engine, patterns);

    std::vector<double> times_ms;
    times_ms.reserve(iterations);
    size_t bytes = 0;
    for (int i = 0; i < iterations; i++) {
        times_ms.push_back(time_ms([&]() {
            bytes = PatternPersistence::encode(env.engine.tracker().snapshot(), i).dump().size();
        }));
    }

    std::cout << "  (" << bytes << " bytes per snapshot)\n";
    BenchmarkResult result = summarize("snapshot_encode_" + std::to_string(patterns) + "_patterns", times_ms);
    result.passed = result.p99_ms < 10.0;  // persistence runs off the hot path
    return result;
}

// ============================================================================
// Report Printing
// ============================================================================

void print_result(const BenchmarkResult& result) {
    std::cout << "\n";
    std::cout << "+--------------------------------------------------------------+\n";
    std::cout << "| " << std::left << std::setw(60) << result.test_name << " |\n";
    std::cout << "+--------------------------------------------------------------+\n";
    std::cout << "| Iterations: " << std::setw(48) << result.iterations << " |\n";
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "| Min:    " << std::setw(10) << result.min_ms << " ms" << std::setw(39) << " " << " |\n";
    std::cout << "| Mean:   " << std::setw(10) << result.mean_ms << " ms" << std::setw(39) << " " << " |\n";
    std::cout << "| Median: " << std::setw(10) << result.median_ms << " ms" << std::setw(39) << " " << " |\n";
    std::cout << "| StdDev: " << std::setw(10) << result.stddev_ms << " ms" << std::setw(39) << " " << " |\n";
    std::cout << "| P95:    " << std::setw(10) << result.p95_ms << " ms" << std::setw(39) << " " << " |\n";
    std::cout << "| P99:    " << std::setw(10) << result.p99_ms << " ms" << std::setw(39) << " " << " |\n";
    std::cout << "| Max:    " << std::setw(10) << result.max_ms << " ms" << std::setw(39) << " " << " |\n";
    std::cout << "| Status: " << std::setw(52) << (result.passed ? "PASSED" : "FAILED") << " |\n";
    std::cout << "+--------------------------------------------------------------+\n";
}

void print_summary_json(const std::vector<BenchmarkResult>& results) {
    json summary;
    summary["name"] = "SnapFetch hot-path latency";
    summary["results"] = json::array();

    int passed = 0;
    for (const auto& r : results) {
        summary["results"].push_back({
            {"test_name", r.test_name},
            {"iterations", r.iterations},
            {"min_ms", r.min_ms},
            {"mean_ms", r.mean_ms},
            {"median_ms", r.median_ms},
            {"p95_ms", r.p95_ms},
            {"p99_ms", r.p99_ms},
            {"passed", r.passed}
        });
        if (r.passed) passed++;
    }
    summary["total_passed"] = passed;
    summary["total_failed"] = static_cast<int>(results.size()) - passed;

    std::cout << "\n# Benchmark Summary\n" << summary.dump(2) << "\n";
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::cout << "SnapFetch Prediction Benchmark Suite\n\n";

    int iterations = 1000;
    int patterns = 200;
    int routes = 50;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--iterations" && i + 1 < argc) {
                iterations = std::stoi(argv[++i]);
            } else if (arg == "--patterns" && i + 1 < argc) {
                patterns = std::stoi(argv[++i]);
            } else if (arg == "--routes" && i + 1 < argc) {
                routes = std::stoi(argv[++i]);
            } else if (arg == "--help") {
                std::cout << "Usage: benchmark_prediction [options]\n";
                std::cout << "Options:\n";
                std::cout << "  --iterations N     Iterations per test (default: 1000)\n";
                std::cout << "  --patterns N       Distinct access patterns (default: 200)\n";
                std::cout << "  --routes N         Distinct routes (default: 50)\n";
                std::cout << "  --help             Show this help\n";
                return 0;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            return 1;
        }
    }

    if (iterations < 1 || patterns < 1 || routes < 2) {
        std::cerr << "Need at least 1 iteration, 1 pattern and 2 routes.\n";
        return 1;
    }

    std::cout << "Configuration:\n";
    std::cout << "  Iterations: " << iterations << "\n";
    std::cout << "  Patterns:   " << patterns << "\n";
    std::cout << "  Routes:     " << routes << "\n\n";

    std::vector<BenchmarkResult> results;

    std::cout << "Running: Record Access...\n";
    results.push_back(benchmark_record_access(patterns, iterations));
    print_result(results.back());

    std::cout << "Running: Generate Predictions...\n";
    results.push_back(benchmark_generate_predictions(routes, patterns, iterations));
    print_result(results.back());

    std::cout << "Running: Route Change + Tick...\n";
    results.push_back(benchmark_route_change(routes, iterations));
    print_result(results.back());

    std::cout << "Running: Snapshot Encode...\n";
    results.push_back(benchmark_snapshot_encode(patterns, std::max(iterations / 10, 1)));
    print_result(results.back());

    print_summary_json(results);

    bool all_passed = std::all_of(results.begin(), results.end(),
        [](const BenchmarkResult& r) { return r.passed; });
    std::cout << "\n" << (all_passed ? "BENCHMARK PASSED" : "BENCHMARK FAILED: SOME TESTS EXCEEDED TARGET") << "\n";

    return all_passed ? 0 : 1;
}
