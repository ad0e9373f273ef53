// ============================================================================
// BENCHMARK: COLLECTOR HOT PATH
// ============================================================================
// Recording latency for Collector::incr / append
//
// Scenarios:
// 1. Single writer (baseline)
// 2. Concurrent writers (2, 4, 8 threads)
// 3. Writers racing a mover thread (flush tick contention)
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <iomanip>
#include <algorithm>
#include <numeric>
#include <healthstream/core/metrics/collector.hpp>
#include <healthstream/core/metrics/statistics.hpp>

using namespace HealthStream;

// ============================================================================
// LATENCY STATISTICS
// ============================================================================
struct LatencyStats {
    double min_ns;
    double avg_ns;
    double p50_ns;
    double p99_ns;
    double max_ns;
};

LatencyStats compute_stats(std::vector<uint64_t>& latencies) {
    if (latencies.empty()) {
        return {0, 0, 0, 0, 0};
    }
    std::sort(latencies.begin(), latencies.end());
    uint64_t sum = std::accumulate(latencies.begin(), latencies.end(), 0ULL);
    return {
        static_cast<double>(latencies.front()),
        static_cast<double>(sum) / latencies.size(),
        static_cast<double>(latencies[latencies.size() * 50 / 100]),
        static_cast<double>(latencies[latencies.size() * 99 / 100]),
        static_cast<double>(latencies.back())
    };
}

void print_stats(const std::string& label, const LatencyStats& stats, double ops_per_sec) {
    std::cout << label << std::endl;
    std::cout << "  throughput: " << std::fixed << std::setprecision(0) << ops_per_sec << " ops/s" << std::endl;
    std::cout << std::setprecision(1);
    std::cout << "  min:  " << stats.min_ns << " ns" << std::endl;
    std::cout << "  avg:  " << stats.avg_ns << " ns" << std::endl;
    std::cout << "  p50:  " << stats.p50_ns << " ns" << std::endl;
    std::cout << "  p99:  " << stats.p99_ns << " ns" << std::endl;
    std::cout << "  max:  " << stats.max_ns << " ns" << std::endl;
}

inline uint64_t now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// ============================================================================
// SCENARIOS
// ============================================================================

void bench_writers(int threads, int ops_per_thread, bool with_mover) {
    Collector collector(std::chrono::seconds(60));
    std::vector<std::vector<uint64_t>> per_thread(threads);
    std::atomic<bool> done{false};

    std::thread mover;
    if (with_mover) {
        mover = std::thread([&]() {
            while (!done.load(std::memory_order_acquire)) {
                auto moved = collector.moveWindows(MoveMode::ALL);
                (void)Statistics::aggregateTable(moved);
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        });
    }

    auto start = now_ns();
    std::vector<std::thread> writers;
    for (int t = 0; t < threads; ++t) {
        writers.emplace_back([&, t]() {
            auto& samples = per_thread[t];
            samples.reserve(ops_per_thread);
            for (int i = 0; i < ops_per_thread; ++i) {
                auto t0 = now_ns();
                if (i % 2 == 0) {
                    collector.incr("bench", "requests");
                } else {
                    collector.append("bench", "latency", static_cast<double>(i));
                }
                samples.push_back(now_ns() - t0);
            }
        });
    }
    for (auto& w : writers) w.join();
    auto elapsed = now_ns() - start;

    done.store(true, std::memory_order_release);
    if (mover.joinable()) mover.join();

    std::vector<uint64_t> all;
    for (auto& v : per_thread) all.insert(all.end(), v.begin(), v.end());

    double ops = static_cast<double>(threads) * ops_per_thread;
    auto stats = compute_stats(all);
    std::string label = std::to_string(threads) + " writer(s)" + (with_mover ? " + mover" : "");
    print_stats(label, stats, ops / (static_cast<double>(elapsed) / 1e9));
}

int main() {
    constexpr int OPS = 200000;

    std::cout << "============================================================" << std::endl;
    std::cout << " Collector hot path" << std::endl;
    std::cout << "============================================================" << std::endl;

    bench_writers(1, OPS, false);
    for (int threads : {2, 4, 8}) {
        bench_writers(threads, OPS / threads, false);
    }
    for (int threads : {2, 4, 8}) {
        bench_writers(threads, OPS / threads, true);
    }
    return 0;
}
