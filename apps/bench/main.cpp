#include "wlru/cache.hpp"
#include "wlru/settings.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <random>
#include <thread>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <cxxopts.hpp>

using BenchCache = wlru::WeightedLruCache<std::string, std::vector<std::uint8_t>>;

struct BenchConfig {
    int num_threads = 4;
    int num_ops = 100000;
    std::int64_t capacity = 0;
    int num_keys = 10000;
    int min_weight = 64;
    int max_weight = 4096;
    double get_ratio = 0.8;
};

struct Stats {
    std::atomic<std::uint64_t> num_puts{0};
    std::atomic<std::uint64_t> num_gets{0};
    std::atomic<std::uint64_t> cache_hits{0};
    std::atomic<std::uint64_t> rejected_puts{0};
    std::atomic<double> put_latency_ms{0.0};
    std::atomic<double> get_latency_ms{0.0};
};

// Helper function to atomically add to a std::atomic<double>
// This is required for compilers that don't support fetch_add on double (pre-C++20)
void atomic_add_double(std::atomic<double>& atomic_double, double value) {
    double old_val = atomic_double.load();
    double new_val;
    do {
        new_val = old_val + value;
    } while (!atomic_double.compare_exchange_weak(old_val, new_val));
}

void worker_thread(BenchCache& cache,
                   const BenchConfig& cfg,
                   Stats& stats,
                   const std::vector<std::string>& keys,
                   int thread_id) {
    std::mt19937 rng(thread_id);
    std::uniform_real_distribution<> op_dist(0.0, 1.0);
    std::uniform_int_distribution<std::size_t> key_dist(0, keys.size() - 1);
    std::uniform_int_distribution<int> weight_dist(cfg.min_weight, cfg.max_weight);

    int ops_per_thread = cfg.num_ops / cfg.num_threads;

    for (int i = 0; i < ops_per_thread; ++i) {
        const auto& key = keys[key_dist(rng)];

        if (op_dist(rng) < cfg.get_ratio) {
            // GET operation
            auto start = std::chrono::high_resolution_clock::now();
            auto value = cache.Get(key);
            auto end = std::chrono::high_resolution_clock::now();

            stats.num_gets++;
            if (value) {
                stats.cache_hits++;
            }
            atomic_add_double(stats.get_latency_ms, std::chrono::duration<double, std::milli>(end - start).count());

        } else {
            // PUT operation, weight == payload size
            int weight = weight_dist(rng);
            std::vector<std::uint8_t> payload(static_cast<std::size_t>(weight), static_cast<std::uint8_t>(i));

            auto start = std::chrono::high_resolution_clock::now();
            wlru::PutResult result = cache.Put(key, std::move(payload), weight);
            auto end = std::chrono::high_resolution_clock::now();

            stats.num_puts++;
            if (result != wlru::PutResult::kOk) {
                stats.rejected_puts++;
            }
            atomic_add_double(stats.put_latency_ms, std::chrono::duration<double, std::milli>(end - start).count());
        }
    }
}

int main(int argc, char** argv) {
    cxxopts::Options options("wlru_bench", "Benchmark tool for the weighted LRU cache");
    options.add_options()
        ("t,threads", "Number of worker threads", cxxopts::value<int>()->default_value("4"))
        ("n,ops", "Total number of operations", cxxopts::value<int>()->default_value("100000"))
        ("c,capacity", "Cache capacity in weight units (default: WLRU_CAPACITY or 64 MiB)", cxxopts::value<std::int64_t>()->default_value("0"))
        ("k,keys", "Size of the key space", cxxopts::value<int>()->default_value("10000"))
        ("min-weight", "Min entry weight", cxxopts::value<int>()->default_value("64"))
        ("max-weight", "Max entry weight", cxxopts::value<int>()->default_value("4096"))
        ("g,get-ratio", "Ratio of GET operations (0.0 to 1.0)", cxxopts::value<double>()->default_value("0.8"))
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      std::cout << options.help() << std::endl;
      return 0;
    }

    BenchConfig cfg;
    cfg.num_threads = result["threads"].as<int>();
    cfg.num_ops = result["ops"].as<int>();
    cfg.capacity = result["capacity"].as<std::int64_t>();
    cfg.num_keys = result["keys"].as<int>();
    cfg.min_weight = result["min-weight"].as<int>();
    cfg.max_weight = result["max-weight"].as<int>();
    cfg.get_ratio = result["get-ratio"].as<double>();

    if (cfg.num_threads <= 0 || cfg.num_keys <= 0 || cfg.min_weight <= 0 || cfg.min_weight > cfg.max_weight) {
        std::cerr << "wlru_bench: threads and keys must be positive and 0 < min-weight <= max-weight" << std::endl;
        return 2;
    }

    wlru::Config cache_cfg;
    cache_cfg.capacity = cfg.capacity;
    cache_cfg.expected_entries = static_cast<std::size_t>(cfg.num_keys);
    wlru::ApplyConfigDefaults(cache_cfg);

    std::cout << "--- Benchmark Configuration ---" << std::endl;
    std::cout << "Threads: " << cfg.num_threads << std::endl;
    std::cout << "Total Ops: " << cfg.num_ops << std::endl;
    std::cout << "Capacity: " << cache_cfg.capacity << std::endl;
    std::cout << "Key Space: " << cfg.num_keys << std::endl;
    std::cout << "Weight: [" << cfg.min_weight << ", " << cfg.max_weight << "]" << std::endl;
    std::cout << "GET Ratio: " << cfg.get_ratio << std::endl;
    std::cout << "-----------------------------" << std::endl;

    std::vector<std::string> keys;
    keys.reserve(static_cast<std::size_t>(cfg.num_keys));
    for (int i = 0; i < cfg.num_keys; ++i) {
        keys.push_back("key-" + std::to_string(i));
    }

    std::unique_ptr<BenchCache> cache;
    try {
        cache = std::make_unique<BenchCache>(cache_cfg);
    } catch (const wlru::InvalidCapacity& e) {
        std::cerr << "wlru_bench: " << e.what() << std::endl;
        return 2;
    }

    std::vector<std::thread> threads;
    std::vector<Stats> thread_stats(cfg.num_threads);

    auto start_time = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < cfg.num_threads; ++i) {
        threads.emplace_back(worker_thread, std::ref(*cache), std::cref(cfg), std::ref(thread_stats[i]), std::cref(keys), i);
    }

    for (auto& t : threads) {
        t.join();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double total_duration_s = std::chrono::duration<double>(end_time - start_time).count();

    Stats total_stats;
    for (const auto& s : thread_stats) {
        total_stats.num_gets += s.num_gets.load();
        total_stats.num_puts += s.num_puts.load();
        total_stats.cache_hits += s.cache_hits.load();
        total_stats.rejected_puts += s.rejected_puts.load();
        atomic_add_double(total_stats.get_latency_ms, s.get_latency_ms.load());
        atomic_add_double(total_stats.put_latency_ms, s.put_latency_ms.load());
    }

    const std::uint64_t gets = total_stats.num_gets.load();
    const std::uint64_t puts = total_stats.num_puts.load();
    double hit_rate = (gets > 0) ? (double)total_stats.cache_hits.load() / gets * 100.0 : 0.0;
    double avg_get_latency = (gets > 0) ? total_stats.get_latency_ms.load() / gets : 0.0;
    double avg_put_latency = (puts > 0) ? total_stats.put_latency_ms.load() / puts : 0.0;
    double ops_per_sec = (gets + puts) / total_duration_s;
    wlru::CacheStats cache_stats = cache->Stats();

    std::cout << "----------- Results -----------" << std::endl;
    std::cout << "Total duration: " << total_duration_s << " s" << std::endl;
    std::cout << "Operations per second: " << ops_per_sec << std::endl;
    std::cout << "GET operations: " << gets << std::endl;
    std::cout << "PUT operations: " << puts << " (" << total_stats.rejected_puts.load() << " rejected)" << std::endl;
    std::cout << "Cache hit rate: " << hit_rate << " %" << std::endl;
    std::cout << "Avg. GET latency: " << avg_get_latency << " ms" << std::endl;
    std::cout << "Avg. PUT latency: " << avg_put_latency << " ms" << std::endl;
    std::cout << "Evictions: " << cache_stats.evictions << std::endl;
    std::cout << "Final weight: " << cache->Size() << " / " << cache->Capacity()
              << " over " << cache->Len() << " entries" << std::endl;
    std::cout << "-----------------------------" << std::endl;

    try {
        cache->CheckInvariants();
    } catch (const wlru::InvariantViolation& e) {
        std::cerr << "wlru_bench: invariant violation: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
