// SPDX-License-Identifier: Apache-2.0
// Part of KeyGate (KG) project.
// apps/kg_probe.cpp

#include "kg/upstream.hpp"
#include "kg/http_response.hpp"
#include "kg/gateway_config.hpp"
#include "kg/log.hpp"
#include "kg/internal/url.hpp"

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <numeric>
#include <iomanip>
#include <csignal>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --url http://127.0.0.1:8000/proxy/models "
      "[--method GET] [--data STRING] [--header 'Name: value']...\n"
      "  [--key API_KEY] [--tls_ca ca.pem] [--insecure 0|1] [--count 1]\n"
      "\n"
      "  --key       sends 'Authorization: Bearer <key>' (for calling the API directly)\n"
      "  --count     sequential requests, one status line each (shows rotation / 429)\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect timeout in seconds (default 5)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 60)\n"
      "\n"
      "Benchmark mode (continuous requests for a fixed duration):\n"
      "  " << argv0 << " ... --bench 1 --duration 3 --concurrency 1\n"
      "    --bench         0|1   enable benchmark mode (default 0)\n"
      "    --duration      int   duration in seconds (default 3)\n"
      "    --concurrency   int   number of worker threads (default 1)\n";
}

struct BenchStats {
    std::atomic<uint64_t> sent{0};
    std::atomic<uint64_t> failed{0};   // transport failures
    std::mutex mtx;
    std::map<int, uint64_t> by_status;
    std::vector<double> lat_ms; // per-response latency in milliseconds

    void add_response(int status, double ms) {
        std::lock_guard<std::mutex> lk(mtx);
        ++by_status[status];
        lat_ms.push_back(ms);
    }
};

// Compute percentile from a sorted vector (0..100).
static double percentile_sorted(const std::vector<double>& v, double p) {
    if (v.empty()) return 0.0;
    if (p <= 0.0) return v.front();
    if (p >= 100.0) return v.back();
    const double idx = (p/100.0) * (static_cast<double>(v.size() - 1));
    const size_t i = static_cast<size_t>(idx);
    const double frac = idx - static_cast<double>(i);
    // Linear interpolation between neighbors
    if (i + 1 < v.size()) return v[i] + (v[i+1] - v[i]) * frac;
    return v[i];
}

static bool to_int(const char* s, int& out) {
    try {
        std::size_t used = 0;
        out = std::stoi(s, &used);
        return s[used] == '\0';
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char** argv){
    kg::UpstreamOptions opt;
    opt.connect_timeout_sec = 5;
    opt.io_timeout_sec      = 60;

    kg::OutboundRequest req;
    req.method = "GET";
    std::string url, key;
    int count = 1;

    // Benchmark options
    bool bench = false;
    int duration_sec = 3;
    int concurrency = 1;

    for(int i=1;i<argc;++i){
        std::string a=argv[i];
        int n = 0;
        if(a=="--url" && i+1<argc) url = argv[++i];
        else if(a=="--method" && i+1<argc) req.method = argv[++i];
        else if(a=="--data" && i+1<argc) req.body = argv[++i];
        else if(a=="--key" && i+1<argc) key = argv[++i];
        else if(a=="--header" && i+1<argc) {
            std::string h = argv[++i];
            std::size_t c = h.find(':');
            if (c == std::string::npos || c == 0) { usage(argv[0]); return 2; }
            std::string v = h.substr(c + 1);
            v.erase(0, v.find_first_not_of(' '));
            req.headers.emplace_back(h.substr(0, c), v);
        }
        else if(a=="--tls_ca" && i+1<argc) opt.tls_ca_file = argv[++i];
        else if(a=="--insecure" && i+1<argc && to_int(argv[++i], n)) opt.tls_verify_peer = (n == 0);
        else if(a=="--count" && i+1<argc && to_int(argv[++i], n)) count = std::max(1, n);
        else if(a=="--bench" && i+1<argc && to_int(argv[++i], n)) bench = (n != 0);
        else if(a=="--duration" && i+1<argc && to_int(argv[++i], n)) duration_sec = std::max(1, n);
        else if(a=="--concurrency" && i+1<argc && to_int(argv[++i], n)) concurrency = std::max(1, n);
        else if(a=="--connect_timeout" && i+1<argc && to_int(argv[++i], n)) opt.connect_timeout_sec = std::max(1, n);
        else if(a=="--io_timeout" && i+1<argc && to_int(argv[++i], n)) opt.io_timeout_sec = std::max(1, n);
        else { usage(argv[0]); return 2; }
    }

    kg::internal::Url u;
    if (url.empty() || !kg::internal::parse_url(url, u)) {
        std::cerr << "Bad --url: expected http(s)://host[:port]/path\n";
        return 2;
    }
    opt.url = url;
    opt.pool_size = concurrency;
    req.target = u.path.empty() ? "/" : u.path;
    if (!u.query.empty()) req.target += "?" + u.query;
    if (!key.empty()) req.headers.emplace_back("Authorization", "Bearer " + key);
    if (!req.body.empty()) req.headers.emplace_back("Content-Type", "application/json");

    std::signal(SIGPIPE, SIG_IGN);
    kg::set_log_console(false);

    std::unique_ptr<kg::HttpUpstream> cli;
    try {
        cli = std::make_unique<kg::HttpUpstream>(opt);
    } catch (const kg::ConfigError& e) {
        std::cerr << "[FATAL] " << e.what() << "\n";
        return 1;
    }

    if (!bench) {
        // Sequential requests; the full response is printed for a single one.
        int failures = 0;
        for (int i = 0; i < count; ++i) {
            kg::HttpResponse resp;
            kg::UpstreamFailure err;
            if (!cli->send(req, resp, err)) {
                std::cerr << "request " << (i + 1) << " failed: " << err.detail << "\n";
                ++failures;
                continue;
            }
            if (count == 1) {
                std::cout<<"HTTP "<<resp.status_code<<" "<<resp.status_text<<"\n";
                for (auto& kv: resp.headers){
                    std::cout<<kv.first<<": "<<kv.second<<"\n";
                }
                std::cout<<"\n"<<resp.body<<"\n";
            } else {
                std::cout << "#" << (i + 1) << " HTTP " << resp.status_code
                          << " " << resp.body.size() << " bytes\n";
            }
        }
        return failures ? 1 : 0;
    }

    // === Benchmark mode ===
    // Workers share one client; its pool hands each a separate connection.
    BenchStats stats;
    std::atomic<bool> stop{false};

    const auto t_start_wall = std::chrono::steady_clock::now();
    const auto t_end_wall   = t_start_wall + std::chrono::seconds(duration_sec);

    auto worker = [&](int /*tid*/){
        for (;;) {
            // check deadline BEFORE starting another request
            if (stop.load(std::memory_order_relaxed)) break;
            const auto now = std::chrono::steady_clock::now();
            if (now >= t_end_wall) break;

            const auto t0 = now;
            kg::HttpResponse resp;
            kg::UpstreamFailure err;
            const bool ok = cli->send(req, resp, err);
            const auto t1 = std::chrono::steady_clock::now();

            stats.sent.fetch_add(1, std::memory_order_relaxed);
            if (ok) {
                const double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
                stats.add_response(resp.status_code, ms);
            } else {
                stats.failed.fetch_add(1, std::memory_order_relaxed);
            }
        }
    };

    // Launch workers
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(concurrency));
    for (int i = 0; i < concurrency; ++i) {
        threads.emplace_back(worker, i);
    }

    // Sleep until deadline, then signal stop and join
    std::this_thread::sleep_until(t_end_wall);
    stop.store(true, std::memory_order_relaxed);
    for (auto& th : threads) th.join();

    const auto t_stop_wall = std::chrono::steady_clock::now();
    const double wall_sec = std::chrono::duration_cast<std::chrono::microseconds>(t_stop_wall - t_start_wall).count() / 1e6;

    // Prepare stats
    std::vector<double> v;
    std::map<int, uint64_t> by_status;
    {
        std::lock_guard<std::mutex> lk(stats.mtx);
        v = std::move(stats.lat_ms);
        by_status = stats.by_status;
    }
    std::sort(v.begin(), v.end());

    const uint64_t sent   = stats.sent.load(std::memory_order_relaxed);
    const uint64_t failed = stats.failed.load(std::memory_order_relaxed);
    const double rps = (wall_sec > 0.0) ? (static_cast<double>(v.size()) / wall_sec) : 0.0;

    double mn = 0.0, mx = 0.0, avg = 0.0;
    if (!v.empty()) {
        mn = v.front();
        mx = v.back();
        const double sum = std::accumulate(v.begin(), v.end(), 0.0);
        avg = sum / static_cast<double>(v.size());
    }

    // Print summary
    std::cout << "=== KG probe results ===\n";
    std::cout << "duration: " << std::fixed << std::setprecision(3) << wall_sec << " s\n";
    std::cout << "concurrency: " << concurrency << "\n";
    std::cout << "sent:     " << sent   << "\n";
    std::cout << "errors:   " << failed << "  (transport)\n";
    for (const auto& kv : by_status) {
        std::cout << "HTTP " << kv.first << ": " << kv.second << "\n";
    }
    std::cout << "RPS:      " << std::fixed << std::setprecision(2) << rps << " resp/s\n";
    std::cout << "latency (ms):\n";
    std::cout << "  min: " << std::fixed << std::setprecision(3) << mn
              << "  avg: " << avg
              << "  p50: " << percentile_sorted(v, 50.0)
              << "  p90: " << percentile_sorted(v, 90.0)
              << "  p95: " << percentile_sorted(v, 95.0)
              << "  p99: " << percentile_sorted(v, 99.0)
              << "  max: " << mx << "\n";

    return 0;
}
