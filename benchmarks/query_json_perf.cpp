// -*- mode:c++;indent-tabs-mode:nil;c-basic-offset:4;coding:utf-8 -*-
// vi: set et ft=cpp ts=4 sts=4 sw=4 fenc=utf-8 :vi
//
// Copyright 2024 Mozilla Foundation
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "cli.h"
#include "format.h"
#include "json.h"
#include "jsonpath.h"
#include "query.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <numeric>
#include <string>
#include <unistd.h>
#include <vector>

#ifndef QJ_SOURCE_DIR
#error "QJ_SOURCE_DIR must be defined"
#endif

namespace bench
{

using Clock = std::chrono::high_resolution_clock;

struct Stats
{
    double min_ns;
    double max_ns;
    double mean_ns;
    double median_ns;
    double stddev_ns;
};

struct BenchConfig
{
    std::size_t warmup_runs = 1;
    std::size_t measure_runs = 5;
    double scale = 1.0;
    std::string filter;
    bool list_only = false;
    bool csv = false;
};

struct BenchCase
{
    std::string name;
    std::size_t inner_iterations;
    std::size_t bytes_per_iteration;
    std::function<void()> body;
};

static volatile std::uint64_t g_sink = 0;

template <class T>
inline void DoNotOptimize(const T& value)
{
#if defined(__GNUC__) || defined(__clang__)
    asm volatile("" : : "g"(value) : "memory");
#else
    std::atomic_signal_fence(std::memory_order_acq_rel);
#endif
}

inline void Ensure(bool condition, const std::string& message)
{
    if (!condition) {
        std::fprintf(stderr, "error: %s\n", message.c_str());
        std::exit(1);
    }
}

inline Stats
ComputeStats(std::vector<double> samples)
{
    Ensure(!samples.empty(), "no samples collected");
    Stats stats;
    std::sort(samples.begin(), samples.end());
    stats.min_ns = samples.front();
    stats.max_ns = samples.back();
    stats.mean_ns =
      std::accumulate(samples.begin(), samples.end(), 0.0) / samples.size();
    double variance = 0.0;
    for (double s : samples)
        variance += (s - stats.mean_ns) * (s - stats.mean_ns);
    stats.stddev_ns = std::sqrt(variance / samples.size());
    std::size_t mid = samples.size() / 2;
    stats.median_ns = samples.size() % 2
                        ? samples[mid]
                        : (samples[mid - 1] + samples[mid]) * 0.5;
    return stats;
}

class Runner
{
  public:
    explicit Runner(const BenchConfig& cfg) : config_(cfg)
    {
        if (config_.csv)
            std::printf("benchmark,mean_ns,median_ns,min_ns,max_ns,"
                        "stddev_ns,iterations,throughput_mb_s\n");
    }

    void run(const BenchCase& bench_case)
    {
        if (!config_.filter.empty() &&
            bench_case.name.find(config_.filter) == std::string::npos)
            return;
        if (config_.list_only) {
            std::printf("%s\n", bench_case.name.c_str());
            return;
        }

        double scaled = bench_case.inner_iterations * config_.scale;
        std::size_t inner = scaled < 1.0 ? 1 : static_cast<std::size_t>(scaled);

        for (std::size_t w = 0; w < config_.warmup_runs; ++w)
            for (std::size_t i = 0; i < inner; ++i)
                bench_case.body();

        std::vector<double> samples;
        for (std::size_t run = 0; run < config_.measure_runs; ++run) {
            Clock::time_point start = Clock::now();
            for (std::size_t i = 0; i < inner; ++i)
                bench_case.body();
            Clock::time_point end = Clock::now();
            samples.push_back(
              std::chrono::duration<double, std::nano>(end - start).count() /
              inner);
        }

        Stats stats = ComputeStats(samples);
        double throughput_mb_s = 0.0;
        if (bench_case.bytes_per_iteration > 0 && stats.median_ns > 0.0)
            throughput_mb_s = (bench_case.bytes_per_iteration * 1e3) / stats.median_ns;

        if (config_.csv) {
            std::printf("%s,%.2f,%.2f,%.2f,%.2f,%.2f,%zu,%.2f\n",
                        bench_case.name.c_str(),
                        stats.mean_ns,
                        stats.median_ns,
                        stats.min_ns,
                        stats.max_ns,
                        stats.stddev_ns,
                        inner,
                        throughput_mb_s);
            return;
        }
        std::printf("%-28s %12.2f ns/op  (median %.2f | min %.2f | max %.2f)  "
                    "inner=%-5zu",
                    bench_case.name.c_str(),
                    stats.mean_ns,
                    stats.median_ns,
                    stats.min_ns,
                    stats.max_ns,
                    inner);
        if (throughput_mb_s > 0.0)
            std::printf("  throughput=%.2f MB/s", throughput_mb_s);
        std::printf("\n");
    }

  private:
    BenchConfig config_;
};

inline bool
HasPrefix(const std::string& s, const std::string& prefix)
{
    return s.compare(0, prefix.size(), prefix) == 0;
}

inline BenchConfig
ParseArgs(int argc, char** argv)
{
    BenchConfig config;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            std::printf("query_json_perf options:\n");
            std::printf("  --warmup N       Number of warmup runs (default 1)\n");
            std::printf("  --runs N         Number of measured runs (default 5)\n");
            std::printf("  --scale X        Scale inner iteration counts by X\n");
            std::printf("  --filter STR     Only run benchmarks containing STR\n");
            std::printf("  --list           List benchmark names\n");
            std::printf("  --csv            Print results as CSV\n");
            std::exit(0);
        } else if (HasPrefix(arg, "--warmup=")) {
            config.warmup_runs = std::strtoul(arg.c_str() + 9, NULL, 10);
        } else if (HasPrefix(arg, "--runs=")) {
            config.measure_runs = std::strtoul(arg.c_str() + 7, NULL, 10);
        } else if (HasPrefix(arg, "--scale=")) {
            config.scale = std::atof(arg.c_str() + 8);
        } else if (HasPrefix(arg, "--filter=")) {
            config.filter = arg.substr(9);
        } else if (arg == "--warmup") {
            Ensure(i + 1 < argc, "--warmup requires an argument");
            config.warmup_runs = std::strtoul(argv[++i], NULL, 10);
        } else if (arg == "--runs") {
            Ensure(i + 1 < argc, "--runs requires an argument");
            config.measure_runs = std::strtoul(argv[++i], NULL, 10);
        } else if (arg == "--scale") {
            Ensure(i + 1 < argc, "--scale requires an argument");
            config.scale = std::atof(argv[++i]);
        } else if (arg == "--filter") {
            Ensure(i + 1 < argc, "--filter requires an argument");
            config.filter = argv[++i];
        } else if (arg == "--list") {
            config.list_only = true;
        } else if (arg == "--csv") {
            config.csv = true;
        } else {
            Ensure(false, std::string("unknown argument: ") + arg);
        }
    }
    if (config.measure_runs == 0)
        config.measure_runs = 1;
    return config;
}

} // namespace bench

// Same shape as the document the `perf` make target used to generate.
static std::string
GenerateUsers(int count)
{
    std::string s = "{\"users\": [";
    char buf[160];
    for (int i = 0; i < count; ++i) {
        snprintf(buf,
                 sizeof(buf),
                 "%s{\"name\": \"User%d\", \"age\": %d, "
                 "\"email\": \"user%d@example.com\"}",
                 i ? ", " : "",
                 i,
                 20 + i % 40,
                 i);
        s += buf;
    }
    s += "]}";
    return s;
}

static std::string
WriteTempFile(const std::string& content)
{
    char path[] = "/tmp/query_json_perf.XXXXXX";
    int fd = mkstemp(path);
    bench::Ensure(fd != -1, "mkstemp failed");
    ssize_t rc = write(fd, content.data(), content.size());
    close(fd);
    bench::Ensure(rc == static_cast<ssize_t>(content.size()), "short write");
    return path;
}

int
main(int argc, char* argv[])
{
    using namespace bench;
    using qj::Json;

    BenchConfig config = ParseArgs(argc, argv);

    const std::string example_path =
      std::string(QJ_SOURCE_DIR) + "/examples/test.json";
    const std::string users_text = GenerateUsers(10000);
    const std::string users_path = WriteTempFile(users_text);

    const Json example = qj::loadDocument(example_path);
    const Json users = qj::loadDocument(users_path);
    const Json names =
      qj::normalizeResults(qj::evaluateQuery("$.users[*].name", users));
    const qj::JsonPath older = qj::JsonPath::parse("$.users[?(@.age > 30)]");

    FILE* devnull = fopen("/dev/null", "w");
    Ensure(devnull != NULL, "unable to open /dev/null");

    std::vector<BenchCase> cases;

    cases.push_back({ "load.example", 2000, 0, [&]() {
                          Json doc = qj::loadDocument(example_path);
                          g_sink += doc.isObject();
                      } });

    cases.push_back({ "parse.users_10k", 5, users_text.size(), [&]() {
                          std::pair<Json::Status, Json> parsed = Json::parse(users_text);
                          Ensure(parsed.first == Json::success, "parse.users_10k failed");
                          g_sink += parsed.second.isObject();
                      } });

    cases.push_back({ "compile.filter", 20000, 0, [&]() {
                          qj::JsonPath path = qj::JsonPath::parse(
                            "$.store.book[?(@.price < 10 && @.author =~ /^N/i)].title");
                          DoNotOptimize(path);
                      } });

    cases.push_back({ "query.example_name", 20000, 0, [&]() {
                          std::vector<const Json*> r =
                            qj::evaluateQuery("$.users[0].name", example);
                          Ensure(r.size() == 1, "query.example_name unexpected result size");
                          g_sink += r.size();
                      } });

    cases.push_back({ "query.users_names", 20, 0, [&]() {
                          std::vector<const Json*> r =
                            qj::evaluateQuery("$.users[*].name", users);
                          Ensure(r.size() == 10000, "query.users_names unexpected result size");
                          g_sink += r.size();
                      } });

    cases.push_back({ "query.users_filter_age", 20, 0, [&]() {
                          std::vector<const Json*> r = older.evaluate(users);
                          Ensure(r.size() == 7250, "query.users_filter_age unexpected result size");
                          g_sink += r.size();
                      } });

    cases.push_back({ "query.users_recursive", 10, 0, [&]() {
                          std::vector<const Json*> r =
                            qj::evaluateQuery("$..email", users);
                          Ensure(r.size() == 10000, "query.users_recursive unexpected result size");
                          g_sink += r.size();
                      } });

    cases.push_back({ "format.users_pretty", 5, 0, [&]() {
                          std::string out = qj::formatResult(users, true, false);
                          DoNotOptimize(out);
                          g_sink += out.size();
                      } });

    cases.push_back({ "format.names_raw", 50, 0, [&]() {
                          std::string out = qj::formatResult(names, true, true);
                          DoNotOptimize(out);
                          g_sink += out.size();
                      } });

    cases.push_back({ "cli.users_filter_age", 2, users_text.size(), [&]() {
                          std::string a0 = "query_json";
                          std::string a1 = "--query";
                          std::string a2 = "$.users[?(@.age > 30)]";
                          std::string a3 = users_path;
                          char* args[] = { &a0[0], &a1[0], &a2[0], &a3[0], NULL };
                          int rc = qj::runQueryJson(4, args, devnull, stderr);
                          Ensure(rc == 0, "cli.users_filter_age failed");
                      } });

    Runner runner(config);
    if (!config.list_only && !config.csv)
        std::printf("query_json_perf: warmup=%zu runs=%zu scale=%.2f\n",
                    config.warmup_runs,
                    config.measure_runs,
                    config.scale);
    for (std::size_t i = 0; i < cases.size(); ++i)
        runner.run(cases[i]);
    if (!config.list_only && !config.csv)
        std::printf("sink=%llu\n", static_cast<unsigned long long>(g_sink));

    fclose(devnull);
    unlink(users_path.c_str());
    return 0;
}
